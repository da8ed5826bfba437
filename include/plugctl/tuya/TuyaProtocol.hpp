// TuyaProtocol.hpp
// -----------------------------------------------------------------------------
// Message-level helpers for protocol 3.3: JSON request bodies, payload
// encryption with the optional version header, and the numbered error records
// that transports return instead of throwing.

#pragma once

#include "plugctl/core/Expected.hpp"
#include "plugctl/device/OutletTransport.hpp"
#include "plugctl/tuya/TuyaCipher.hpp"
#include "plugctl/tuya/TuyaFrame.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace plugctl::tuya::protocol {

enum class ErrorCode : int {
    InvalidJson   = 900,
    Connect       = 901,
    Timeout       = 902,
    Range         = 903,
    Payload       = 904,
    Offline       = 905,
    State         = 906,
    Function      = 907,
    DeviceType    = 908,
    KeyOrVersion  = 914
};

const char* describe(ErrorCode code);

/// {"Error": <message>, "Err": "<code>", "Payload": <payload or null>}
device::TransportRecord errorRecord(ErrorCode code, std::string_view payload = {});

/// Plaintext some 3.3 firmwares send instead of status ("device22" variant).
constexpr std::string_view DEVICE22_MARKER = "data unvalid";

/// Seconds since the epoch as a decimal string, the form devices expect in "t".
std::string timestamp();

nlohmann::json dpQueryBody(const std::string& deviceId);
nlohmann::json controlBody(const std::string& deviceId, const nlohmann::json& dps);

/// True for commands whose payload carries the "3.3" + 12 zero byte header.
bool needsVersionHeader(Command command);

/// Encrypt `body` for `command`, prefixing the version header where required.
expected<std::vector<std::uint8_t>, schema::DecodeError>
sealPayload(Command command, const nlohmann::json& body,
            const TuyaCipher& cipher, std::string_view version);

/**
 * @brief Recover the text of a device payload.
 *
 * Strips a leading version header, passes plaintext JSON through unchanged
 * and decrypts everything else. An empty payload yields an empty string.
 */
expected<std::string, schema::DecodeError>
openPayload(plugctl::schema::ByteView payload,
            const TuyaCipher& cipher, std::string_view version);

} // namespace plugctl::tuya::protocol
