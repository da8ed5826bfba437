#pragma once

#include "plugctl/core/DeviceIdentity.hpp"
#include "plugctl/core/Expected.hpp"
#include "plugctl/device/OutletTransport.hpp"
#include "plugctl/net/TcpClient.hpp"
#include "plugctl/tuya/TuyaCipher.hpp"
#include "plugctl/tuya/TuyaConfig.hpp"
#include "plugctl/tuya/TuyaFrame.hpp"
#include "plugctl/tuya/TuyaProtocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace plugctl::tuya {

struct TuyaSettings {
    std::string deviceId;
    std::string address;
    std::string localKey;
    std::string version = config::TUYA_PROTOCOL_VERSION;
    unsigned short port = config::TUYA_PORT_DEFAULT;
    int socketRetryLimit = config::TUYA_SOCKET_RETRY_LIMIT;
    std::chrono::milliseconds socketTimeout = config::TUYA_SOCKET_TIMEOUT;
    std::chrono::milliseconds retryBackoff = config::TUYA_RETRY_BACKOFF;
};

/**
 * @brief `OutletTransport` speaking Tuya local protocol 3.3 over TCP.
 *
 * Construction does no I/O; the first call resolves the address and connects.
 * Each call makes up to `socketRetryLimit` attempts. An attempt is one
 * connect (if needed), one request write and one reply read, each bounded by
 * `socketTimeout`; a failed attempt closes the socket before the next one.
 * The connection is kept open between calls on the same instance.
 *
 * Errors are returned as records built by `protocol::errorRecord`.
 */
class TuyaOutletTransport : public device::OutletTransport {
public:
    explicit TuyaOutletTransport(TuyaSettings settings);
    ~TuyaOutletTransport() override;

    TuyaOutletTransport(const TuyaOutletTransport&) = delete;
    TuyaOutletTransport& operator=(const TuyaOutletTransport&) = delete;

    device::TransportRecord status() override;
    device::TransportRecord setStatus(bool on, int switchIndex = config::TUYA_PRIMARY_SWITCH) override;

    const TuyaSettings& settings() const { return settings_; }

    /// Set once a device has answered a plain query with the device22 marker.
    bool usesDevice22Queries() const { return device22; }

private:
    using ErrorCode = protocol::ErrorCode;

    device::TransportRecord exchange(Command command, const nlohmann::json& body);
    expected<void, ErrorCode> ensureConnected();
    expected<Frame, ErrorCode> receiveFrame();
    expected<Frame, ErrorCode> awaitReply(Command command);
    device::TransportRecord interpret(const Frame& reply);

    static bool answers(Command request, std::uint32_t replyCommand);

    TuyaSettings settings_;
    TuyaCipher cipher;
    net::TcpClient tcpClient;
    std::uint32_t nextSeqno = 1;
    bool device22 = false;
};

/// Transport for `identity` with the protocol defaults (3.3, 4 attempts, 4 s).
std::unique_ptr<device::OutletTransport> makeTuyaTransport(const core::DeviceIdentity& identity);

} // namespace plugctl::tuya
