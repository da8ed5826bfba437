#pragma once

#include "plugctl/core/Expected.hpp"
#include "plugctl/schema/plugctl_schema.hpp"
#include "plugctl/tuya/TuyaConfig.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace plugctl::tuya {

/**
 * @brief AES-128-ECB with PKCS#7 padding, keyed by the device's local key.
 *
 * Protocol 3.3 encrypts every JSON payload this way. The local key is used
 * as raw ASCII bytes and must be exactly 16 characters; any other length
 * leaves the cipher invalid and every call fails.
 */
class TuyaCipher {
public:
    explicit TuyaCipher(std::string localKey);

    bool valid() const { return key.size() == config::TUYA_LOCAL_KEY_SIZE; }

    expected<std::vector<std::uint8_t>, schema::DecodeError>
    encrypt(std::string_view plaintext) const;

    /// Fails on a length that is not a whole number of blocks or on bad padding,
    /// which is what a wrong key usually produces.
    expected<std::string, schema::DecodeError>
    decrypt(schema::ByteView ciphertext) const;

private:
    std::string key;
};

} // namespace plugctl::tuya
