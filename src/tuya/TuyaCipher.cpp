#include "plugctl/tuya/TuyaCipher.hpp"

#include <mbedtls/aes.h>

#include <cstddef>
#include <utility>

namespace plugctl::tuya {

using plugctl::schema::DecodeError;

namespace {

constexpr std::size_t kBlock = config::TUYA_AES_BLOCK_SIZE;

// Owns an mbedtls context for the duration of one call.
class AesContext {
public:
    AesContext() { mbedtls_aes_init(&ctx); }
    ~AesContext() { mbedtls_aes_free(&ctx); }

    AesContext(const AesContext&) = delete;
    AesContext& operator=(const AesContext&) = delete;

    mbedtls_aes_context* get() { return &ctx; }

private:
    mbedtls_aes_context ctx;
};

const unsigned char* keyBytes(const std::string& key) {
    return reinterpret_cast<const unsigned char*>(key.data());
}

} // namespace

TuyaCipher::TuyaCipher(std::string localKey)
: key(std::move(localKey)) {}

expected<std::vector<std::uint8_t>, DecodeError>
TuyaCipher::encrypt(std::string_view plaintext) const {
    if (!valid()) {
        return unexpected(DecodeError{"key", "local key must be 16 characters"});
    }

    AesContext aes;
    if (mbedtls_aes_setkey_enc(aes.get(), keyBytes(key), 128) != 0) {
        return unexpected(DecodeError{"key", "rejected by AES key schedule"});
    }

    const std::size_t padding = kBlock - (plaintext.size() % kBlock);
    std::vector<std::uint8_t> padded(plaintext.begin(), plaintext.end());
    padded.insert(padded.end(), padding, static_cast<std::uint8_t>(padding));

    std::vector<std::uint8_t> out(padded.size());
    for (std::size_t offset = 0; offset < padded.size(); offset += kBlock) {
        if (mbedtls_aes_crypt_ecb(aes.get(), MBEDTLS_AES_ENCRYPT,
                                  padded.data() + offset, out.data() + offset) != 0) {
            return unexpected(DecodeError{"payload", "AES encryption failed"});
        }
    }
    return out;
}

expected<std::string, DecodeError>
TuyaCipher::decrypt(schema::ByteView ciphertext) const {
    if (!valid()) {
        return unexpected(DecodeError{"key", "local key must be 16 characters"});
    }
    if (ciphertext.size() == 0 || ciphertext.size() % kBlock != 0) {
        return unexpected(DecodeError{"payload", "not a whole number of AES blocks"});
    }

    AesContext aes;
    if (mbedtls_aes_setkey_dec(aes.get(), keyBytes(key), 128) != 0) {
        return unexpected(DecodeError{"key", "rejected by AES key schedule"});
    }

    std::vector<std::uint8_t> plain(ciphertext.size());
    for (std::size_t offset = 0; offset < ciphertext.size(); offset += kBlock) {
        if (mbedtls_aes_crypt_ecb(aes.get(), MBEDTLS_AES_DECRYPT,
                                  ciphertext.data() + offset, plain.data() + offset) != 0) {
            return unexpected(DecodeError{"payload", "AES decryption failed"});
        }
    }

    const std::size_t padding = plain.back();
    if (padding == 0 || padding > kBlock) {
        return unexpected(DecodeError{"payload", "bad padding"});
    }
    for (std::size_t i = plain.size() - padding; i < plain.size(); ++i) {
        if (plain[i] != padding) {
            return unexpected(DecodeError{"payload", "bad padding"});
        }
    }

    return std::string(plain.begin(), plain.end() - static_cast<std::ptrdiff_t>(padding));
}

} // namespace plugctl::tuya
