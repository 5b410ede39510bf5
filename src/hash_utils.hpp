#pragma once

#include <array>
#include <vector>
#include <span>
#include <string_view>
#include <cstdint>
#include <openssl/sha.h>
#include <openssl/ripemd.h>

namespace bitcli {

// Digests and key stretching over OpenSSL. All functions are stateless.
class HashUtils {
public:
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> sha256(std::span<const uint8_t> data);

    // SHA256(SHA256(data))
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> double_sha256(std::span<const uint8_t> data);

    static std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> ripemd160(std::span<const uint8_t> data);

    // RIPEMD160(SHA256(data)), the 20-byte key hash in P2WPKH scripts
    static std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> hash160(std::span<const uint8_t> data);

    // Throws WalletError(KeyDerivationError) if OpenSSL fails
    static std::array<uint8_t, SHA512_DIGEST_LENGTH> hmac_sha512(std::span<const uint8_t> key,
                                                                 std::span<const uint8_t> data);

    // 64-byte PBKDF2-HMAC-SHA512 output; throws WalletError(KeyDerivationError)
    static std::array<uint8_t, SHA512_DIGEST_LENGTH> pbkdf2_hmac_sha512(std::string_view password,
                                                                        std::string_view salt,
                                                                        uint32_t iterations);

private:
    HashUtils() = delete;
};

} // namespace bitcli
