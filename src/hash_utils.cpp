#include "hash_utils.hpp"
#include "error.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace bitcli {

std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> hash;
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash.data(), &sha256);
    return hash;
}

// Transaction ids and every intermediate hash of the BIP143 digest
std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(std::span<const uint8_t>(first_hash.data(), first_hash.size()));
}

std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> HashUtils::ripemd160(std::span<const uint8_t> data) {
    std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> hash;
    RIPEMD160_CTX ripemd160;
    RIPEMD160_Init(&ripemd160);
    RIPEMD160_Update(&ripemd160, data.data(), data.size());
    RIPEMD160_Final(hash.data(), &ripemd160);
    return hash;
}

// The 20-byte witness program of a P2WPKH output is the HASH160 of the
// compressed public key.
std::array<uint8_t, RIPEMD160_DIGEST_LENGTH> HashUtils::hash160(std::span<const uint8_t> data) {
    auto sha256_result = sha256(data);
    return ripemd160(std::span<const uint8_t>(sha256_result.data(), sha256_result.size()));
}

// BIP32 uses HMAC-SHA512 both for the master key ("Bitcoin seed" as key) and for
// every child derivation (parent chain code as key).
std::array<uint8_t, SHA512_DIGEST_LENGTH> HashUtils::hmac_sha512(std::span<const uint8_t> key,
                                                                 std::span<const uint8_t> data) {
    std::array<uint8_t, SHA512_DIGEST_LENGTH> mac;
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha512(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), mac.data(), &mac_len) ||
        mac_len != SHA512_DIGEST_LENGTH) {
        throw WalletError(WalletError::ErrorType::KeyDerivationError, "HMAC-SHA512 failed");
    }
    return mac;
}

// BIP39 turns a mnemonic sentence into a 64-byte seed with 2048 iterations
// and the salt "mnemonic" + passphrase.
std::array<uint8_t, SHA512_DIGEST_LENGTH> HashUtils::pbkdf2_hmac_sha512(std::string_view password,
                                                                        std::string_view salt,
                                                                        uint32_t iterations) {
    std::array<uint8_t, SHA512_DIGEST_LENGTH> out;
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(out.size()), out.data()) != 1) {
        throw WalletError(WalletError::ErrorType::KeyDerivationError, "PBKDF2-HMAC-SHA512 failed");
    }
    return out;
}

} // namespace bitcli
