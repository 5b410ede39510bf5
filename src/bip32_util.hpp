#pragma once

#include <vector>
#include <span>
#include <cstdint>
#include <array>
#include <string>
#include "error.hpp"

namespace bitcli {

// Extended private key used in BIP32 hierarchical deterministic derivation
struct ExKey {
    uint8_t depth = 0;                   // Depth in the derivation path (0 for master keys)
    uint32_t child_number = 0;           // Index of the key in relation to its parent
    std::array<uint8_t, 32> chaincode{}; // Extra entropy used in child key derivation
    std::array<uint8_t, 32> key{};       // The private key scalar (big-endian)
};

// Utility class for secp256k1 key handling and BIP32 private derivation
class Bip32Util {
public:
    static constexpr uint32_t HARDENED = 0x80000000;

    // True if key is 32 bytes and 0 < key < n (the secp256k1 group order)
    static bool is_valid_private_key(std::span<const uint8_t> key);

    // Derives a compressed public key from a private key using elliptic curve multiplication
    static std::vector<uint8_t> derive_public_key_from_private(std::span<const uint8_t> key);

    // Builds the master extended key from a BIP39 seed
    static ExKey master_from_seed(std::span<const uint8_t> seed);

    // Derives a child private key from a parent private key using BIP32 derivation
    static ExKey derive_priv_child(const ExKey& parent, uint32_t child_num);

    // Derives a key at a specific BIP32 derivation path from a parent key
    static ExKey get_child_key_at_path(const ExKey& key, const std::string& derivation_path);

private:
    Bip32Util() = delete;
};

} // namespace bitcli
