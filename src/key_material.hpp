#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include "network.hpp"
#include "secure_memory.hpp"

namespace bitcli {

// The wallet's single key: private key, compressed public key, P2WPKH
// script and its bech32 address on one network.
//
// Immutable once constructed. Not copyable; the private key lives in locked
// memory that is wiped when the object is destroyed.
class KeyMaterial {
public:
    // Throws WalletError(KeyDerivationError) if the key is not a valid secp256k1 scalar
    KeyMaterial(std::span<const uint8_t> private_key, Network network);

    // Derives the key at m/84'/0'/0'/0/0 from a BIP39 mnemonic phrase
    static KeyMaterial from_mnemonic(const std::string& mnemonic_phrase, Network network);

    KeyMaterial(KeyMaterial&&) noexcept = default;
    KeyMaterial& operator=(KeyMaterial&&) noexcept = default;

    std::span<const uint8_t> private_key() const { return private_key_.span(); }
    const std::vector<uint8_t>& public_key() const { return public_key_; }
    const std::vector<uint8_t>& script_pubkey() const { return script_pubkey_; }
    const std::string& address() const { return address_; }
    Network network() const { return network_; }

private:
    SecureMemory private_key_;
    Network network_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> script_pubkey_;
    std::string address_;
};

} // namespace bitcli
