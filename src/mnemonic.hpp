#pragma once

#include <array>
#include <span>
#include <string>
#include <cstdint>
#include <cstddef>

namespace bitcli {

// BIP39 mnemonics over the English wordlist and the wallet's fixed BIP32 path
class Mnemonic {
public:
    // BIP84 path of the first receive address of the first account
    static constexpr const char* DERIVATION_PATH = "m/84'/0'/0'/0/0";

    // 128 bits of entropy, a 12 word phrase
    static constexpr size_t DEFAULT_ENTROPY_SIZE = 16;

    // Fresh phrase from OpenSSL's CSPRNG; entropy_size is 16, 20, 24, 28 or 32 bytes.
    // Throws WalletError(KeyDerivationError).
    static std::string generate(size_t entropy_size = DEFAULT_ENTROPY_SIZE);

    // Phrase encoding the given entropy followed by its SHA256 checksum bits
    static std::string from_entropy(std::span<const uint8_t> entropy);

    // Collapses whitespace and lowercases, then checks the phrase: 12, 15,
    // 18, 21 or 24 words, every word in the wordlist, checksum matching.
    // Throws WalletError(KeyDerivationError) naming the first problem.
    static std::string normalize(const std::string& phrase);

    // 64-byte BIP39 seed of a normalized phrase
    static std::array<uint8_t, 64> to_seed(const std::string& phrase, const std::string& passphrase = "");

    // Private key at DERIVATION_PATH
    static std::array<uint8_t, 32> derive_key(const std::string& phrase);

private:
    Mnemonic() = delete;
};

} // namespace bitcli
