#include "mnemonic.hpp"
#include "bip32_util.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "mnemonic_wordlist_en.hpp"
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace bitcli {

namespace {

constexpr size_t BITS_PER_WORD = 11;

[[noreturn]] void mnemonic_error(const std::string& what) {
    throw WalletError(WalletError::ErrorType::KeyDerivationError, what);
}

bool valid_entropy_size(size_t size) {
    return size >= 16 && size <= 32 && size % 4 == 0;
}

// The wordlist is sorted, so a word's index is its lower bound
int word_index(const std::string& word) {
    auto it = std::lower_bound(BIP39_ENGLISH_WORDLIST.begin(), BIP39_ENGLISH_WORDLIST.end(), word);
    if (it == BIP39_ENGLISH_WORDLIST.end() || *it != word) {
        return -1;
    }
    return static_cast<int>(it - BIP39_ENGLISH_WORDLIST.begin());
}

bool bit_at(const std::vector<uint8_t>& bytes, size_t bit) {
    return (bytes[bit / 8] >> (7 - bit % 8)) & 0x01;
}

} // namespace

// BIP39 generation
// https://github.com/bitcoin/bips/blob/master/bip-0039.mediawiki#generating-the-mnemonic
//
// The first ENT/32 bits of SHA256(entropy) are appended to the entropy and
// the result is cut into 11-bit indices into the wordlist:
//   16 bytes -> 4 checksum bits -> 12 words
//   32 bytes -> 8 checksum bits -> 24 words
std::string Mnemonic::from_entropy(std::span<const uint8_t> entropy) {
    if (!valid_entropy_size(entropy.size())) {
        mnemonic_error("Mnemonic entropy must be 16, 20, 24, 28 or 32 bytes, got " +
                       std::to_string(entropy.size()));
    }

    auto hash = HashUtils::sha256(entropy);
    std::vector<uint8_t> bits(entropy.begin(), entropy.end());
    bits.push_back(hash[0]);

    const size_t total_bits = entropy.size() * 8 + entropy.size() / 4;
    std::string phrase;
    for (size_t word = 0; word < total_bits / BITS_PER_WORD; ++word) {
        size_t index = 0;
        for (size_t i = 0; i < BITS_PER_WORD; ++i) {
            index = (index << 1) | (bit_at(bits, word * BITS_PER_WORD + i) ? 1 : 0);
        }
        if (word > 0) {
            phrase.push_back(' ');
        }
        phrase += BIP39_ENGLISH_WORDLIST[index];
    }

    OPENSSL_cleanse(bits.data(), bits.size());
    return phrase;
}

std::string Mnemonic::generate(size_t entropy_size) {
    if (!valid_entropy_size(entropy_size)) {
        mnemonic_error("Mnemonic entropy must be 16, 20, 24, 28 or 32 bytes, got " +
                       std::to_string(entropy_size));
    }

    std::vector<uint8_t> entropy(entropy_size);
    if (RAND_bytes(entropy.data(), static_cast<int>(entropy.size())) != 1) {
        mnemonic_error("Failed to gather entropy for a new mnemonic");
    }
    auto phrase = from_entropy(entropy);
    OPENSSL_cleanse(entropy.data(), entropy.size());
    return phrase;
}

std::string Mnemonic::normalize(const std::string& phrase) {
    std::istringstream stream(phrase);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        for (char& c : word) {
            if (!std::isalpha(static_cast<unsigned char>(c))) {
                mnemonic_error("Mnemonic words must be alphabetic");
            }
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        words.push_back(std::move(word));
    }

    const size_t count = words.size();
    if (count < 12 || count > 24 || count % 3 != 0) {
        mnemonic_error("Mnemonic must have 12, 15, 18, 21 or 24 words, got " + std::to_string(count));
    }

    // Rebuild entropy || checksum from the word indices
    const size_t total_bits = count * BITS_PER_WORD;
    const size_t entropy_bits = total_bits * 32 / 33;
    const size_t checksum_bits = total_bits - entropy_bits;

    std::vector<uint8_t> bits((total_bits + 7) / 8, 0);
    for (size_t w = 0; w < count; ++w) {
        int index = word_index(words[w]);
        if (index < 0) {
            mnemonic_error("Mnemonic word " + std::to_string(w + 1) + " is not in the BIP39 English wordlist");
        }
        for (size_t i = 0; i < BITS_PER_WORD; ++i) {
            if ((index >> (BITS_PER_WORD - 1 - i)) & 0x01) {
                size_t bit = w * BITS_PER_WORD + i;
                bits[bit / 8] |= static_cast<uint8_t>(0x80 >> (bit % 8));
            }
        }
    }

    std::span<const uint8_t> entropy(bits.data(), entropy_bits / 8);
    auto hash = HashUtils::sha256(entropy);
    const uint8_t expected = static_cast<uint8_t>(hash[0] >> (8 - checksum_bits));
    uint8_t actual = 0;
    for (size_t i = 0; i < checksum_bits; ++i) {
        actual = static_cast<uint8_t>((actual << 1) | (bit_at(bits, entropy_bits + i) ? 1 : 0));
    }
    OPENSSL_cleanse(bits.data(), bits.size());
    if (actual != expected) {
        mnemonic_error("Mnemonic checksum does not match");
    }

    std::string normalized;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            normalized.push_back(' ');
        }
        normalized += words[i];
    }
    return normalized;
}

// BIP39 seed: PBKDF2-HMAC-SHA512 with the sentence as password,
// "mnemonic" + passphrase as salt, 2048 iterations, 64 bytes of output
// https://github.com/bitcoin/bips/blob/master/bip-0039.mediawiki#from-mnemonic-to-seed
std::array<uint8_t, 64> Mnemonic::to_seed(const std::string& phrase, const std::string& passphrase) {
    return HashUtils::pbkdf2_hmac_sha512(phrase, "mnemonic" + passphrase, 2048);
}

std::array<uint8_t, 32> Mnemonic::derive_key(const std::string& phrase) {
    auto seed = to_seed(normalize(phrase));
    auto master = Bip32Util::master_from_seed(seed);
    seed.fill(0);

    auto child = Bip32Util::get_child_key_at_path(master, DERIVATION_PATH);
    master.key.fill(0);
    return child.key;
}

} // namespace bitcli
