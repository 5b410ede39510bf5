#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include <optional>

namespace bitcli {

// A decoded segwit address
struct SegwitAddress {
    std::string hrp;              // Human readable part, lowercase ("bc", "tb", "bcrt")
    uint8_t witness_version;      // 0..16
    std::vector<uint8_t> program; // 2..40 byte witness program
};

// Bech32 (BIP173) and Bech32m (BIP350) codec for segwit addresses.
//
// Witness version 0 addresses use the Bech32 checksum, versions 1 through 16
// use Bech32m. Both share the 32-character alphabet
// "qpzry9x8gf2tvdw0s3jn54khce6mua7l".
class Bech32 {
public:
    // Encodes a segwit address; throws std::invalid_argument on a bad version or program size
    static std::string encode_segwit(const std::string& hrp, uint8_t witness_version,
                                     std::span<const uint8_t> program);

    // Decodes and validates a segwit address, returns std::nullopt if anything is wrong
    static std::optional<SegwitAddress> decode_segwit(const std::string& address);

private:
    Bech32() = delete;
};

} // namespace bitcli
