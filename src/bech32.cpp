#include "bech32.hpp"
#include <array>
#include <cctype>
#include <stdexcept>

namespace bitcli {

namespace {

enum class Encoding { Bech32, Bech32m };

constexpr std::array<char, 32> kCharset = {
    'q', 'p', 'z', 'r', 'y', '9', 'x', '8', 'g', 'f', '2', 't', 'v', 'd', 'w', '0',
    's', '3', 'j', 'n', '5', '4', 'k', 'h', 'c', 'e', '6', 'm', 'u', 'a', '7', 'l'};

constexpr std::array<int8_t, 128> make_decode_map() {
    std::array<int8_t, 128> map{};
    map.fill(-1);
    for (size_t i = 0; i < kCharset.size(); ++i) {
        map[static_cast<unsigned>(kCharset[i])] = static_cast<int8_t>(i);
    }
    return map;
}

constexpr auto kDecodeMap = make_decode_map();
constexpr uint32_t kBech32Constant = 1;
constexpr uint32_t kBech32mConstant = 0x2bc830a3;
constexpr size_t kMaxAddressLength = 90;
constexpr size_t kChecksumLength = 6;

uint32_t checksum_constant(Encoding encoding) {
    return encoding == Encoding::Bech32 ? kBech32Constant : kBech32mConstant;
}

// BCH code over GF(32) defined in BIP173
uint32_t polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = static_cast<uint8_t>(chk >> 25);
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 0x01) chk ^= 0x3b6a57b2;
        if (top & 0x02) chk ^= 0x26508e6d;
        if (top & 0x04) chk ^= 0x1ea119fa;
        if (top & 0x08) chk ^= 0x3d4233dd;
        if (top & 0x10) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> hrp_expand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) >> 5));
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(static_cast<unsigned char>(c) & 0x1f));
    }
    return ret;
}

std::vector<uint8_t> create_checksum(const std::string& hrp, const std::vector<uint8_t>& data,
                                     Encoding encoding) {
    auto values = hrp_expand(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), kChecksumLength, 0);
    uint32_t mod = polymod(values) ^ checksum_constant(encoding);
    std::vector<uint8_t> checksum(kChecksumLength);
    for (size_t i = 0; i < kChecksumLength; ++i) {
        checksum[i] = static_cast<uint8_t>((mod >> (5 * (5 - i))) & 0x1f);
    }
    return checksum;
}

// Regroups a bit stream from from_bits-wide to to_bits-wide values
bool convert_bits(std::vector<uint8_t>& out, int from_bits, int to_bits, bool pad,
                  std::span<const uint8_t> data) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : data) {
        if ((value >> from_bits) != 0) {
            return false;
        }
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
        }
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv) != 0) {
        return false;
    }
    return true;
}

struct Decoded {
    std::string hrp;
    std::vector<uint8_t> data;
    Encoding encoding;
};

std::optional<Decoded> decode(const std::string& str) {
    if (str.size() > kMaxAddressLength) {
        return std::nullopt;
    }
    bool has_lower = false;
    bool has_upper = false;
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 33 || uc > 126) {
            return std::nullopt;
        }
        if (std::islower(uc)) has_lower = true;
        if (std::isupper(uc)) has_upper = true;
    }
    if (has_lower && has_upper) {
        return std::nullopt;
    }

    auto separator = str.rfind('1');
    if (separator == std::string::npos || separator == 0 ||
        separator + kChecksumLength + 1 > str.size()) {
        return std::nullopt;
    }

    Decoded result;
    for (size_t i = 0; i < separator; ++i) {
        result.hrp.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(str[i]))));
    }
    for (size_t i = separator + 1; i < str.size(); ++i) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
        int8_t v = kDecodeMap[static_cast<unsigned char>(c)];
        if (v < 0) {
            return std::nullopt;
        }
        result.data.push_back(static_cast<uint8_t>(v));
    }

    auto values = hrp_expand(result.hrp);
    values.insert(values.end(), result.data.begin(), result.data.end());
    uint32_t check = polymod(values);
    if (check == kBech32Constant) {
        result.encoding = Encoding::Bech32;
    } else if (check == kBech32mConstant) {
        result.encoding = Encoding::Bech32m;
    } else {
        return std::nullopt;
    }
    result.data.resize(result.data.size() - kChecksumLength);
    return result;
}

bool valid_program_size(uint8_t witness_version, size_t size) {
    if (size < 2 || size > 40) {
        return false;
    }
    return witness_version != 0 || size == 20 || size == 32;
}

} // namespace

// Encodes a segwit address as defined in BIP173 / BIP350
//
// Address layout: hrp || "1" || witness version (5 bits) || program regrouped
// into 5-bit values || 6-value checksum.
std::string Bech32::encode_segwit(const std::string& hrp, uint8_t witness_version,
                                  std::span<const uint8_t> program) {
    if (witness_version > 16 || !valid_program_size(witness_version, program.size())) {
        throw std::invalid_argument("Invalid witness version or program size");
    }

    std::vector<uint8_t> data{witness_version};
    convert_bits(data, 8, 5, true, program);

    auto encoding = witness_version == 0 ? Encoding::Bech32 : Encoding::Bech32m;
    auto checksum = create_checksum(hrp, data, encoding);
    data.insert(data.end(), checksum.begin(), checksum.end());

    std::string result = hrp + '1';
    result.reserve(result.size() + data.size());
    for (uint8_t v : data) {
        result.push_back(kCharset[v]);
    }
    return result;
}

std::optional<SegwitAddress> Bech32::decode_segwit(const std::string& address) {
    auto decoded = decode(address);
    if (!decoded || decoded->data.empty()) {
        return std::nullopt;
    }

    uint8_t version = decoded->data[0];
    if (version > 16) {
        return std::nullopt;
    }
    // Version 0 must use Bech32, every later version Bech32m
    if ((version == 0) != (decoded->encoding == Encoding::Bech32)) {
        return std::nullopt;
    }

    std::vector<uint8_t> program;
    if (!convert_bits(program, 5, 8, false,
                      std::span<const uint8_t>(decoded->data).subspan(1))) {
        return std::nullopt;
    }
    if (!valid_program_size(version, program.size())) {
        return std::nullopt;
    }

    return SegwitAddress{
        .hrp = std::move(decoded->hrp),
        .witness_version = version,
        .program = std::move(program)
    };
}

} // namespace bitcli
