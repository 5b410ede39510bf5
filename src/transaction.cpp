#include "transaction.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include <algorithm>

namespace bitcli {

namespace {

[[noreturn]] void decode_error(const std::string& what) {
    throw WalletError(WalletError::ErrorType::DecodeError, "Malformed transaction: " + what);
}

// Bounds-checked cursor over a serialized transaction
class Reader {
public:
    explicit Reader(std::span<const uint8_t> bytes) : bytes_(bytes), pos_(0) {}

    uint8_t peek(size_t offset = 0) const {
        require(offset + 1);
        return bytes_[pos_ + offset];
    }

    uint8_t read_u8() {
        require(1);
        return bytes_[pos_++];
    }

    uint32_t read_u32() {
        require(4);
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<uint32_t>(bytes_[pos_++]) << (8 * i);
        }
        return value;
    }

    uint64_t read_u64() {
        require(8);
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<uint64_t>(bytes_[pos_++]) << (8 * i);
        }
        return value;
    }

    // Rejects non-canonical encodings and counts that cannot fit in the
    // remaining bytes
    uint64_t read_compact_size() {
        uint8_t first = read_u8();
        uint64_t value = first;
        if (first == 0xfd) {
            uint64_t low = read_u8();
            value = low | (static_cast<uint64_t>(read_u8()) << 8);
            if (value < 0xfd) decode_error("non-canonical compact size");
        } else if (first == 0xfe) {
            value = read_u32();
            if (value <= 0xffff) decode_error("non-canonical compact size");
        } else if (first == 0xff) {
            value = read_u64();
            if (value <= 0xffffffffULL) decode_error("non-canonical compact size");
        }
        if (value > remaining()) {
            decode_error("length exceeds remaining data");
        }
        return value;
    }

    std::vector<uint8_t> read_bytes(size_t count) {
        require(count);
        std::vector<uint8_t> out(bytes_.begin() + pos_, bytes_.begin() + pos_ + count);
        pos_ += count;
        return out;
    }

    size_t remaining() const { return bytes_.size() - pos_; }

private:
    void require(size_t count) const {
        if (count > remaining()) {
            decode_error("unexpected end of data");
        }
    }

    std::span<const uint8_t> bytes_;
    size_t pos_;
};

} // namespace

bool Transaction::has_witness() const {
    return std::any_of(inputs.begin(), inputs.end(),
                       [](const TxInput& in) { return !in.witness.empty(); });
}

void TxCodec::write_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
}

void TxCodec::write_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
    }
}

// Variable length integer ("CompactSize")
// - < 0xfd        : 1 byte
// - <= 0xffff     : 0xfd followed by 2 bytes
// - <= 0xffffffff : 0xfe followed by 4 bytes
// - otherwise     : 0xff followed by 8 bytes
void TxCodec::write_compact_size(std::vector<uint8_t>& out, uint64_t size) {
    if (size < 0xfd) {
        out.push_back(static_cast<uint8_t>(size));
    } else if (size <= 0xffff) {
        out.push_back(0xfd);
        out.push_back(static_cast<uint8_t>(size & 0xff));
        out.push_back(static_cast<uint8_t>((size >> 8) & 0xff));
    } else if (size <= 0xffffffffULL) {
        out.push_back(0xfe);
        write_u32(out, static_cast<uint32_t>(size));
    } else {
        out.push_back(0xff);
        write_u64(out, size);
    }
}

// Transaction output structure:
// - [8 bytes]: Value in satoshis (little-endian)
// - [1-9 bytes]: Script length (varint)
// - [variable]: Script (scriptPubKey)
void TxCodec::write_output(std::vector<uint8_t>& out, const TxOutput& output) {
    write_u64(out, output.value);
    write_compact_size(out, output.script_pubkey.size());
    out.insert(out.end(), output.script_pubkey.begin(), output.script_pubkey.end());
}

// Assemble a transaction in consensus encoding
// https://github.com/bitcoin/bips/blob/master/bip-0144.mediawiki
//
// SegWit transaction structure:
// 1. Transaction version (4 bytes)
// 2. Marker (1 byte, 0x00) and flag (1 byte, 0x01), witness form only
// 3. Input count (varint)
// 4. Inputs: outpoint (36 bytes), scriptSig (varint + bytes), sequence (4 bytes)
// 5. Output count (varint)
// 6. Outputs (variable)
// 7. Witness data, one stack per input in input order, witness form only
// 8. Locktime (4 bytes)
std::vector<uint8_t> TxCodec::serialize(const Transaction& tx, bool include_witness) {
    const bool witness = include_witness && tx.has_witness();
    std::vector<uint8_t> out;

    write_u32(out, tx.version);
    if (witness) {
        out.push_back(TX_MARKER);
        out.push_back(TX_FLAG);
    }

    write_compact_size(out, tx.inputs.size());
    for (const auto& input : tx.inputs) {
        out.insert(out.end(), input.prevout.txid.begin(), input.prevout.txid.end());
        write_u32(out, input.prevout.index);
        write_compact_size(out, input.script_sig.size());
        out.insert(out.end(), input.script_sig.begin(), input.script_sig.end());
        write_u32(out, input.sequence);
    }

    write_compact_size(out, tx.outputs.size());
    for (const auto& output : tx.outputs) {
        write_output(out, output);
    }

    if (witness) {
        for (const auto& input : tx.inputs) {
            write_compact_size(out, input.witness.size());
            for (const auto& item : input.witness) {
                write_compact_size(out, item.size());
                out.insert(out.end(), item.begin(), item.end());
            }
        }
    }

    write_u32(out, tx.lock_time);
    return out;
}

Transaction TxCodec::deserialize(std::span<const uint8_t> bytes) {
    Reader reader(bytes);
    Transaction tx;

    tx.version = reader.read_u32();

    bool witness = false;
    if (reader.remaining() >= 2 && reader.peek() == TX_MARKER && reader.peek(1) == TX_FLAG) {
        reader.read_u8();
        reader.read_u8();
        witness = true;
    }

    uint64_t input_count = reader.read_compact_size();
    tx.inputs.reserve(input_count);
    for (uint64_t i = 0; i < input_count; ++i) {
        TxInput input;
        auto txid = reader.read_bytes(32);
        std::copy(txid.begin(), txid.end(), input.prevout.txid.begin());
        input.prevout.index = reader.read_u32();
        input.script_sig = reader.read_bytes(reader.read_compact_size());
        input.sequence = reader.read_u32();
        tx.inputs.push_back(std::move(input));
    }

    uint64_t output_count = reader.read_compact_size();
    tx.outputs.reserve(output_count);
    for (uint64_t i = 0; i < output_count; ++i) {
        TxOutput output;
        output.value = reader.read_u64();
        output.script_pubkey = reader.read_bytes(reader.read_compact_size());
        tx.outputs.push_back(std::move(output));
    }

    if (witness) {
        for (auto& input : tx.inputs) {
            uint64_t items = reader.read_compact_size();
            for (uint64_t i = 0; i < items; ++i) {
                input.witness.push_back(reader.read_bytes(reader.read_compact_size()));
            }
        }
        if (!tx.has_witness()) {
            decode_error("witness flag set but no witness data");
        }
    }

    tx.lock_time = reader.read_u32();
    if (reader.remaining() != 0) {
        decode_error("trailing data");
    }
    return tx;
}

// The txid is the double SHA256 of the transaction without marker, flag and
// witness data, so signatures do not change it. It is shown byte-reversed.
std::array<uint8_t, 32> TxCodec::txid(const Transaction& tx) {
    auto hash = HashUtils::double_sha256(serialize(tx, false));
    std::array<uint8_t, 32> txid;
    std::reverse_copy(hash.begin(), hash.end(), txid.begin());
    return txid;
}

std::string TxCodec::txid_hex(const Transaction& tx) {
    return HexUtils::encode(txid(tx));
}

std::array<uint8_t, 32> TxCodec::parse_txid(const std::string& hex) {
    if (hex.size() != 64) {
        decode_error("txid must be 64 hex characters");
    }
    std::vector<uint8_t> bytes;
    try {
        bytes = HexUtils::decode(hex);
    } catch (const std::invalid_argument& e) {
        decode_error(std::string("txid: ") + e.what());
    }
    std::array<uint8_t, 32> internal;
    std::reverse_copy(bytes.begin(), bytes.end(), internal.begin());
    return internal;
}

} // namespace bitcli
