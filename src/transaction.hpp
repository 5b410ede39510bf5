#pragma once

#include <array>
#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include "consts.hpp"

namespace bitcli {

struct Outpoint {
    std::array<uint8_t, 32> txid{}; // Transaction ID in internal (little-endian) byte order
    uint32_t index = 0;             // Output index in transaction

    bool operator==(const Outpoint&) const = default;
};

struct TxInput {
    Outpoint prevout;
    std::vector<uint8_t> script_sig;             // Empty for native segwit inputs
    uint32_t sequence = SEQUENCE_FINAL;
    std::vector<std::vector<uint8_t>> witness;   // Witness stack, empty until signed

    bool operator==(const TxInput&) const = default;
};

struct TxOutput {
    uint64_t value = 0;                 // Amount in satoshis
    std::vector<uint8_t> script_pubkey; // Locking script

    bool operator==(const TxOutput&) const = default;
};

struct Transaction {
    uint32_t version = TX_VERSION;
    std::vector<TxInput> inputs;
    std::vector<TxOutput> outputs;
    uint32_t lock_time = TX_LOCKTIME;

    bool has_witness() const;

    bool operator==(const Transaction&) const = default;
};

// Consensus encoding of transactions (BIP144 for the witness form)
class TxCodec {
public:
    // Serializes a transaction; the witness form is used when include_witness
    // is set and at least one input carries witness data
    static std::vector<uint8_t> serialize(const Transaction& tx, bool include_witness = true);

    // Parses either encoding; throws WalletError(DecodeError) on malformed input
    static Transaction deserialize(std::span<const uint8_t> bytes);

    // Serialize one output: value (8 bytes LE) || varint length || script
    static void write_output(std::vector<uint8_t>& out, const TxOutput& output);

    // Double SHA256 of the non-witness serialization, in display (big-endian) order
    static std::array<uint8_t, 32> txid(const Transaction& tx);

    // txid as lowercase hex
    static std::string txid_hex(const Transaction& tx);

    // Parses a 64-character display-order txid into internal byte order;
    // throws WalletError(DecodeError) on malformed input
    static std::array<uint8_t, 32> parse_txid(const std::string& hex);

    static void write_u32(std::vector<uint8_t>& out, uint32_t value);
    static void write_u64(std::vector<uint8_t>& out, uint64_t value);
    static void write_compact_size(std::vector<uint8_t>& out, uint64_t size);

private:
    TxCodec() = delete;
};

} // namespace bitcli
