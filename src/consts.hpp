#pragma once

#include <cstddef>
#include <cstdint>

namespace bitcli {

    // Bitcoin Script Operation Codes
    constexpr uint8_t OP_0 = 0x00;
    constexpr uint8_t OP_1 = 0x51;
    constexpr uint8_t OP_DUP = 0x76;
    constexpr uint8_t OP_HASH160 = 0xA9;
    constexpr uint8_t OP_EQUALVERIFY = 0x88;
    constexpr uint8_t OP_CHECKSIG = 0xAC;

    // Common script-related constants
    constexpr uint8_t COMPRESSED_PUBKEY_SIZE = 0x21; // 33 bytes
    constexpr uint8_t PUBKEY_HASH_SIZE = 0x14; // 20 bytes
    constexpr uint8_t P2WPKH_SCRIPTCODE_SIZE = 0x19; // 25 bytes
    constexpr uint8_t P2WPKH_PROGRAM_SIZE = 0x16; // 22 bytes
    constexpr uint8_t WITNESS_VERSION_0 = 0x00;

    // Transaction-related constants
    constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;
    constexpr uint32_t SEQUENCE_ENABLE_RBF_NO_LOCKTIME = 0xFFFFFFFD;
    constexpr uint32_t SIGHASH_ALL = 0x01;
    constexpr uint32_t TX_VERSION = 0x02;
    constexpr uint32_t TX_LOCKTIME = 0x00;
    constexpr uint8_t TX_MARKER = 0x00;
    constexpr uint8_t TX_FLAG = 0x01;
    constexpr uint64_t MAX_MONEY = 2100000000000000; // 21M BTC in sats

    // A DER signature is at most 72 bytes, plus the sighash byte
    constexpr size_t MAX_WITNESS_SIGNATURE_SIZE = 73;

} // namespace bitcli
