#include "segwit.hpp"
#include "consts.hpp"
#include "hash_utils.hpp"
#include <stdexcept>

namespace bitcli {

// P2WPKH output script (BIP141): OP_0 0x14 <HASH160(pubkey)>, 22 bytes
std::vector<uint8_t> Segwit::get_p2wpkh_program(std::span<const uint8_t> pubkey) {
    auto hash160_result = HashUtils::hash160(pubkey);
    return get_witness_script_pubkey(WITNESS_VERSION_0, hash160_result);
}

// Witness output script: <version opcode> <push program>
// Version 0 is OP_0, versions 1..16 are OP_1..OP_16 (0x51..0x60).
std::vector<uint8_t> Segwit::get_witness_script_pubkey(uint8_t witness_version,
                                                       std::span<const uint8_t> program) {
    if (witness_version > 16 || program.size() < 2 || program.size() > 40) {
        throw std::invalid_argument("Invalid witness program");
    }

    std::vector<uint8_t> script;
    script.reserve(2 + program.size());
    script.push_back(witness_version == 0 ? OP_0 : static_cast<uint8_t>(OP_1 + witness_version - 1));
    script.push_back(static_cast<uint8_t>(program.size()));
    script.insert(script.end(), program.begin(), program.end());
    return script;
}

bool Segwit::is_p2wpkh(std::span<const uint8_t> script) {
    return script.size() == P2WPKH_PROGRAM_SIZE &&
           script[0] == WITNESS_VERSION_0 &&
           script[1] == PUBKEY_HASH_SIZE;
}

// Assemble the P2WPKH scriptCode as defined in BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki#specification
//
// For P2WPKH, the scriptCode is a standard P2PKH script built from the
// 20-byte hash in the witness program:
//
// P2WPKH scriptcode structure (26 bytes total, length-prefixed):
// - 0x19     : Script length (25 bytes)
// - 0x76     : OP_DUP
// - 0xA9     : OP_HASH160
// - 0x14     : Push 20 bytes
// - [20 bytes]: Public key hash (from witness program)
// - 0x88     : OP_EQUALVERIFY
// - 0xAC     : OP_CHECKSIG
std::vector<uint8_t> Segwit::get_p2wpkh_scriptcode(std::span<const uint8_t> script_pubkey) {
    if (!is_p2wpkh(script_pubkey)) {
        throw std::invalid_argument("Not a P2WPKH script");
    }

    std::vector<uint8_t> script;
    script.reserve(P2WPKH_SCRIPTCODE_SIZE + 1);
    script.push_back(P2WPKH_SCRIPTCODE_SIZE);
    script.push_back(OP_DUP);
    script.push_back(OP_HASH160);
    script.push_back(PUBKEY_HASH_SIZE);
    
    // Skip the version byte and push byte of the witness program
    script.insert(script.end(), script_pubkey.begin() + 2, script_pubkey.end());
    
    script.push_back(OP_EQUALVERIFY);
    script.push_back(OP_CHECKSIG);
    
    return script;
}

} // namespace bitcli
