#pragma once

#include <vector>
#include <span>
#include <cstdint>

namespace bitcli {

class Segwit {
public:
    // Get the P2WPKH witness program (OP_0 <hash160(pubkey)>) from a public key
    static std::vector<uint8_t> get_p2wpkh_program(std::span<const uint8_t> pubkey);

    // Build the scriptPubKey for any witness version and program
    static std::vector<uint8_t> get_witness_script_pubkey(uint8_t witness_version,
                                                          std::span<const uint8_t> program);

    // True if script is OP_0 followed by a 20-byte push
    static bool is_p2wpkh(std::span<const uint8_t> script);

    // Get the BIP143 scriptCode for spending a P2WPKH output
    static std::vector<uint8_t> get_p2wpkh_scriptcode(std::span<const uint8_t> script_pubkey);

private:
    Segwit() = delete;
};

} // namespace bitcli
