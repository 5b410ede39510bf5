#pragma once

#include <array>
#include <vector>
#include <span>
#include <cstdint>
#include "key_material.hpp"
#include "transaction.hpp"
#include "utxo.hpp"

namespace bitcli {

// Signs every input of a P2WPKH spend with the wallet key
class TxSigner {
public:
    explicit TxSigner(const KeyMaterial& key);

    // Returns a copy of tx with witness [signature || SIGHASH_ALL, pubkey] on
    // every input. utxos[i] is the output spent by input i. The input is
    // never modified; any failure throws WalletError(InternalSigningError).
    Transaction sign(const Transaction& tx, const std::vector<Utxo>& utxos) const;

    // BIP143 SIGHASH_ALL digest for a P2WPKH input
    static std::array<uint8_t, 32> p2wpkh_sighash(const Transaction& tx, size_t input_index,
                                                  std::span<const uint8_t> script_pubkey,
                                                  uint64_t value);

    // ECDSA over secp256k1, low-S normalized, DER encoded (no sighash byte)
    static std::vector<uint8_t> sign_digest(std::span<const uint8_t> private_key,
                                            std::span<const uint8_t, 32> digest);

private:
    const KeyMaterial& key_;
};

} // namespace bitcli
