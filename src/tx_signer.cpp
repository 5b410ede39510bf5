#include "tx_signer.hpp"
#include "bip32_util.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "segwit.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/crypto.h>
#include <memory>

namespace bitcli {

namespace {

using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

[[noreturn]] void signing_error(const std::string& what) {
    throw WalletError(WalletError::ErrorType::InternalSigningError, what);
}

void append_u32(std::vector<uint8_t>& out, uint32_t value) {
    TxCodec::write_u32(out, value);
}

} // namespace

TxSigner::TxSigner(const KeyMaterial& key)
    : key_(key)
{}

// Create the transaction digest for signing according to BIP143
// https://github.com/bitcoin/bips/blob/master/bip-0143.mediawiki
//
// The preimage, for SIGHASH_ALL:
// 1. Transaction version (4 bytes)
// 2. hashPrevouts: double SHA256 of every input outpoint (32 bytes)
// 3. hashSequence: double SHA256 of every input sequence (32 bytes)
// 4. Outpoint being spent (36 bytes)
// 5. scriptCode of the input (P2PKH form of the witness program)
// 6. Value of the output being spent (8 bytes)
// 7. Sequence number of the input (4 bytes)
// 8. hashOutputs: double SHA256 of every serialized output (32 bytes)
// 9. Locktime (4 bytes)
// 10. Sighash type (4 bytes)
// The digest is the double SHA256 of the preimage.
std::array<uint8_t, 32> TxSigner::p2wpkh_sighash(const Transaction& tx, size_t input_index,
                                                 std::span<const uint8_t> script_pubkey,
                                                 uint64_t value) {
    if (input_index >= tx.inputs.size()) {
        signing_error("Input index out of range");
    }
    if (!Segwit::is_p2wpkh(script_pubkey)) {
        signing_error("Spent output is not P2WPKH");
    }

    std::vector<uint8_t> prevouts;
    std::vector<uint8_t> sequences;
    for (const auto& input : tx.inputs) {
        prevouts.insert(prevouts.end(), input.prevout.txid.begin(), input.prevout.txid.end());
        append_u32(prevouts, input.prevout.index);
        append_u32(sequences, input.sequence);
    }

    std::vector<uint8_t> outputs;
    for (const auto& output : tx.outputs) {
        TxCodec::write_output(outputs, output);
    }

    auto hash_prevouts = HashUtils::double_sha256(prevouts);
    auto hash_sequence = HashUtils::double_sha256(sequences);
    auto hash_outputs = HashUtils::double_sha256(outputs);
    const auto& input = tx.inputs[input_index];
    auto script_code = Segwit::get_p2wpkh_scriptcode(script_pubkey);

    std::vector<uint8_t> preimage;
    append_u32(preimage, tx.version);
    preimage.insert(preimage.end(), hash_prevouts.begin(), hash_prevouts.end());
    preimage.insert(preimage.end(), hash_sequence.begin(), hash_sequence.end());
    preimage.insert(preimage.end(), input.prevout.txid.begin(), input.prevout.txid.end());
    append_u32(preimage, input.prevout.index);
    preimage.insert(preimage.end(), script_code.begin(), script_code.end());
    TxCodec::write_u64(preimage, value);
    append_u32(preimage, input.sequence);
    preimage.insert(preimage.end(), hash_outputs.begin(), hash_outputs.end());
    append_u32(preimage, tx.lock_time);
    append_u32(preimage, SIGHASH_ALL);

    return HashUtils::double_sha256(preimage);
}

// Sign a digest with a private key using ECDSA on the secp256k1 curve
// https://github.com/bitcoin/bips/blob/master/bip-0062.mediawiki#low-s-values-in-signatures
//
// For any valid signature (r, s), (r, n - s) is valid too. Standardness
// rules only accept s <= n/2, so a high s is replaced by n - s before the
// signature is DER encoded.
std::vector<uint8_t> TxSigner::sign_digest(std::span<const uint8_t> private_key,
                                           std::span<const uint8_t, 32> digest) {
    if (!Bip32Util::is_valid_private_key(private_key)) {
        signing_error("Private key failed to parse");
    }

    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!eckey) {
        signing_error("Failed to create secp256k1 key");
    }
    const EC_GROUP* group = EC_KEY_get0_group(eckey.get());

    BignumPtr priv(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr), BN_free);
    EcPointPtr pub(EC_POINT_new(group), EC_POINT_free);
    if (!priv || !pub ||
        !EC_KEY_set_private_key(eckey.get(), priv.get()) ||
        !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr) ||
        !EC_KEY_set_public_key(eckey.get(), pub.get())) {
        signing_error("Failed to load private key");
    }

    EcdsaSigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), eckey.get()), ECDSA_SIG_free);
    if (!sig) {
        signing_error("ECDSA signing failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    BignumPtr order(BN_new(), BN_free);
    BignumPtr half_order(BN_new(), BN_free);
    if (!order || !half_order ||
        !EC_GROUP_get_order(group, order.get(), nullptr) ||
        !BN_rshift1(half_order.get(), order.get())) {
        signing_error("Failed to load curve order");
    }

    if (BN_cmp(s, half_order.get()) > 0) {
        BignumPtr new_r(BN_dup(r), BN_free);
        BignumPtr new_s(BN_new(), BN_free);
        if (!new_r || !new_s || !BN_sub(new_s.get(), order.get(), s)) {
            signing_error("Failed to normalize signature");
        }
        // ECDSA_SIG_set0 takes ownership of both numbers on success
        if (ECDSA_SIG_set0(sig.get(), new_r.get(), new_s.get()) != 1) {
            signing_error("Failed to normalize signature");
        }
        new_r.release();
        new_s.release();
    }

    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig.get(), &der);
    if (der_len <= 0 || der == nullptr) {
        signing_error("Failed to DER encode signature");
    }
    std::vector<uint8_t> signature(der, der + der_len);
    OPENSSL_free(der);

    return signature;
}

// Sign every input, in order, against the UTXO it spends.
//
// The witness of a P2WPKH input (BIP141) has exactly two items:
// 1. DER signature followed by the sighash type byte
// 2. The 33-byte compressed public key whose HASH160 is the witness program
//
// Witnesses are attached to a copy, so a failure part way leaves nothing
// behind for the caller.
Transaction TxSigner::sign(const Transaction& tx, const std::vector<Utxo>& utxos) const {
    if (utxos.size() != tx.inputs.size()) {
        signing_error("Expected " + std::to_string(tx.inputs.size()) + " UTXOs, got " +
                      std::to_string(utxos.size()));
    }

    std::vector<uint8_t> public_key;
    try {
        public_key = Bip32Util::derive_public_key_from_private(key_.private_key());
    } catch (const WalletError& e) {
        signing_error(std::string("Private key failed to parse: ") + e.what());
    }

    Transaction signed_tx = tx;
    for (size_t i = 0; i < signed_tx.inputs.size(); ++i) {
        auto sighash = p2wpkh_sighash(tx, i, key_.script_pubkey(), utxos[i].value);

        auto signature = sign_digest(key_.private_key(), sighash);
        signature.push_back(static_cast<uint8_t>(SIGHASH_ALL));

        signed_tx.inputs[i].witness = {std::move(signature), public_key};
    }

    return signed_tx;
}

} // namespace bitcli
