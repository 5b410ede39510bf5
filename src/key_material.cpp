#include "key_material.hpp"
#include "bip32_util.hpp"
#include "bech32.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "mnemonic.hpp"
#include "segwit.hpp"

namespace bitcli {

KeyMaterial::KeyMaterial(std::span<const uint8_t> private_key, Network network)
    : network_(network) {
    if (!Bip32Util::is_valid_private_key(private_key)) {
        throw WalletError(WalletError::ErrorType::KeyDerivationError,
                          "Private key is not a valid secp256k1 scalar");
    }
    private_key_ = SecureMemory(private_key);
    public_key_ = Bip32Util::derive_public_key_from_private(private_key);
    script_pubkey_ = Segwit::get_p2wpkh_program(public_key_);

    // The address encodes the 20-byte hash that follows OP_0 0x14
    std::span<const uint8_t> program(script_pubkey_.data() + 2, PUBKEY_HASH_SIZE);
    address_ = Bech32::encode_segwit(bech32_hrp(network), WITNESS_VERSION_0, program);
}

KeyMaterial KeyMaterial::from_mnemonic(const std::string& mnemonic_phrase, Network network) {
    auto secret = Mnemonic::derive_key(mnemonic_phrase);
    SecureMemory guard(secret);
    secret.fill(0);
    return KeyMaterial(guard.span(), network);
}

} // namespace bitcli
