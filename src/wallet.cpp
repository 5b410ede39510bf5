/**
 * @file wallet.cpp
 * @brief Send pipeline sequencing for the single-key wallet
 *
 * The send state machine:
 *
 *   Idle -> UtxosFetched -> Built -> Signed -> Broadcast (success | failure)
 *
 * Every transition is a plain function call; an exception at any step
 * unwinds the remaining ones and releases the UTXO lease.
 */

#include "wallet.hpp"
#include "mnemonic.hpp"

namespace bitcli {

Wallet::Wallet(KeyMaterial key, HttpClient& http, Options options)
    : key_(std::move(key))
    , options_(std::move(options))
    , fetcher_(http, key_.network(), options_.api_url)
    , builder_(fetcher_, key_)
    , signer_(key_)
    , broadcaster_(http, key_.network(), options_.api_url)
{}

Wallet::Wallet(KeyMaterial key, HttpClient& http)
    : Wallet(std::move(key), http, Options{})
{}

// The key is derived before anything is written, so an unusable phrase is
// never persisted
Wallet Wallet::from_mnemonic(const std::string& mnemonic_phrase, Network network,
                             MnemonicStore& store, HttpClient& http, Options options) {
    auto normalized = Mnemonic::normalize(mnemonic_phrase);
    auto key = KeyMaterial::from_mnemonic(normalized, network);
    store.save(normalized);
    return Wallet(std::move(key), http, std::move(options));
}

Wallet Wallet::create(Network network, MnemonicStore& store, HttpClient& http, Options options) {
    return from_mnemonic(Mnemonic::generate(), network, store, http, std::move(options));
}

uint64_t Wallet::balance() const {
    return fetcher_.fetch_balance(address());
}

std::string Wallet::send(const std::string& to, uint64_t amount) {
    return send(to, amount, options_.fee_tier);
}

std::string Wallet::send(const std::string& to, uint64_t amount, FeeTier tier) {
    auto utxos = fetcher_.fetch_utxos(address());
    reservations_.prune_spent(utxos);
    auto lease = reservations_.acquire(utxos);
    log("fetched " + std::to_string(utxos.size()) + " UTXOs, leased " +
        std::to_string(lease.utxos().size()));

    auto unsigned_tx = builder_.build(to, amount, lease.utxos(), tier);
    log("built transaction with " + std::to_string(unsigned_tx.inputs.size()) + " inputs, change " +
        std::to_string(unsigned_tx.outputs[1].value) + " sats (" + fee_tier_name(tier) + " fee tier)");

    auto signed_tx = signer_.sign(unsigned_tx, lease.utxos());
    log("signed " + TxCodec::txid_hex(signed_tx));

    auto txid = broadcaster_.broadcast(signed_tx);
    lease.commit();
    log("broadcast accepted " + txid);

    return txid;
}

void Wallet::log(const std::string& message) const {
    if (options_.log) {
        *options_.log << "[send] " << message << std::endl;
    }
}

} // namespace bitcli
