/**
 * @file wallet.hpp
 * @brief Single-key P2WPKH wallet session
 *
 * A Wallet owns the key material for one receive address and drives the
 * send pipeline against a block explorer:
 *
 *   fetch UTXOs -> build -> sign -> broadcast
 *
 * Each stage either produces its result or throws a WalletError, and the
 * first error ends the send. Nothing is retried and no half-finished
 * transaction is kept; calling send() again starts over with fresh UTXOs
 * and fee rates.
 *
 * UTXOs picked up by a send are leased in an in-memory reservation set until
 * the send finishes, so overlapping sends on the same Wallet never spend the
 * same outpoint. The lease is dropped if the send fails and kept after a
 * successful broadcast, until a later fetch no longer lists those outpoints.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include "broadcaster.hpp"
#include "chain_data.hpp"
#include "fee_estimator.hpp"
#include "http_client.hpp"
#include "key_material.hpp"
#include "mnemonic_store.hpp"
#include "tx_builder.hpp"
#include "tx_signer.hpp"
#include "utxo_reservations.hpp"

namespace bitcli {

class Wallet {
public:
    struct Options {
        std::optional<std::string> api_url;  // Overrides the network's explorer
        FeeTier fee_tier = FeeTier::High;    // Tier used by send() without an explicit tier
        std::ostream* log = nullptr;         // Receives one line per send stage when set
    };

    Wallet(KeyMaterial key, HttpClient& http, Options options);
    Wallet(KeyMaterial key, HttpClient& http);

    // Derives the wallet key from a mnemonic and stores the normalized phrase
    static Wallet from_mnemonic(const std::string& mnemonic_phrase, Network network,
                                MnemonicStore& store, HttpClient& http, Options options);

    // Generates a fresh 12-word mnemonic, then imports it as from_mnemonic does
    static Wallet create(Network network, MnemonicStore& store, HttpClient& http, Options options);

    Wallet(const Wallet&) = delete;
    Wallet& operator=(const Wallet&) = delete;

    const std::string& address() const { return key_.address(); }
    Network network() const { return key_.network(); }
    const KeyMaterial& key() const { return key_; }

    // Confirmed balance in satoshis
    uint64_t balance() const;

    // Sends amount satoshis to a segwit address, returns the accepted txid
    std::string send(const std::string& to, uint64_t amount);
    std::string send(const std::string& to, uint64_t amount, FeeTier tier);

    const UtxoReservations& reservations() const { return reservations_; }

private:
    void log(const std::string& message) const;

    KeyMaterial key_;
    Options options_;
    ChainDataFetcher fetcher_;
    TxBuilder builder_;
    TxSigner signer_;
    Broadcaster broadcaster_;
    UtxoReservations reservations_;
};

} // namespace bitcli
