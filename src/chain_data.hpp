#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include "fee_estimator.hpp"
#include "http_client.hpp"
#include "network.hpp"
#include "utxo.hpp"

namespace bitcli {

// Reads address state and fee estimates from an Esplora-compatible explorer
//
// Every call resolves the API base URL first, so a network without one fails
// with UnsupportedNetwork before any request is made.
class ChainDataFetcher {
public:
    ChainDataFetcher(HttpClient& http, Network network,
                     std::optional<std::string> api_url_override = std::nullopt);

    // Confirmed balance: chain_stats.funded_txo_sum - chain_stats.spent_txo_sum
    uint64_t fetch_balance(const std::string& address) const;

    // All UTXOs the explorer reports for the address, unfiltered
    std::vector<Utxo> fetch_utxos(const std::string& address) const;

    // fastestFee / halfHourFee / minimumFee mapped to high / medium / low
    FeeRates fetch_fee_rates() const;

    Network network() const { return network_; }

private:
    std::string get_body(const std::string& path) const;

    HttpClient& http_;
    Network network_;
    std::optional<std::string> api_url_override_;
};

} // namespace bitcli
