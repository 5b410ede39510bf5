#include "chain_data.hpp"
#include "error.hpp"
#include "json_fields.hpp"
#include <nlohmann/json.hpp>

namespace bitcli {

using json = nlohmann::json;

namespace {

[[noreturn]] void decode_error(const std::string& what, const json::exception& e) {
    throw WalletError(WalletError::ErrorType::DecodeError,
        "Failed to parse " + what + " response: " + std::string(e.what()));
}

} // namespace

ChainDataFetcher::ChainDataFetcher(HttpClient& http, Network network,
                                   std::optional<std::string> api_url_override)
    : http_(http)
    , network_(network)
    , api_url_override_(std::move(api_url_override))
{}

// GET {base}{path}; anything but a 2xx answer is a NetworkError carrying the
// status and body
std::string ChainDataFetcher::get_body(const std::string& path) const {
    const std::string url = resolve_api_url(network_, api_url_override_) + path;
    auto response = http_.get(url);
    if (!response.ok()) {
        throw WalletError(WalletError::ErrorType::NetworkError,
            "GET " + url + " returned HTTP " + std::to_string(response.status) + ": " + response.body);
    }
    return response.body;
}

uint64_t ChainDataFetcher::fetch_balance(const std::string& address) const {
    auto body = get_body("/api/address/" + address);

    uint64_t funded = 0;
    uint64_t spent = 0;
    try {
        json data = json::parse(body);
        const auto& chain_stats = data.at("chain_stats");
        funded = unsigned_field<uint64_t>(chain_stats, "funded_txo_sum");
        spent = unsigned_field<uint64_t>(chain_stats, "spent_txo_sum");
    } catch (const json::exception& e) {
        decode_error("balance", e);
    }

    if (spent > funded) {
        throw WalletError(WalletError::ErrorType::DecodeError,
            "Explorer reports more spent than funded for " + address);
    }
    return funded - spent;
}

std::vector<Utxo> ChainDataFetcher::fetch_utxos(const std::string& address) const {
    auto body = get_body("/api/address/" + address + "/utxo");

    try {
        json data = json::parse(body);
        if (!data.is_array()) {
            throw WalletError(WalletError::ErrorType::DecodeError, "UTXO response is not an array");
        }
        return data.get<std::vector<Utxo>>();
    } catch (const json::exception& e) {
        decode_error("UTXO", e);
    }
}

// mempool.space /api/v1/fees/recommended:
// {"fastestFee": 12, "halfHourFee": 10, "hourFee": 8, "economyFee": 4, "minimumFee": 2}
// hourFee and economyFee must be present but are not used.
FeeRates ChainDataFetcher::fetch_fee_rates() const {
    auto body = get_body("/api/v1/fees/recommended");

    try {
        json data = json::parse(body);
        FeeRates rates{
            .low = unsigned_field<uint32_t>(data, "minimumFee"),
            .medium = unsigned_field<uint32_t>(data, "halfHourFee"),
            .high = unsigned_field<uint32_t>(data, "fastestFee")
        };
        (void)unsigned_field<uint32_t>(data, "hourFee");
        (void)unsigned_field<uint32_t>(data, "economyFee");
        return rates;
    } catch (const json::exception& e) {
        decode_error("fee estimate", e);
    }
}

} // namespace bitcli
