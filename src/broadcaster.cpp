#include "broadcaster.hpp"
#include "error.hpp"
#include "hex_utils.hpp"

namespace bitcli {

namespace {

std::string trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    auto begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

} // namespace

Broadcaster::Broadcaster(HttpClient& http, Network network,
                         std::optional<std::string> api_url_override)
    : http_(http)
    , network_(network)
    , api_url_override_(std::move(api_url_override))
{}

// The body is the raw transaction as hex; on success the explorer answers
// with the txid as plain text, on failure with the node's rejection reason
// (e.g. "min relay fee not met").
std::string Broadcaster::broadcast(const Transaction& tx) const {
    const std::string url = resolve_api_url(network_, api_url_override_) + "/api/tx";
    const std::string raw_tx_hex = HexUtils::encode(TxCodec::serialize(tx));

    auto response = http_.post(url, raw_tx_hex, "text/plain");
    if (!response.ok()) {
        throw WalletError(WalletError::ErrorType::BroadcastError, response.body);
    }
    return trim(response.body);
}

} // namespace bitcli
