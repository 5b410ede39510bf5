#pragma once

#include <string>
#include <optional>
#include "http_client.hpp"
#include "network.hpp"
#include "transaction.hpp"

namespace bitcli {

// Submits signed transactions to the explorer's POST /api/tx endpoint
class Broadcaster {
public:
    Broadcaster(HttpClient& http, Network network,
                std::optional<std::string> api_url_override = std::nullopt);

    // Returns the txid the explorer accepted. A rejection throws
    // WalletError(BroadcastError) whose message is the explorer's reply verbatim.
    std::string broadcast(const Transaction& tx) const;

private:
    HttpClient& http_;
    Network network_;
    std::optional<std::string> api_url_override_;
};

} // namespace bitcli
