#include "network.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>

namespace bitcli {

std::string network_name(Network network) {
    switch (network) {
        case Network::Main: return "bitcoin";
        case Network::Test: return "testnet";
        case Network::Signet: return "signet";
        case Network::Regtest: return "regtest";
    }
    return "unknown";
}

std::optional<Network> parse_network(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "main" || lower == "mainnet" || lower == "bitcoin") return Network::Main;
    if (lower == "test" || lower == "testnet") return Network::Test;
    if (lower == "signet") return Network::Signet;
    if (lower == "regtest") return Network::Regtest;
    return std::nullopt;
}

// Testnet and signet share the "tb" prefix, so an address alone cannot tell
// them apart
std::string bech32_hrp(Network network) {
    switch (network) {
        case Network::Main: return "bc";
        case Network::Test: return "tb";
        case Network::Signet: return "tb";
        case Network::Regtest: return "bcrt";
    }
    return "";
}

// Only mainnet and testnet4 have a public explorer configured; other
// networks need an explicit override
std::optional<std::string> default_api_url(Network network) {
    switch (network) {
        case Network::Main: return std::string("https://mempool.space");
        case Network::Test: return std::string("https://mempool.space/testnet4");
        case Network::Signet:
        case Network::Regtest:
            return std::nullopt;
    }
    return std::nullopt;
}

std::string resolve_api_url(Network network, const std::optional<std::string>& override_url) {
    std::string url;
    if (override_url && !override_url->empty()) {
        url = *override_url;
    } else if (auto known = default_api_url(network)) {
        url = *known;
    } else {
        throw WalletError(WalletError::ErrorType::UnsupportedNetwork,
                          "No explorer API configured for network " + network_name(network));
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace bitcli
