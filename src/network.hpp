#pragma once

#include <optional>
#include <string>

namespace bitcli {

enum class Network {
    Main,
    Test,
    Signet,
    Regtest
};

// Display name, e.g. "bitcoin" or "testnet"
std::string network_name(Network network);

// Parses "main"/"mainnet"/"bitcoin", "test"/"testnet", "signet", "regtest"
std::optional<Network> parse_network(const std::string& name);

// Bech32 human readable part for addresses on this network
std::string bech32_hrp(Network network);

// Base URL of the block explorer for this network, if one is known
std::optional<std::string> default_api_url(Network network);

// The override if set, else default_api_url, without a trailing slash.
// Throws WalletError(UnsupportedNetwork) when neither exists.
std::string resolve_api_url(Network network, const std::optional<std::string>& override_url);

} // namespace bitcli
