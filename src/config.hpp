#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "fee_estimator.hpp"
#include "network.hpp"

namespace bitcli {

// Defaults used when the environment does not say otherwise
constexpr Network DEFAULT_NETWORK = Network::Test;
constexpr FeeTier DEFAULT_FEE_TIER = FeeTier::High;
constexpr long DEFAULT_HTTP_TIMEOUT_SECONDS = 30;
constexpr auto DATA_DIR_NAME = "bitcli";

// Runtime settings, read once at startup
//
// BITCLI_NETWORK       main | testnet | signet | regtest
// BITCLI_API_URL       explorer base URL, overrides the network default
// BITCLI_FEE_TIER      low | medium | high
// BITCLI_DATA_DIR      directory holding mnemonic.txt
// BITCLI_HTTP_TIMEOUT  request timeout in seconds
// BITCLI_VERBOSE       1 to log each send stage to stderr
struct Config {
    Network network = DEFAULT_NETWORK;
    std::optional<std::string> api_url;
    FeeTier fee_tier = DEFAULT_FEE_TIER;
    std::filesystem::path data_dir;
    long http_timeout_seconds = DEFAULT_HTTP_TIMEOUT_SECONDS;
    bool verbose = false;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    // Throws WalletError(ConfigError) on an unparsable value or when no data
    // directory can be determined
    static Config from_lookup(const Lookup& lookup);
    static Config from_env();
};

} // namespace bitcli
