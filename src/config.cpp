#include "config.hpp"
#include "error.hpp"
#include <cstdlib>

namespace bitcli {

namespace {

[[noreturn]] void config_error(const std::string& what) {
    throw WalletError(WalletError::ErrorType::ConfigError, what);
}

std::optional<std::string> non_empty(const Config::Lookup& lookup, const std::string& name) {
    auto value = lookup(name);
    if (value && value->empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    if (auto value = non_empty(lookup, "BITCLI_NETWORK")) {
        auto network = parse_network(*value);
        if (!network) {
            config_error("Unknown network in BITCLI_NETWORK: " + *value);
        }
        config.network = *network;
    }

    config.api_url = non_empty(lookup, "BITCLI_API_URL");

    if (auto value = non_empty(lookup, "BITCLI_FEE_TIER")) {
        auto tier = parse_fee_tier(*value);
        if (!tier) {
            config_error("Unknown fee tier in BITCLI_FEE_TIER: " + *value);
        }
        config.fee_tier = *tier;
    }

    if (auto value = non_empty(lookup, "BITCLI_HTTP_TIMEOUT")) {
        try {
            size_t consumed = 0;
            long timeout = std::stol(*value, &consumed);
            if (consumed != value->size() || timeout <= 0) {
                config_error("BITCLI_HTTP_TIMEOUT must be a positive number of seconds: " + *value);
            }
            config.http_timeout_seconds = timeout;
        } catch (const std::logic_error&) {
            config_error("BITCLI_HTTP_TIMEOUT must be a positive number of seconds: " + *value);
        }
    }

    if (auto value = non_empty(lookup, "BITCLI_VERBOSE")) {
        config.verbose = *value != "0";
    }

    // BITCLI_DATA_DIR, else $XDG_DATA_HOME/bitcli, else ~/.local/share/bitcli
    if (auto value = non_empty(lookup, "BITCLI_DATA_DIR")) {
        config.data_dir = *value;
    } else if (auto xdg = non_empty(lookup, "XDG_DATA_HOME")) {
        config.data_dir = std::filesystem::path(*xdg) / DATA_DIR_NAME;
    } else if (auto home = non_empty(lookup, "HOME")) {
        config.data_dir = std::filesystem::path(*home) / ".local" / "share" / DATA_DIR_NAME;
    } else {
        config_error("Cannot determine data directory: set BITCLI_DATA_DIR or HOME");
    }

    return config;
}

Config Config::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

} // namespace bitcli
