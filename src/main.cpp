// bitcli command line wallet
//
// Entry point for a single-address Bitcoin wallet. The wallet key is derived
// from a BIP39 mnemonic that is kept in the data directory between runs; all
// chain data comes from a mempool.space-style block explorer.
//
// Commands (aliases in brackets):
// - create [c]                         new wallet from a freshly generated mnemonic
// - mnemonic [m] <words...>            import a wallet from a mnemonic phrase
// - send [s] <address> <sats> [tier]   pay a segwit address, tier low|medium|high
// - balance [b]                        confirmed balance in satoshis
// - address [a]                        the wallet's receive address
// - network [n]                        the configured network
// - reset [r]                          delete the stored mnemonic
//
// Settings come from BITCLI_* environment variables, see config.hpp.

#include "config.hpp"
#include "curl_http_client.hpp"
#include "error.hpp"
#include "fee_estimator.hpp"
#include "key_material.hpp"
#include "mnemonic_store.hpp"
#include "wallet.hpp"
#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage() {
    std::cout << "Usage: bitcli <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  create, c                        Create a wallet with a new mnemonic\n"
              << "  mnemonic, m <words...>           Import a wallet from a mnemonic phrase\n"
              << "  send, s <address> <sats> [tier]  Send bitcoin (tier: low, medium, high)\n"
              << "  balance, b                       Show the confirmed balance\n"
              << "  address, a                       Show the wallet address\n"
              << "  network, n                       Show the wallet network\n"
              << "  reset, r                         Delete the stored mnemonic\n"
              << "  help                             Show this message\n";
}

// Strict decimal parse; rejects signs, spaces and overflow
std::optional<uint64_t> parse_amount(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string canonical_command(const std::string& command) {
    if (command == "c") return "create";
    if (command == "m") return "mnemonic";
    if (command == "s") return "send";
    if (command == "b") return "balance";
    if (command == "a") return "address";
    if (command == "n") return "network";
    if (command == "r") return "reset";
    return command;
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string command = canonical_command(args[0]);
    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    try {
        auto config = bitcli::Config::from_env();

        bitcli::FileMnemonicStore store(config.data_dir);
        bitcli::CurlHttpClient http(config.http_timeout_seconds);

        bitcli::Wallet::Options options;
        options.api_url = config.api_url;
        options.fee_tier = config.fee_tier;
        options.log = config.verbose ? &std::clog : nullptr;

        if (command == "create") {
            auto wallet = bitcli::Wallet::create(config.network, store, http, options);
            std::cout << "Wallet created" << std::endl;
            std::cout << "Mnemonic: " << store.load() << std::endl;
            std::cout << "Network: " << bitcli::network_name(wallet.network()) << std::endl;
            std::cout << "Address: " << wallet.address() << std::endl;
            return 0;
        }

        if (command == "mnemonic") {
            if (args.size() < 2) {
                std::cerr << "Usage: bitcli mnemonic <words...>" << std::endl;
                return 1;
            }
            std::string phrase;
            for (size_t i = 1; i < args.size(); ++i) {
                if (i > 1) phrase += ' ';
                phrase += args[i];
            }
            auto wallet = bitcli::Wallet::from_mnemonic(phrase, config.network, store, http, options);
            std::cout << "Wallet imported" << std::endl;
            std::cout << "Network: " << bitcli::network_name(wallet.network()) << std::endl;
            std::cout << "Address: " << wallet.address() << std::endl;
            return 0;
        }

        if (command != "send" && command != "balance" && command != "address" &&
            command != "network" && command != "reset") {
            std::cerr << "Unknown command: " << args[0] << std::endl;
            print_usage();
            return 1;
        }

        // Everything else works on the stored wallet
        const auto mnemonic = store.load();
        if (mnemonic.empty()) {
            std::cout << "Wallet not initialized" << std::endl;
            return 1;
        }

        if (command == "reset") {
            store.reset();
            std::cout << "Wallet reset" << std::endl;
            return 0;
        }

        bitcli::Wallet wallet(bitcli::KeyMaterial::from_mnemonic(mnemonic, config.network), http, options);

        if (command == "address") {
            std::cout << "Address: " << wallet.address() << std::endl;
        } else if (command == "network") {
            std::cout << bitcli::network_name(wallet.network()) << std::endl;
        } else if (command == "balance") {
            std::cerr << "Fetching balance..." << std::endl;
            std::cout << "Balance: " << wallet.balance() << std::endl;
        } else if (command == "send") {
            if (args.size() < 3 || args.size() > 4) {
                std::cerr << "Usage: bitcli send <address> <sats> [low|medium|high]" << std::endl;
                return 1;
            }
            auto amount = parse_amount(args[2]);
            if (!amount) {
                std::cerr << "Invalid amount: " << args[2] << std::endl;
                return 1;
            }
            auto tier = config.fee_tier;
            if (args.size() == 4) {
                auto parsed = bitcli::parse_fee_tier(args[3]);
                if (!parsed) {
                    std::cerr << "Invalid fee tier: " << args[3] << std::endl;
                    return 1;
                }
                tier = *parsed;
            }

            std::cerr << "Sending transaction..." << std::endl;
            auto txid = wallet.send(args[1], *amount, tier);
            std::cout << "Transaction submitted successfully: " << txid << std::endl;
        }
    } catch (const bitcli::WalletError& e) {
        // The explorer's rejection text is the useful part of a broadcast failure
        if (e.type() == bitcli::WalletError::ErrorType::BroadcastError) {
            std::cerr << "Error submitting transaction: " << e.what() << std::endl;
        } else {
            std::cerr << "Error: " << bitcli::WalletError::type_name(e.type()) << ": " << e.what() << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
