#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "chain_data.hpp"
#include "fee_estimator.hpp"
#include "key_material.hpp"
#include "transaction.hpp"
#include "utxo.hpp"

namespace bitcli {

// Assembles the unsigned payment transaction for a send.
//
// Every UTXO handed in becomes an input, in the given order. The outputs are
// always [payment, change], with the change output kept even at zero value.
class TxBuilder {
public:
    static constexpr size_t OUTPUT_COUNT = 2;

    TxBuilder(const ChainDataFetcher& fetcher, const KeyMaterial& key);

    // Fetches fee rates, then builds. Throws WalletError with
    // InsufficientFunds, InvalidAddress, DecodeError (bad UTXO txid) or any
    // fetcher error.
    Transaction build(const std::string& recipient_address, uint64_t amount,
                      const std::vector<Utxo>& utxos, FeeTier tier = FeeTier::High) const;

    // Same, with fee rates already known; makes no network calls
    Transaction build_with_rates(const std::string& recipient_address, uint64_t amount,
                                 const std::vector<Utxo>& utxos, const FeeRates& rates,
                                 FeeTier tier = FeeTier::High) const;

    // Output script for a recipient on the wallet's network;
    // throws WalletError(InvalidAddress)
    std::vector<uint8_t> recipient_script(const std::string& address) const;

private:
    const ChainDataFetcher& fetcher_;
    const KeyMaterial& key_;
};

} // namespace bitcli
