#include "tx_builder.hpp"
#include "bech32.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "segwit.hpp"

namespace bitcli {

TxBuilder::TxBuilder(const ChainDataFetcher& fetcher, const KeyMaterial& key)
    : fetcher_(fetcher)
    , key_(key)
{}

Transaction TxBuilder::build(const std::string& recipient_address, uint64_t amount,
                             const std::vector<Utxo>& utxos, FeeTier tier) const {
    auto rates = fetcher_.fetch_fee_rates();
    return build_with_rates(recipient_address, amount, utxos, rates, tier);
}

// Only segwit addresses are accepted, and only those whose human readable
// part matches the wallet's network. Legacy base58 addresses are rejected.
std::vector<uint8_t> TxBuilder::recipient_script(const std::string& address) const {
    auto decoded = Bech32::decode_segwit(address);
    if (!decoded) {
        throw WalletError(WalletError::ErrorType::InvalidAddress,
                          "Invalid address: " + address);
    }
    if (decoded->hrp != bech32_hrp(key_.network())) {
        throw WalletError(WalletError::ErrorType::InvalidAddress,
                          "Address " + address + " is not valid for network " + network_name(key_.network()));
    }
    return Segwit::get_witness_script_pubkey(decoded->witness_version, decoded->program);
}

// Build a payment transaction spending every given UTXO
//
// 1. fee = rate(tier) * estimate_size(inputs, 2)
// 2. total_in = sum of UTXO values
// 3. amount + fee > total_in fails with InsufficientFunds
// 4. change = total_in - amount - fee
// 5. The recipient must be a segwit address on the wallet's network
// 6. Outputs: [0] payment to the recipient, [1] change to the wallet's own script
// 7. Inputs follow UTXO order, with an empty scriptSig, an empty witness and
//    sequence 0xFFFFFFFD (opts in to replace-by-fee, no relative lock time)
Transaction TxBuilder::build_with_rates(const std::string& recipient_address, uint64_t amount,
                                        const std::vector<Utxo>& utxos, const FeeRates& rates,
                                        FeeTier tier) const {
    const uint64_t size = FeeEstimator::estimate_size(utxos.size(), OUTPUT_COUNT);
    const uint64_t fee = FeeEstimator::estimate_fee(rates.rate(tier), size);

    // Both operands stay at or below MAX_MONEY, so the sum cannot wrap
    uint64_t total_in = 0;
    for (const auto& utxo : utxos) {
        if (utxo.value > MAX_MONEY || total_in + utxo.value > MAX_MONEY) {
            throw WalletError(WalletError::ErrorType::DecodeError,
                "UTXO values add up to more than the 21M BTC supply at " + utxo.outpoint_key());
        }
        total_in += utxo.value;
    }

    // amount + fee > total_in, written so the sum cannot wrap
    if (amount > total_in || fee > total_in - amount) {
        throw WalletError(WalletError::ErrorType::InsufficientFunds,
            "Insufficient funds: need " + std::to_string(amount) + " + " + std::to_string(fee) +
            " fee, have " + std::to_string(total_in));
    }
    const uint64_t change = total_in - amount - fee;

    auto payment_script = recipient_script(recipient_address);

    Transaction tx;
    tx.version = TX_VERSION;
    tx.lock_time = TX_LOCKTIME;

    tx.inputs.reserve(utxos.size());
    for (const auto& utxo : utxos) {
        tx.inputs.push_back(TxInput{
            .prevout = Outpoint{
                .txid = TxCodec::parse_txid(utxo.txid),
                .index = utxo.vout
            },
            .script_sig = {},
            .sequence = SEQUENCE_ENABLE_RBF_NO_LOCKTIME,
            .witness = {}
        });
    }

    tx.outputs.push_back(TxOutput{.value = amount, .script_pubkey = std::move(payment_script)});
    tx.outputs.push_back(TxOutput{.value = change, .script_pubkey = key_.script_pubkey()});

    return tx;
}

} // namespace bitcli
