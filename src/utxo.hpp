#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "json_fields.hpp"

namespace bitcli {

// An unspent output as reported by the explorer's /utxo endpoint
struct Utxo {
    std::string txid;                       // Transaction ID, hex in display order
    uint32_t vout = 0;                      // Output index in transaction
    uint64_t value = 0;                     // Amount in satoshis
    bool confirmed = false;
    std::optional<uint32_t> block_height;
    std::optional<std::string> block_hash;
    std::optional<uint64_t> block_time;

    // "txid:vout", the key used for reservations
    std::string outpoint_key() const { return txid + ":" + std::to_string(vout); }
};

// Esplora layout:
// {"txid": "...", "vout": 0, "value": 1000,
//  "status": {"confirmed": true, "block_height": 1, "block_hash": "...", "block_time": 1}}
// Unconfirmed entries carry only "confirmed": false in their status.
inline void from_json(const nlohmann::json& j, Utxo& utxo) {
    j.at("txid").get_to(utxo.txid);
    utxo.vout = unsigned_field<uint32_t>(j, "vout");
    utxo.value = unsigned_field<uint64_t>(j, "value");

    const auto& status = j.at("status");
    status.at("confirmed").get_to(utxo.confirmed);

    auto optional_field = [&status](const char* name, auto& target) {
        using T = typename std::decay_t<decltype(target)>::value_type;
        auto it = status.find(name);
        if (it == status.end() || it->is_null()) {
            target.reset();
        } else if constexpr (std::is_integral_v<T>) {
            target = unsigned_value<T>(*it, name);
        } else {
            target = it->template get<T>();
        }
    };
    optional_field("block_height", utxo.block_height);
    optional_field("block_hash", utxo.block_hash);
    optional_field("block_time", utxo.block_time);
}

} // namespace bitcli
