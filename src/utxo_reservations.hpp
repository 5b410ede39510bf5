#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "utxo.hpp"

namespace bitcli {

class UtxoReservations;

// Outpoints held by one in-flight send.
// Destroying an uncommitted lease releases its outpoints; commit() keeps
// them reserved until the explorer stops listing them.
class UtxoLease {
public:
    UtxoLease(UtxoLease&& other) noexcept;
    UtxoLease& operator=(UtxoLease&& other) noexcept;
    ~UtxoLease();

    UtxoLease(const UtxoLease&) = delete;
    UtxoLease& operator=(const UtxoLease&) = delete;

    // The UTXOs this lease holds, in the order they were offered
    const std::vector<Utxo>& utxos() const { return utxos_; }

    // Marks the outpoints as spent; they stay reserved
    void commit();

    // Returns the outpoints to the pool now
    void release();

private:
    friend class UtxoReservations;
    UtxoLease(UtxoReservations* owner, std::vector<Utxo> utxos);

    UtxoReservations* owner_;
    std::vector<Utxo> utxos_;
};

// In-memory set of outpoints claimed by sends on one wallet
class UtxoReservations {
public:
    // Leases every offered UTXO that is not already reserved
    UtxoLease acquire(const std::vector<Utxo>& offered);

    // Drops committed outpoints missing from the explorer's current UTXO
    // list. Outpoints of leases still in flight are kept.
    void prune_spent(const std::vector<Utxo>& listed);

    bool is_reserved(const Utxo& utxo) const;
    size_t size() const;

private:
    friend class UtxoLease;
    void release(const std::vector<Utxo>& utxos);
    void commit(const std::vector<Utxo>& utxos);

    mutable std::mutex mutex_;
    std::set<std::string> reserved_;
    std::set<std::string> committed_;
};

} // namespace bitcli
