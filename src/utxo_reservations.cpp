#include "utxo_reservations.hpp"

namespace bitcli {

UtxoLease::UtxoLease(UtxoReservations* owner, std::vector<Utxo> utxos)
    : owner_(owner)
    , utxos_(std::move(utxos))
{}

UtxoLease::UtxoLease(UtxoLease&& other) noexcept
    : owner_(other.owner_)
    , utxos_(std::move(other.utxos_)) {
    other.owner_ = nullptr;
}

UtxoLease& UtxoLease::operator=(UtxoLease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        utxos_ = std::move(other.utxos_);
        other.owner_ = nullptr;
    }
    return *this;
}

UtxoLease::~UtxoLease() {
    release();
}

void UtxoLease::commit() {
    if (owner_) {
        owner_->commit(utxos_);
        owner_ = nullptr;
    }
}

void UtxoLease::release() {
    if (owner_) {
        owner_->release(utxos_);
        owner_ = nullptr;
    }
}

UtxoLease UtxoReservations::acquire(const std::vector<Utxo>& offered) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Utxo> leased;
    leased.reserve(offered.size());
    for (const auto& utxo : offered) {
        if (reserved_.insert(utxo.outpoint_key()).second) {
            leased.push_back(utxo);
        }
    }
    return UtxoLease(this, std::move(leased));
}

void UtxoReservations::prune_spent(const std::vector<Utxo>& listed) {
    std::set<std::string> still_listed;
    for (const auto& utxo : listed) {
        still_listed.insert(utxo.outpoint_key());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = committed_.begin(); it != committed_.end();) {
        if (still_listed.count(*it) == 0) {
            reserved_.erase(*it);
            it = committed_.erase(it);
        } else {
            ++it;
        }
    }
}

bool UtxoReservations::is_reserved(const Utxo& utxo) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.count(utxo.outpoint_key()) > 0;
}

size_t UtxoReservations::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_.size();
}

void UtxoReservations::commit(const std::vector<Utxo>& utxos) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& utxo : utxos) {
        committed_.insert(utxo.outpoint_key());
    }
}

void UtxoReservations::release(const std::vector<Utxo>& utxos) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& utxo : utxos) {
        reserved_.erase(utxo.outpoint_key());
    }
}

} // namespace bitcli
