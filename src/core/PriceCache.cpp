#include "core/PriceCache.h"

#include <mutex>
#include <utility>

namespace core {

PriceCache::Snapshot PriceCache::ensureValid(Snapshot series) {
    if (series) {
        return series;
    }
    return std::make_shared<const std::vector<domain::DailyCandle>>();
}

PriceCache::Snapshot PriceCache::find(const domain::Instrument& instrument) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = entries_.find(instrument);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

PriceCache::Ticket PriceCache::ticket(const domain::Instrument& instrument) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    Ticket result{};
    result.epoch = epoch_;
    if (const auto it = generations_.find(instrument); it != generations_.end()) {
        result.generation = it->second;
    }
    return result;
}

bool PriceCache::storeIfCurrent(const domain::Instrument& instrument, const Ticket& ticket, Snapshot series) {
    auto safe = ensureValid(std::move(series));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (ticket.epoch != epoch_) {
        return false;
    }
    std::uint64_t generation = 0;
    if (const auto it = generations_.find(instrument); it != generations_.end()) {
        generation = it->second;
    }
    if (ticket.generation != generation) {
        return false;
    }
    entries_[instrument] = std::move(safe);
    return true;
}

void PriceCache::invalidate(const domain::Instrument& instrument) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(instrument);
    ++generations_[instrument];
}

void PriceCache::invalidateAll() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    // The epoch bump already makes every outstanding ticket stale.
    generations_.clear();
    ++epoch_;
}

std::size_t PriceCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::size_t PriceCache::trackedGenerations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return generations_.size();
}

}  // namespace core
