#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "domain/Types.h"

namespace core {

// Per-instrument filtered series, newest first. Entries are immutable
// snapshots; the lock only guards the map itself.
class PriceCache {
public:
    using Snapshot = std::shared_ptr<const std::vector<domain::DailyCandle>>;

    // Taken before a miss is computed; storeIfCurrent rejects the result if
    // the instrument was invalidated in between.
    struct Ticket {
        std::uint64_t epoch{0};
        std::uint64_t generation{0};
    };

    Snapshot find(const domain::Instrument& instrument) const;
    Ticket ticket(const domain::Instrument& instrument) const;
    bool storeIfCurrent(const domain::Instrument& instrument, const Ticket& ticket, Snapshot series);

    void invalidate(const domain::Instrument& instrument);
    void invalidateAll();

    std::size_t size() const;
    // Instruments with a bumped generation since the last invalidateAll.
    std::size_t trackedGenerations() const;

private:
    static Snapshot ensureValid(Snapshot series);

    mutable std::shared_mutex mutex_;
    std::unordered_map<domain::Instrument, Snapshot> entries_;
    std::unordered_map<domain::Instrument, std::uint64_t> generations_;
    std::uint64_t epoch_{0};
};

}  // namespace core
