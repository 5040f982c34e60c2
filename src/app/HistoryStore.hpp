#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "core/PriceCache.h"
#include "core/PriceFilter.h"
#include "core/PriceRepairer.h"
#include "domain/Ports.hpp"
#include "domain/Types.h"

namespace app {

struct SyncResult {
    std::size_t received{0};
    std::size_t stored{0};
    std::size_t accepted{0};
    std::size_t months{0};
    std::size_t skipped{0};
};

// Owns persistence of raw daily candles and their monthly aggregates, and
// serves filtered series through a per-instrument cache.
class HistoryStore {
public:
    using TodayProvider = std::function<domain::IsoDate()>;
    using ClockProvider = std::function<domain::UnixSeconds()>;

    explicit HistoryStore(domain::IPriceHistoryRepo& repo,
                          TodayProvider today = {},
                          ClockProvider clock = {});

    // Filtered, newest first, at most `limit` entries (0 = all).
    std::vector<domain::DailyCandle> getDaily(const domain::Instrument& instrument, std::size_t limit = 0);

    // Filtered candles dated on or after today - days; empty when days <= 0.
    std::vector<domain::DailyCandle> getRecent(const domain::Instrument& instrument, int days);

    std::vector<domain::MonthlyAggregate> getMonthly(const domain::Instrument& instrument, std::size_t limit = 0);

    SyncResult sync(const domain::Instrument& instrument, std::vector<domain::DailyCandle> candles);

    bool hasMonthlyData(const domain::Instrument& instrument);

    void invalidateCache(const domain::Instrument& instrument);
    void invalidateAllCaches();

    domain::DeleteSummary deletePricesForSecurity(const domain::Instrument& instrument);

    // Gap-free rendition of the stored raw series with a log of every repair.
    core::RepairReport repairReport(const domain::Instrument& instrument);

    std::size_t cachedInstrumentCount() const { return cache_.size(); }

private:
    core::PriceCache::Snapshot loadFiltered(const domain::Instrument& instrument);

    domain::IPriceHistoryRepo& repo_;
    TodayProvider today_;
    ClockProvider clock_;
    core::PriceFilter filter_{};
    core::PriceRepairer repairer_{};
    core::PriceCache cache_{};
};

}  // namespace app
