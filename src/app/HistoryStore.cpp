#include "app/HistoryStore.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"
#include "core/MonthlyAggregator.h"
#include "domain/Dates.hpp"

namespace app {
namespace {

std::vector<domain::DailyCandle> capped(const std::vector<domain::DailyCandle>& series, std::size_t limit) {
    if (limit == 0 || limit >= series.size()) {
        return series;
    }
    return std::vector<domain::DailyCandle>(series.begin(), series.begin() + static_cast<std::ptrdiff_t>(limit));
}

domain::Instrument requireInstrument(const domain::Instrument& raw, const char* operation) {
    auto instrument = domain::normalize_instrument(raw);
    if (instrument.empty()) {
        throw std::invalid_argument(std::string{operation} + ": instrument must not be empty");
    }
    return instrument;
}

}  // namespace

HistoryStore::HistoryStore(domain::IPriceHistoryRepo& repo, TodayProvider today, ClockProvider clock)
    : repo_(repo),
      today_(today ? std::move(today) : TodayProvider{&domain::todayIsoDate}),
      clock_(clock ? std::move(clock) : ClockProvider{&domain::nowUnixSeconds}) {}

core::PriceCache::Snapshot HistoryStore::loadFiltered(const domain::Instrument& instrument) {
    if (auto cached = cache_.find(instrument)) {
        return cached;
    }

    const auto ticket = cache_.ticket(instrument);
    auto filtered = filter_.filter(repo_.fetchDailyAscending(instrument));
    std::reverse(filtered.begin(), filtered.end());

    auto snapshot = std::make_shared<const std::vector<domain::DailyCandle>>(std::move(filtered));
    if (!cache_.storeIfCurrent(instrument, ticket, snapshot)) {
        LOG_DEBUG("HistoryStore skipped caching stale series for " << instrument);
    }
    return snapshot;
}

std::vector<domain::DailyCandle> HistoryStore::getDaily(const domain::Instrument& instrument, std::size_t limit) {
    const auto key = domain::normalize_instrument(instrument);
    if (key.empty()) {
        return {};
    }
    return capped(*loadFiltered(key), limit);
}

std::vector<domain::DailyCandle> HistoryStore::getRecent(const domain::Instrument& instrument, int days) {
    if (days <= 0) {
        return {};
    }
    const auto key = domain::normalize_instrument(instrument);
    if (key.empty()) {
        return {};
    }

    const auto cutoff = domain::shiftIsoDate(today_(), -days);
    const auto series = loadFiltered(key);

    std::vector<domain::DailyCandle> recent;
    for (const auto& candle : *series) {
        if (candle.date < cutoff) {
            break;
        }
        recent.push_back(candle);
    }
    return recent;
}

std::vector<domain::MonthlyAggregate> HistoryStore::getMonthly(const domain::Instrument& instrument,
                                                               std::size_t limit) {
    const auto key = domain::normalize_instrument(instrument);
    if (key.empty()) {
        return {};
    }
    return repo_.fetchMonthly(key, limit);
}

SyncResult HistoryStore::sync(const domain::Instrument& instrument, std::vector<domain::DailyCandle> candles) {
    const auto key = requireInstrument(instrument, "sync");

    SyncResult result{};
    result.received = candles.size();
    if (candles.empty()) {
        LOG_DEBUG("HistoryStore sync for " << key << " received no candles");
        return result;
    }

    // Keyed by date so a repeated date keeps its last occurrence.
    std::map<domain::IsoDate, domain::DailyCandle> byDate;
    for (auto& candle : candles) {
        if (!domain::parseIsoDate(candle.date)) {
            LOG_WARN("HistoryStore sync for " << key << " skipping candle with malformed date '" << candle.date
                                              << "'");
            ++result.skipped;
            continue;
        }
        auto date = candle.date;
        byDate[std::move(date)] = std::move(candle);
    }

    std::vector<domain::DailyCandle> batch;
    batch.reserve(byDate.size());
    for (auto& [date, candle] : byDate) {
        batch.push_back(std::move(candle));
    }
    if (batch.empty()) {
        return result;
    }

    const auto accepted = filter_.filter(batch);
    const auto monthly = core::aggregateByMonth(key, accepted, clock_());

    repo_.commitSync(key, batch, monthly);
    cache_.invalidate(key);

    result.stored = batch.size();
    result.accepted = accepted.size();
    result.months = monthly.size();

    LOG_INFO("HistoryStore synced " << key << ": stored=" << result.stored << " accepted=" << result.accepted
                                    << " months=" << result.months << " skipped=" << result.skipped);
    return result;
}

bool HistoryStore::hasMonthlyData(const domain::Instrument& instrument) {
    const auto key = domain::normalize_instrument(instrument);
    if (key.empty()) {
        return false;
    }
    return repo_.countMonthly(key) > 0;
}

void HistoryStore::invalidateCache(const domain::Instrument& instrument) {
    cache_.invalidate(domain::normalize_instrument(instrument));
}

void HistoryStore::invalidateAllCaches() {
    cache_.invalidateAll();
}

domain::DeleteSummary HistoryStore::deletePricesForSecurity(const domain::Instrument& instrument) {
    const auto key = requireInstrument(instrument, "deletePricesForSecurity");

    const auto summary = repo_.deleteInstrument(key);
    cache_.invalidate(key);

    LOG_INFO("HistoryStore deleted " << key << ": daily=" << summary.dailyRows
                                     << " monthly=" << summary.monthlyRows);
    return summary;
}

core::RepairReport HistoryStore::repairReport(const domain::Instrument& instrument) {
    const auto key = domain::normalize_instrument(instrument);
    if (key.empty()) {
        return {};
    }
    return repairer_.validateAndInterpolate(repo_.fetchDailyAscending(key), {});
}

}  // namespace app
