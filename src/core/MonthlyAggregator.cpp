#include "core/MonthlyAggregator.h"

#include <cstddef>
#include <map>
#include <utility>

#include "domain/Dates.hpp"

namespace core {
namespace {

struct MonthAccumulator {
    double closeSum{0};
    double adjCloseSum{0};
    std::size_t count{0};
};

}  // namespace

std::vector<domain::MonthlyAggregate> aggregateByMonth(const domain::Instrument& instrument,
                                                       const std::vector<domain::DailyCandle>& candles,
                                                       domain::UnixSeconds createdAt) {
    std::map<domain::YearMonth, MonthAccumulator> buckets;
    for (const auto& candle : candles) {
        auto& bucket = buckets[domain::yearMonthOf(candle.date)];
        bucket.closeSum += candle.close;
        bucket.adjCloseSum += candle.adjustedClose.value_or(candle.close);
        ++bucket.count;
    }

    std::vector<domain::MonthlyAggregate> aggregates;
    aggregates.reserve(buckets.size());
    for (const auto& [yearMonth, bucket] : buckets) {
        domain::MonthlyAggregate aggregate{};
        aggregate.instrument = instrument;
        aggregate.yearMonth = yearMonth;
        aggregate.avgClose = bucket.closeSum / static_cast<double>(bucket.count);
        aggregate.avgAdjClose = bucket.adjCloseSum / static_cast<double>(bucket.count);
        aggregate.createdAt = createdAt;
        aggregates.push_back(std::move(aggregate));
    }
    return aggregates;
}

}  // namespace core
