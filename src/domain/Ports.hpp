#pragma once

#include <cstddef>
#include <vector>

#include "domain/Types.h"

namespace domain {

class IPriceHistoryRepo {
public:
    virtual ~IPriceHistoryRepo() = default;

    // Raw daily rows for one instrument, oldest first.
    virtual DailySeries fetchDailyAscending(const Instrument& instrument) const = 0;

    // Upserts `daily` keyed by (instrument, date) and replaces the monthly rows
    // named by `monthly`, all in one transaction. Throws PersistenceError.
    virtual void commitSync(const Instrument& instrument,
                            const DailySeries& daily,
                            const std::vector<MonthlyAggregate>& monthly) = 0;

    // Newest year-month first; limit 0 means unlimited.
    virtual std::vector<MonthlyAggregate> fetchMonthly(const Instrument& instrument,
                                                       std::size_t limit) const = 0;

    virtual std::size_t countMonthly(const Instrument& instrument) const = 0;

    virtual DeleteSummary deleteInstrument(const Instrument& instrument) = 0;
};

class IDailyPriceSource {
public:
    virtual ~IDailyPriceSource() = default;

    // Inclusive date window, both bounds YYYY-MM-DD.
    virtual DailySeries fetchDaily(const Instrument& instrument,
                                   const IsoDate& fromDate,
                                   const IsoDate& toDate) = 0;
};

}  // namespace domain
