#pragma once

#include <cstddef>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckStore;

class DuckPriceRepo : public domain::IPriceHistoryRepo {
public:
    explicit DuckPriceRepo(DuckStore& store);

    domain::DailySeries fetchDailyAscending(const domain::Instrument& instrument) const override;

    void commitSync(const domain::Instrument& instrument,
                    const domain::DailySeries& daily,
                    const std::vector<domain::MonthlyAggregate>& monthly) override;

    std::vector<domain::MonthlyAggregate> fetchMonthly(const domain::Instrument& instrument,
                                                       std::size_t limit) const override;

    std::size_t countMonthly(const domain::Instrument& instrument) const override;

    domain::DeleteSummary deleteInstrument(const domain::Instrument& instrument) override;

private:
    DuckStore& store_;
};

}  // namespace adapters::duckdb
