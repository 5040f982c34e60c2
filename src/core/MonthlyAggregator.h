#pragma once

#include <vector>

#include "domain/Types.h"

namespace core {

// Groups candles by YYYY-MM and averages Close and adjusted Close (falling
// back to Close when the adjusted value is missing). Output is oldest month first.
std::vector<domain::MonthlyAggregate> aggregateByMonth(const domain::Instrument& instrument,
                                                       const std::vector<domain::DailyCandle>& candles,
                                                       domain::UnixSeconds createdAt);

}  // namespace core
