#pragma once

#include <vector>

#include "core/OhlcValidator.h"
#include "domain/Types.h"

namespace core {

// Read-time exclusion: the same rules as OhlcValidator, but a candle with any
// invalid field is dropped rather than repaired.
class PriceFilter {
public:
    PriceFilter() = default;
    explicit PriceFilter(OhlcValidator validator) : validator_(validator) {}

    // Input oldest first; output keeps that order.
    std::vector<domain::DailyCandle> filter(const std::vector<domain::DailyCandle>& candles) const;

    // Reason of the first failing rule, ValidationReason::None when accepted.
    ValidationReason evaluate(const domain::DailyCandle& candle,
                              const domain::DailyCandle* previous,
                              const std::vector<domain::DailyCandle>& context) const;

private:
    OhlcValidator validator_{};
};

}  // namespace core
