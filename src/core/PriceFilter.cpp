#include "core/PriceFilter.h"

#include <algorithm>
#include <cstddef>

#include "common/Log.hpp"
#include "core/PriceRules.h"

namespace core {

std::vector<domain::DailyCandle> PriceFilter::filter(const std::vector<domain::DailyCandle>& candles) const {
    std::vector<domain::DailyCandle> accepted;
    accepted.reserve(candles.size());

    std::vector<domain::DailyCandle> context;
    context.reserve(rules::kContextWindow);

    for (std::size_t index = 0; index < candles.size(); ++index) {
        const auto& candle = candles[index];

        const auto window = std::min(accepted.size(), rules::kContextWindow);
        context.assign(accepted.rbegin(), accepted.rbegin() + static_cast<std::ptrdiff_t>(window));
        const domain::DailyCandle* previous = accepted.empty() ? nullptr : &accepted.back();

        const auto reason = evaluate(candle, previous, context);
        if (reason == ValidationReason::None) {
            accepted.push_back(candle);
            continue;
        }

        LOG_DEBUG("Filtered out " << candle.date << " close=" << candle.close << " index=" << index
                                  << " reason=" << reasonToString(reason));
    }

    return accepted;
}

ValidationReason PriceFilter::evaluate(const domain::DailyCandle& candle,
                                       const domain::DailyCandle* previous,
                                       const std::vector<domain::DailyCandle>& context) const {
    const auto verdict = validator_.validate(candle, previous, context);
    if (verdict.allValid()) {
        return ValidationReason::None;
    }
    return verdict.reason;
}

}  // namespace core
