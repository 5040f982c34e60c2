#include "core/Interpolator.h"

#include <algorithm>
#include <initializer_list>

#include "core/PriceRules.h"
#include "domain/Dates.hpp"

namespace core {
namespace {

double typicalRatio(const domain::DailyCandle* before,
                    const domain::DailyCandle* after,
                    double domain::DailyCandle::*field,
                    double fallback) {
    double sum = 0.0;
    int count = 0;
    for (const auto* neighbour : {before, after}) {
        if (neighbour != nullptr && neighbour->close > 0.0) {
            sum += neighbour->*field / neighbour->close;
            ++count;
        }
    }
    if (count == 0) {
        return fallback;
    }
    return sum / count;
}

void copyPrices(domain::DailyCandle& target, const domain::DailyCandle& source) {
    target.open = source.open;
    target.high = source.high;
    target.low = source.low;
    target.close = source.close;
}

}  // namespace

const char* methodToString(RepairMethod method) noexcept {
    switch (method) {
    case RepairMethod::Linear:
        return "linear";
    case RepairMethod::ForwardFill:
        return "forward_fill";
    case RepairMethod::BackwardFill:
        return "backward_fill";
    case RepairMethod::Selective:
        return "selective";
    case RepairMethod::NoInterpolation:
        return "no_interpolation";
    }
    return "no_interpolation";
}

void enforceOhlcConsistency(domain::DailyCandle& candle) noexcept {
    candle.high = std::max({candle.high, candle.open, candle.close});
    candle.low = std::min({candle.low, candle.open, candle.close});
    if (candle.high < candle.low) {
        candle.high = candle.low;
    }
}

RepairOutcome Interpolator::repair(const domain::DailyCandle& candle,
                                   const OhlcVerdict& verdict,
                                   const domain::DailyCandle* before,
                                   const domain::DailyCandle* after) const {
    if (verdict.needsFullRepair()) {
        return repairFull(candle, before, after);
    }
    return repairSelective(candle, verdict, before, after);
}

RepairOutcome Interpolator::repairSelective(const domain::DailyCandle& candle,
                                            const OhlcVerdict& verdict,
                                            const domain::DailyCandle* before,
                                            const domain::DailyCandle* after) const {
    RepairOutcome outcome{candle, RepairMethod::Selective};
    auto& repaired = outcome.candle;

    if (!verdict.highValid) {
        repaired.high = repaired.close *
                        typicalRatio(before, after, &domain::DailyCandle::high, rules::kDefaultHighCloseRatio);
    }
    if (!verdict.lowValid) {
        repaired.low = repaired.close *
                       typicalRatio(before, after, &domain::DailyCandle::low, rules::kDefaultLowCloseRatio);
    }
    if (!verdict.openValid) {
        if (before != nullptr) {
            repaired.open = before->close;
        }
        else if (after != nullptr) {
            repaired.open = after->open;
        }
        else {
            repaired.open = repaired.close;
        }
    }

    enforceOhlcConsistency(repaired);
    return outcome;
}

RepairOutcome Interpolator::repairFull(const domain::DailyCandle& candle,
                                       const domain::DailyCandle* before,
                                       const domain::DailyCandle* after) const {
    RepairOutcome outcome{candle, RepairMethod::NoInterpolation};
    auto& repaired = outcome.candle;
    const auto current = domain::isoDateToUnix(candle.date);

    if (before != nullptr && after != nullptr) {
        const auto beforeTs = domain::isoDateToUnix(before->date);
        const auto afterTs = domain::isoDateToUnix(after->date);

        const auto elapsed = static_cast<double>(current - beforeTs);
        const auto span = static_cast<double>(afterTs - beforeTs);

        if (span > 0.0) {
            repaired.close = before->close + (after->close - before->close) * (elapsed / span);

            const double openRatio = (before->open / before->close + after->open / after->close) / 2.0;
            const double highRatio = (before->high / before->close + after->high / after->close) / 2.0;
            const double lowRatio = (before->low / before->close + after->low / after->close) / 2.0;

            repaired.open = repaired.close * openRatio;
            repaired.high = repaired.close * highRatio;
            repaired.low = repaired.close * lowRatio;

            enforceOhlcConsistency(repaired);
            outcome.method = RepairMethod::Linear;
            return outcome;
        }
    }

    if (before != nullptr) {
        copyPrices(repaired, *before);
        outcome.method = RepairMethod::ForwardFill;
        return outcome;
    }
    if (after != nullptr) {
        copyPrices(repaired, *after);
        outcome.method = RepairMethod::BackwardFill;
        return outcome;
    }

    return outcome;
}

}  // namespace core
