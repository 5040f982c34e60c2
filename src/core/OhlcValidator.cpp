#include "core/OhlcValidator.h"

#include "core/PriceRules.h"

namespace core {
namespace {

void setReasonIfUnset(OhlcVerdict& verdict, ValidationReason reason) {
    if (verdict.reason == ValidationReason::None) {
        verdict.reason = reason;
    }
}

}  // namespace

const char* reasonToString(ValidationReason reason) noexcept {
    switch (reason) {
    case ValidationReason::None:
        return "";
    case ValidationReason::CloseZeroOrNegative:
        return "close_zero_or_negative";
    case ValidationReason::HighBelowLow:
        return "high_below_low";
    case ValidationReason::HighBelowOpen:
        return "high_below_open";
    case ValidationReason::HighBelowClose:
        return "high_below_close";
    case ValidationReason::LowAboveOpen:
        return "low_above_open";
    case ValidationReason::LowAboveClose:
        return "low_above_close";
    case ValidationReason::HighExtremeRelativeToClose:
        return "high_extreme_relative_to_close";
    case ValidationReason::LowExtremeRelativeToClose:
        return "low_extreme_relative_to_close";
    case ValidationReason::SpikeDetected:
        return "spike_detected";
    case ValidationReason::CrashDetected:
        return "crash_detected";
    case ValidationReason::PriceTooHigh:
        return "price_too_high";
    case ValidationReason::PriceTooLow:
        return "price_too_low";
    }
    return "";
}

OhlcVerdict OhlcValidator::validate(const domain::DailyCandle& candle,
                                    const domain::DailyCandle* previous,
                                    const std::vector<domain::DailyCandle>& context) const {
    OhlcVerdict verdict{};

    if (candle.close <= 0.0) {
        verdict.invalidateAll(ValidationReason::CloseZeroOrNegative);
        return verdict;
    }

    if (candle.high < candle.low) {
        verdict.highValid = false;
        verdict.lowValid = false;
        setReasonIfUnset(verdict, ValidationReason::HighBelowLow);
    }
    if (candle.high < candle.open) {
        verdict.highValid = false;
        setReasonIfUnset(verdict, ValidationReason::HighBelowOpen);
    }
    if (candle.high < candle.close) {
        verdict.highValid = false;
        setReasonIfUnset(verdict, ValidationReason::HighBelowClose);
    }
    if (candle.low > candle.open) {
        verdict.lowValid = false;
        setReasonIfUnset(verdict, ValidationReason::LowAboveOpen);
    }
    if (candle.low > candle.close) {
        verdict.lowValid = false;
        setReasonIfUnset(verdict, ValidationReason::LowAboveClose);
    }

    if (candle.high > candle.close * rules::kHighCloseMaxRatio) {
        verdict.highValid = false;
        setReasonIfUnset(verdict, ValidationReason::HighExtremeRelativeToClose);
    }
    if (candle.low > 0.0 && candle.low < candle.close * rules::kLowCloseMinRatio) {
        verdict.lowValid = false;
        setReasonIfUnset(verdict, ValidationReason::LowExtremeRelativeToClose);
    }

    if (previous != nullptr && previous->close > 0.0) {
        const auto pct = rules::changePercent(candle.close, previous->close);
        if (pct > rules::kMaxChangePercent) {
            verdict.invalidateAll(ValidationReason::SpikeDetected);
        }
        else if (pct < rules::kMinChangePercent) {
            verdict.invalidateAll(ValidationReason::CrashDetected);
        }
    }

    if (verdict.closeValid) {
        if (const auto average = rules::contextAverage(context)) {
            if (candle.close > *average * rules::kMaxPriceMultiplier) {
                verdict.invalidateAll(ValidationReason::PriceTooHigh);
            }
            else if (candle.close < *average * rules::kMinPriceMultiplier) {
                verdict.invalidateAll(ValidationReason::PriceTooLow);
            }
        }
    }

    return verdict;
}

}  // namespace core
