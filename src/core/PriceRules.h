#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "domain/Types.h"

namespace core::rules {

// Relative thresholds only. Absolute price bounds go stale over a long horizon.
constexpr double kMaxPriceMultiplier = 10.0;
constexpr double kMinPriceMultiplier = 0.1;
constexpr double kMaxChangePercent = 1000.0;
constexpr double kMinChangePercent = -90.0;
constexpr std::size_t kContextWindow = 30;

constexpr double kHighCloseMaxRatio = 100.0;
constexpr double kLowCloseMinRatio = 0.01;

constexpr double kDefaultHighCloseRatio = 1.02;
constexpr double kDefaultLowCloseRatio = 0.98;

constexpr double kSystemicRepairRatio = 0.5;

inline double changePercent(double close, double previousClose) {
    return (close - previousClose) / previousClose * 100.0;
}

// Mean Close of the first kContextWindow entries; nullopt without a full window.
inline std::optional<double> contextAverage(const std::vector<domain::DailyCandle>& context) {
    if (context.size() < kContextWindow) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (std::size_t i = 0; i < kContextWindow; ++i) {
        sum += context[i].close;
    }
    return sum / static_cast<double>(kContextWindow);
}

}  // namespace core::rules
