#include "core/PriceRepairer.h"

#include <algorithm>
#include <utility>

#include "common/Log.hpp"
#include "core/NeighborResolver.h"
#include "core/PriceRules.h"
#include "domain/Errors.hpp"

namespace core {
namespace {

// Newest-first average window for the candle dated `date`: the repaired output
// so far, then supplied context entries older than anything in the output.
std::vector<domain::DailyCandle> validationWindow(const std::vector<domain::DailyCandle>& repaired,
                                                  const std::vector<domain::DailyCandle>& context,
                                                  const domain::IsoDate& date) {
    std::vector<domain::DailyCandle> window;
    window.reserve(rules::kContextWindow);
    for (auto it = repaired.rbegin(); it != repaired.rend() && window.size() < rules::kContextWindow; ++it) {
        if (it->date < date && it->close > 0.0) {
            window.push_back(*it);
        }
    }

    const auto& cutoff = repaired.empty() ? date : std::min(date, repaired.front().date);
    for (const auto& candidate : context) {
        if (window.size() >= rules::kContextWindow) {
            break;
        }
        if (candidate.date < cutoff && candidate.close > 0.0) {
            window.push_back(candidate);
        }
    }
    return window;
}

}  // namespace

PriceRepairer::PriceRepairer(OhlcValidator validator, Interpolator interpolator)
    : validator_(validator), interpolator_(interpolator) {}

RepairReport PriceRepairer::validateAndInterpolate(std::vector<domain::DailyCandle> candles,
                                                   const std::vector<domain::DailyCandle>& context) const {
    RepairReport report{};
    if (candles.empty()) {
        return report;
    }

    std::stable_sort(candles.begin(), candles.end(), domain::date_less);

    auto& output = report.candles;
    output.reserve(candles.size());
    const NeighborResolver resolver(validator_, candles, output, context);

    for (std::size_t index = 0; index < candles.size(); ++index) {
        const auto& candle = candles[index];
        const auto window = validationWindow(output, context, candle.date);
        const auto verdict = validator_.validate(candle, resolver.previousFor(index), window);

        if (verdict.allValid()) {
            output.push_back(candle);
            continue;
        }

        RepairOutcome outcome{};
        try {
            outcome = interpolator_.repair(candle, verdict, resolver.beforeFor(index), resolver.afterFor(index));
        }
        catch (const domain::ParseError& ex) {
            LOG_ERR("Repair failed for " << candle.date << ", keeping original: " << ex.what());
            output.push_back(candle);
            continue;
        }

        RepairLogEntry entry{};
        entry.date = candle.date;
        entry.originalClose = candle.close;
        entry.repairedClose = outcome.candle.close;
        entry.originalHigh = candle.high;
        entry.repairedHigh = outcome.candle.high;
        entry.originalLow = candle.low;
        entry.repairedLow = outcome.candle.low;
        entry.method = outcome.method;
        entry.reason = verdict.reason;
        report.log.push_back(entry);

        LOG_DEBUG("Repaired " << candle.date << " close " << candle.close << " -> " << outcome.candle.close
                              << " method=" << methodToString(outcome.method)
                              << " reason=" << reasonToString(verdict.reason));

        output.push_back(std::move(outcome.candle));
    }

    const double repairedRatio = static_cast<double>(report.log.size()) / static_cast<double>(candles.size());
    if (repairedRatio > rules::kSystemicRepairRatio) {
        LOG_WARN("More than half of the series needed repair (" << report.log.size() << "/" << candles.size()
                                                                << "), upstream data quality is suspect");
    }

    return report;
}

}  // namespace core
