#pragma once

#include <string>
#include <vector>

#include "core/Interpolator.h"
#include "core/OhlcValidator.h"
#include "domain/Types.h"

namespace core {

struct RepairLogEntry {
    domain::IsoDate date;
    double originalClose{0};
    double repairedClose{0};
    double originalHigh{0};
    double repairedHigh{0};
    double originalLow{0};
    double repairedLow{0};
    RepairMethod method{RepairMethod::NoInterpolation};
    ValidationReason reason{ValidationReason::None};
};

struct RepairReport {
    std::vector<domain::DailyCandle> candles;
    std::vector<RepairLogEntry> log;
};

class PriceRepairer {
public:
    PriceRepairer() = default;
    PriceRepairer(OhlcValidator validator, Interpolator interpolator);

    // Returns one candle per input candle in ascending date order, with
    // invalid fields rebuilt from neighbours. `context` is newest-first and
    // extends the average window past the start of `candles`; each candle is
    // checked against the 30 newest earlier candles, repaired ones included.
    RepairReport validateAndInterpolate(std::vector<domain::DailyCandle> candles,
                                        const std::vector<domain::DailyCandle>& context) const;

private:
    OhlcValidator validator_{};
    Interpolator interpolator_{};
};

}  // namespace core
