#pragma once

#include <vector>

#include "domain/Types.h"

namespace core {

enum class ValidationReason {
    None,
    CloseZeroOrNegative,
    HighBelowLow,
    HighBelowOpen,
    HighBelowClose,
    LowAboveOpen,
    LowAboveClose,
    HighExtremeRelativeToClose,
    LowExtremeRelativeToClose,
    SpikeDetected,
    CrashDetected,
    PriceTooHigh,
    PriceTooLow,
};

const char* reasonToString(ValidationReason reason) noexcept;

struct OhlcVerdict {
    bool openValid{true};
    bool highValid{true};
    bool lowValid{true};
    bool closeValid{true};
    ValidationReason reason{ValidationReason::None};

    bool allValid() const noexcept { return openValid && highValid && lowValid && closeValid; }
    // Close anchors every other field, so losing it means a full rebuild.
    bool needsFullRepair() const noexcept { return !closeValid; }
    bool needsRepair() const noexcept { return !allValid(); }

    void invalidateAll(ValidationReason why) noexcept {
        openValid = highValid = lowValid = closeValid = false;
        reason = why;
    }
};

class OhlcValidator {
public:
    // `previous` may be null. `context` is newest-first and may be empty.
    OhlcVerdict validate(const domain::DailyCandle& candle,
                         const domain::DailyCandle* previous,
                         const std::vector<domain::DailyCandle>& context) const;
};

}  // namespace core
