#pragma once

#include "core/OhlcValidator.h"
#include "domain/Types.h"

namespace core {

enum class RepairMethod {
    Linear,
    ForwardFill,
    BackwardFill,
    Selective,
    NoInterpolation,
};

const char* methodToString(RepairMethod method) noexcept;

struct RepairOutcome {
    domain::DailyCandle candle;
    RepairMethod method{RepairMethod::NoInterpolation};
};

// High = max(High, Open, Close), Low = min(Low, Open, Close), High >= Low.
void enforceOhlcConsistency(domain::DailyCandle& candle) noexcept;

class Interpolator {
public:
    // Rebuilds only the fields the verdict marks invalid. Neighbours may be null.
    // Throws domain::ParseError when a full repair meets a malformed date.
    RepairOutcome repair(const domain::DailyCandle& candle,
                         const OhlcVerdict& verdict,
                         const domain::DailyCandle* before,
                         const domain::DailyCandle* after) const;

private:
    RepairOutcome repairSelective(const domain::DailyCandle& candle,
                                  const OhlcVerdict& verdict,
                                  const domain::DailyCandle* before,
                                  const domain::DailyCandle* after) const;
    RepairOutcome repairFull(const domain::DailyCandle& candle,
                             const domain::DailyCandle* before,
                             const domain::DailyCandle* after) const;
};

}  // namespace core
