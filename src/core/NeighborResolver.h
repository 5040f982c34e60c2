#pragma once

#include <cstddef>
#include <initializer_list>
#include <vector>

#include "core/OhlcValidator.h"
#include "domain/Types.h"

namespace core {

// Finds the valid neighbours of input[index] for a repair pass. Sources are
// tried in a fixed priority order per direction and the first hit wins:
//   previous: repaired output, then originally-valid input
//   before:   repaired output, then originally-valid input, then context
//   after:    originally-valid input, then context
// Candles with a non-positive close are never returned.
// Returned pointers stay valid until `repaired` is next modified.
class NeighborResolver {
public:
    NeighborResolver(const OhlcValidator& validator,
                     const std::vector<domain::DailyCandle>& input,
                     const std::vector<domain::DailyCandle>& repaired,
                     const std::vector<domain::DailyCandle>& context);

    const domain::DailyCandle* previousFor(std::size_t index) const;
    const domain::DailyCandle* beforeFor(std::size_t index) const;
    const domain::DailyCandle* afterFor(std::size_t index) const;

private:
    enum class Source { RepairedOutput, OriginalInput, Context };
    enum class Direction { Before, After };

    const domain::DailyCandle* resolve(std::size_t index,
                                       Direction direction,
                                       std::initializer_list<Source> order) const;
    const domain::DailyCandle* fromRepaired(const domain::IsoDate& date) const;
    const domain::DailyCandle* fromInput(std::size_t index, Direction direction) const;
    const domain::DailyCandle* fromContext(const domain::IsoDate& date, Direction direction) const;

    const std::vector<domain::DailyCandle>& input_;
    const std::vector<domain::DailyCandle>& repaired_;
    const std::vector<domain::DailyCandle>& context_;
    std::vector<bool> originallyValid_;
};

}  // namespace core
