#include "core/NeighborResolver.h"

namespace core {
namespace {

// A candle left unrepaired with a non-positive close cannot anchor a repair.
bool usableNeighbor(const domain::DailyCandle& candle) {
    return candle.close > 0.0;
}

}  // namespace

NeighborResolver::NeighborResolver(const OhlcValidator& validator,
                                   const std::vector<domain::DailyCandle>& input,
                                   const std::vector<domain::DailyCandle>& repaired,
                                   const std::vector<domain::DailyCandle>& context)
    : input_(input), repaired_(repaired), context_(context) {
    originallyValid_.reserve(input_.size());
    for (const auto& candle : input_) {
        originallyValid_.push_back(validator.validate(candle, nullptr, context_).allValid());
    }
}

const domain::DailyCandle* NeighborResolver::previousFor(std::size_t index) const {
    return resolve(index, Direction::Before, {Source::RepairedOutput, Source::OriginalInput});
}

const domain::DailyCandle* NeighborResolver::beforeFor(std::size_t index) const {
    return resolve(index, Direction::Before, {Source::RepairedOutput, Source::OriginalInput, Source::Context});
}

const domain::DailyCandle* NeighborResolver::afterFor(std::size_t index) const {
    return resolve(index, Direction::After, {Source::OriginalInput, Source::Context});
}

const domain::DailyCandle* NeighborResolver::resolve(std::size_t index,
                                                     Direction direction,
                                                     std::initializer_list<Source> order) const {
    const auto& date = input_.at(index).date;
    for (const auto source : order) {
        const domain::DailyCandle* found = nullptr;
        switch (source) {
        case Source::RepairedOutput:
            // Output only ever holds candles earlier in the pass.
            if (direction == Direction::Before) {
                found = fromRepaired(date);
            }
            break;
        case Source::OriginalInput:
            found = fromInput(index, direction);
            break;
        case Source::Context:
            found = fromContext(date, direction);
            break;
        }
        if (found != nullptr) {
            return found;
        }
    }
    return nullptr;
}

const domain::DailyCandle* NeighborResolver::fromRepaired(const domain::IsoDate& date) const {
    for (auto it = repaired_.rbegin(); it != repaired_.rend(); ++it) {
        if (it->date < date && usableNeighbor(*it)) {
            return &*it;
        }
    }
    return nullptr;
}

const domain::DailyCandle* NeighborResolver::fromInput(std::size_t index, Direction direction) const {
    if (direction == Direction::Before) {
        for (std::size_t j = index; j-- > 0;) {
            if (originallyValid_[j]) {
                return &input_[j];
            }
        }
        return nullptr;
    }
    for (std::size_t j = index + 1; j < input_.size(); ++j) {
        if (originallyValid_[j]) {
            return &input_[j];
        }
    }
    return nullptr;
}

const domain::DailyCandle* NeighborResolver::fromContext(const domain::IsoDate& date, Direction direction) const {
    if (direction == Direction::Before) {
        // Context is newest-first, so the first earlier entry is the closest one.
        for (const auto& candidate : context_) {
            if (candidate.date < date && usableNeighbor(candidate)) {
                return &candidate;
            }
        }
        return nullptr;
    }

    const domain::DailyCandle* earliest = nullptr;
    for (const auto& candidate : context_) {
        if (candidate.date > date && usableNeighbor(candidate) &&
            (earliest == nullptr || candidate.date < earliest->date)) {
            earliest = &candidate;
        }
    }
    return earliest;
}

}  // namespace core
