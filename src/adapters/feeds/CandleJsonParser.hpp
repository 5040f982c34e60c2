#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Types.h"

namespace adapters::feeds {

struct ParseIssue {
    std::size_t index{0};
    std::string message;
};

struct ParsedCandles {
    domain::DailySeries candles;
    std::vector<ParseIssue> issues;
};

// Accepts either [[ts, o, h, l, c, v?], ...] with ts in seconds or
// milliseconds, or [{"date"|"timestamp", "open", "high", "low", "close",
// "volume"?, "adjusted_close"?}, ...]. Numbers may be JSON strings.
// A malformed row becomes a ParseIssue; a malformed document throws
// domain::ParseError.
class CandleJsonParser {
public:
    ParsedCandles parse(std::string_view body) const;
};

}  // namespace adapters::feeds
