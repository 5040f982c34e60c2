#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace domain {

using Instrument = std::string;
using IsoDate = std::string;     // YYYY-MM-DD
using YearMonth = std::string;   // YYYY-MM
using UnixSeconds = std::int64_t;

struct DailyCandle {
    IsoDate date;
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    std::optional<std::int64_t> volume;
    std::optional<double> adjustedClose;
};

using DailySeries = std::vector<DailyCandle>;

struct MonthlyAggregate {
    Instrument instrument;
    YearMonth yearMonth;
    double avgClose{0};
    double avgAdjClose{0};
    std::string source{"calculated"};
    UnixSeconds createdAt{0};
};

struct DeleteSummary {
    std::size_t dailyRows{0};
    std::size_t monthlyRows{0};
};

// Upper case with surrounding whitespace removed.
inline Instrument normalize_instrument(const std::string& raw) {
    auto first = std::find_if(raw.begin(), raw.end(), [](unsigned char ch) { return std::isspace(ch) == 0; });
    auto last = std::find_if(raw.rbegin(), raw.rend(), [](unsigned char ch) { return std::isspace(ch) == 0; })
                    .base();
    if (first >= last) {
        return {};
    }
    Instrument result(first, last);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

inline bool date_less(const DailyCandle& lhs, const DailyCandle& rhs) { return lhs.date < rhs.date; }

}  // namespace domain
