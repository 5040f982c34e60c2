#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/Types.h"

namespace domain {

// Strict YYYY-MM-DD parse to UTC midnight; nullopt for anything else.
std::optional<UnixSeconds> parseIsoDate(const std::string& value);

// Same as parseIsoDate but throws ParseError.
UnixSeconds isoDateToUnix(const std::string& value);

IsoDate unixToIsoDate(UnixSeconds seconds);

// Seconds or milliseconds; values >= 1e12 are treated as milliseconds.
IsoDate timestampToIsoDate(std::int64_t timestamp);

YearMonth yearMonthOf(const IsoDate& date);

IsoDate todayIsoDate();

IsoDate shiftIsoDate(const IsoDate& date, int days);
IsoDate shiftIsoDateYears(const IsoDate& date, int years);

// Calendar days from `from` to `to` (negative when `to` is earlier).
std::int64_t daysBetween(const IsoDate& from, const IsoDate& to);

UnixSeconds nowUnixSeconds();

}  // namespace domain
