#include "domain/Dates.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "domain/Errors.hpp"

namespace domain {
namespace {

constexpr std::int64_t kSecondsPerDay = 86'400;
constexpr std::int64_t kMillisecondsThreshold = 1'000'000'000'000LL;

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
std::tm gmtime_compat(std::time_t time) {
    std::tm tm{};
    gmtime_s(&tm, &time);
    return tm;
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
std::tm gmtime_compat(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    return tm;
}
#endif

std::string formatUtc(std::time_t time, const char* format) {
    const auto tm = gmtime_compat(time);
    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

}  // namespace

std::optional<UnixSeconds> parseIsoDate(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream input(value);
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail()) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    // timegm normalizes 2025-02-30 into March; reject anything that does not round-trip.
    if (formatUtc(raw, "%Y-%m-%d") != value) {
        return std::nullopt;
    }
    return static_cast<UnixSeconds>(raw);
}

UnixSeconds isoDateToUnix(const std::string& value) {
    auto parsed = parseIsoDate(value);
    if (!parsed) {
        throw ParseError("Invalid ISO date: '" + value + "'");
    }
    return *parsed;
}

IsoDate unixToIsoDate(UnixSeconds seconds) {
    return formatUtc(static_cast<std::time_t>(seconds), "%Y-%m-%d");
}

IsoDate timestampToIsoDate(std::int64_t timestamp) {
    if (timestamp >= kMillisecondsThreshold) {
        timestamp /= 1000;
    }
    return unixToIsoDate(timestamp);
}

YearMonth yearMonthOf(const IsoDate& date) {
    if (date.size() < 7) {
        throw ParseError("Invalid ISO date: '" + date + "'");
    }
    return date.substr(0, 7);
}

IsoDate todayIsoDate() {
    return unixToIsoDate(nowUnixSeconds());
}

IsoDate shiftIsoDate(const IsoDate& date, int days) {
    return unixToIsoDate(isoDateToUnix(date) + static_cast<std::int64_t>(days) * kSecondsPerDay);
}

IsoDate shiftIsoDateYears(const IsoDate& date, int years) {
    auto tm = gmtime_compat(static_cast<std::time_t>(isoDateToUnix(date)));
    tm.tm_year += years;
    tm.tm_isdst = 0;
    // Feb 29 in a non-leap target year rolls over to Mar 1.
    return unixToIsoDate(static_cast<UnixSeconds>(timegm_compat(&tm)));
}

std::int64_t daysBetween(const IsoDate& from, const IsoDate& to) {
    return (isoDateToUnix(to) - isoDateToUnix(from)) / kSecondsPerDay;
}

UnixSeconds nowUnixSeconds() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    return static_cast<UnixSeconds>(seconds.time_since_epoch().count());
}

}  // namespace domain
