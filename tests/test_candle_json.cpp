#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

#include "adapters/feeds/CandleJsonParser.hpp"
#include "adapters/feeds/JsonFileSource.hpp"
#include "domain/Dates.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace {

bool expectParseError(const adapters::feeds::CandleJsonParser& parser, const std::string& body) {
    try {
        parser.parse(body);
    }
    catch (const domain::ParseError&) {
        return true;
    }
    std::cerr << "Expected ParseError for document: " << body << "\n";
    return false;
}

struct TempDir {
    TempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("candleguard-json-" + std::to_string(stamp));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write(const std::string& name, const std::string& body) const {
        std::ofstream out(path / name, std::ios::binary);
        out << body;
    }

    fs::path path;
};

}  // namespace

int main() {
    // Dates are strict and round-trip through UTC midnight.
    {
        if (!domain::parseIsoDate("2024-02-29") || domain::parseIsoDate("2023-02-29") ||
            domain::parseIsoDate("2025-13-01") || domain::parseIsoDate("2025-1-01") ||
            domain::parseIsoDate("2025-01-01T00:00")) {
            std::cerr << "parseIsoDate accepted or rejected the wrong inputs\n";
            return 1;
        }
        if (domain::isoDateToUnix("2024-01-01") != 1704067200 || domain::unixToIsoDate(1704067200) != "2024-01-01") {
            std::cerr << "Unexpected epoch for 2024-01-01\n";
            return 1;
        }
        if (domain::timestampToIsoDate(1704153600000LL) != "2024-01-02" ||
            domain::timestampToIsoDate(1704153600) != "2024-01-02") {
            std::cerr << "Seconds and milliseconds should map to the same day\n";
            return 1;
        }
        if (domain::shiftIsoDate("2024-03-01", -1) != "2024-02-29" ||
            domain::shiftIsoDateYears("2025-06-30", -10) != "2015-06-30" ||
            domain::daysBetween("2024-01-01", "2024-12-31") != 365 || domain::yearMonthOf("2024-07-04") != "2024-07") {
            std::cerr << "Date arithmetic is off\n";
            return 1;
        }
        bool threw = false;
        try {
            domain::isoDateToUnix("not-a-date");
        }
        catch (const domain::ParseError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Expected ParseError from isoDateToUnix\n";
            return 1;
        }
    }

    const adapters::feeds::CandleJsonParser parser;

    // Array rows with second and millisecond timestamps, volume optional.
    {
        const auto parsed = parser.parse(
            R"([[1704067200, 10.0, 11.0, 9.5, 10.5, 12345], [1704153600000, "10.5", 11.2, 10.1, 11.0]])");
        if (parsed.candles.size() != 2 || !parsed.issues.empty()) {
            std::cerr << "Expected two array candles\n";
            return 1;
        }
        const auto& first = parsed.candles[0];
        if (first.date != "2024-01-01" || first.open != 10.0 || first.high != 11.0 || first.low != 9.5 ||
            first.close != 10.5 || !first.volume || *first.volume != 12345) {
            std::cerr << "First array candle parsed incorrectly\n";
            return 1;
        }
        const auto& second = parsed.candles[1];
        if (second.date != "2024-01-02" || second.open != 10.5 || second.volume) {
            std::cerr << "Second array candle parsed incorrectly\n";
            return 1;
        }
    }

    // Object rows by date or timestamp; bad rows become issues without failing the batch.
    {
        const auto parsed = parser.parse(R"([
            {"date": "2024-01-03", "open": 1, "high": 2, "low": 0.5, "close": 1.5, "volume": null, "adjusted_close": 1.4},
            {"timestamp": 1704326400, "open": 1.5, "high": 2.5, "low": 1.0, "close": 2.0, "volume": "700"},
            {"date": "2024-02-30", "open": 1, "high": 2, "low": 0.5, "close": 1.5},
            {"date": "2024-01-06", "open": 1, "high": 2, "low": 0.5},
            {"date": "2024-01-07", "open": "abc", "high": 2, "low": 0.5, "close": 1.5},
            [1704067200, 1.0],
            "junk"
        ])");
        if (parsed.candles.size() != 2 || parsed.issues.size() != 5) {
            std::cerr << "Expected 2 candles and 5 issues, got " << parsed.candles.size() << " and "
                      << parsed.issues.size() << "\n";
            return 1;
        }
        const auto& first = parsed.candles[0];
        if (first.date != "2024-01-03" || first.volume || !first.adjustedClose || *first.adjustedClose != 1.4) {
            std::cerr << "Object candle with null volume parsed incorrectly\n";
            return 1;
        }
        const auto& second = parsed.candles[1];
        if (second.date != "2024-01-04" || !second.volume || *second.volume != 700) {
            std::cerr << "Timestamp object candle parsed incorrectly\n";
            return 1;
        }
        if (parsed.issues.front().index != 2 || parsed.issues.back().index != 6) {
            std::cerr << "Issues should carry the index of the failing row\n";
            return 1;
        }
    }

    if (!expectParseError(parser, "{not json") || !expectParseError(parser, R"({"candles": []})")) {
        return 1;
    }
    if (!parser.parse("[]").candles.empty()) {
        std::cerr << "An empty array should parse to nothing\n";
        return 1;
    }

    // File source resolves the instrument's file and clips to the window.
    {
        TempDir dir;
        dir.write("acme.json", R"([
            {"date": "2024-01-01", "open": 1, "high": 2, "low": 0.5, "close": 1.5},
            {"date": "2024-01-02", "open": 1, "high": 2, "low": 0.5, "close": 1.6},
            {"date": "2024-01-03", "open": 1, "high": 2, "low": 0.5, "close": 1.7}
        ])");

        adapters::feeds::JsonFileSource source(dir.path);
        const auto window = source.fetchDaily("ACME", "2024-01-02", "2024-01-03");
        if (window.size() != 2 || window.front().date != "2024-01-02" || window.back().close != 1.7) {
            std::cerr << "Expected two candles from the file window, got " << window.size() << "\n";
            return 1;
        }

        bool threw = false;
        try {
            source.fetchDaily("MISSING", "2024-01-01", "2024-12-31");
        }
        catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "Expected an error for a missing instrument file\n";
            return 1;
        }
    }

    return 0;
}
