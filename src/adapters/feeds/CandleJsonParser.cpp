#include "adapters/feeds/CandleJsonParser.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "common/Log.hpp"
#include "domain/Dates.hpp"
#include "domain/Errors.hpp"

namespace adapters::feeds {
namespace {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    double parsed = 0.0;
    if (value.is_double()) {
        parsed = value.as_double();
    } else if (value.is_int64()) {
        parsed = static_cast<double>(value.as_int64());
    } else if (value.is_uint64()) {
        parsed = static_cast<double>(value.as_uint64());
    } else if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            parsed = std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    } else {
        throw std::runtime_error("Unsupported JSON type for floating conversion");
    }
    if (!std::isfinite(parsed)) {
        throw std::runtime_error("Non-finite price value");
    }
    return parsed;
}

const boost::json::value& requireField(const boost::json::object& row, const char* key) {
    const auto* value = row.if_contains(key);
    if (value == nullptr || value->is_null()) {
        throw std::runtime_error(std::string{"Missing field '"} + key + "'");
    }
    return *value;
}

std::optional<std::int64_t> optionalInt(const boost::json::value* value) {
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return json_to_int64(*value);
}

std::optional<double> optionalDouble(const boost::json::value* value) {
    if (value == nullptr || value->is_null()) {
        return std::nullopt;
    }
    return json_to_double(*value);
}

domain::DailyCandle fromArrayRow(const boost::json::array& row) {
    if (row.size() < 5) {
        throw std::runtime_error("Incomplete candle row (expected at least 5 values)");
    }

    domain::DailyCandle candle{};
    candle.date = domain::timestampToIsoDate(json_to_int64(row.at(0)));
    candle.open = json_to_double(row.at(1));
    candle.high = json_to_double(row.at(2));
    candle.low = json_to_double(row.at(3));
    candle.close = json_to_double(row.at(4));
    if (row.size() > 5) {
        candle.volume = optionalInt(&row.at(5));
    }
    return candle;
}

domain::DailyCandle fromObjectRow(const boost::json::object& row) {
    domain::DailyCandle candle{};

    if (const auto* date = row.if_contains("date"); date != nullptr && date->is_string()) {
        candle.date = std::string{date->as_string().c_str()};
        if (!domain::parseIsoDate(candle.date)) {
            throw std::runtime_error("Invalid date '" + candle.date + "'");
        }
    } else if (const auto* timestamp = row.if_contains("timestamp"); timestamp != nullptr && !timestamp->is_null()) {
        candle.date = domain::timestampToIsoDate(json_to_int64(*timestamp));
    } else {
        throw std::runtime_error("Missing field 'date' or 'timestamp'");
    }

    candle.open = json_to_double(requireField(row, "open"));
    candle.high = json_to_double(requireField(row, "high"));
    candle.low = json_to_double(requireField(row, "low"));
    candle.close = json_to_double(requireField(row, "close"));
    candle.volume = optionalInt(row.if_contains("volume"));
    candle.adjustedClose = optionalDouble(row.if_contains("adjusted_close"));
    return candle;
}

}  // namespace

ParsedCandles CandleJsonParser::parse(std::string_view body) const {
    boost::json::value json;
    try {
        json = boost::json::parse(std::string{body});
    } catch (const std::exception& ex) {
        throw domain::ParseError(std::string{"Failed to parse candle document: "} + ex.what());
    }

    if (!json.is_array()) {
        throw domain::ParseError("Unexpected candle document type (expected array)");
    }

    ParsedCandles parsed{};
    const auto& rows = json.as_array();
    parsed.candles.reserve(rows.size());

    for (std::size_t index = 0; index < rows.size(); ++index) {
        const auto& row = rows[index];
        try {
            if (row.is_array()) {
                parsed.candles.push_back(fromArrayRow(row.as_array()));
            } else if (row.is_object()) {
                parsed.candles.push_back(fromObjectRow(row.as_object()));
            } else {
                throw std::runtime_error("Unexpected candle row type");
            }
        } catch (const std::exception& ex) {
            LOG_DEBUG("Skipping candle row " << index << ": " << ex.what());
            parsed.issues.push_back(ParseIssue{index, ex.what()});
        }
    }

    return parsed;
}

}  // namespace adapters::feeds
