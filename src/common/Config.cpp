#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace cg::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

int parsePositiveInt(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stol(value, &consumed);
        if (consumed != value.size() || parsed <= 0 || parsed > std::numeric_limits<int>::max()) {
            throw std::out_of_range("value out of range");
        }
        return static_cast<int>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

cg::log::Level parseLevel(const std::string& value, const std::string& label) {
    try {
        return cg::log::levelFromString(toLower(trim(value)));
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLevel(envLogLevel, "LOG_LEVEL");
    }
    if (const char* envDuck = std::getenv("DUCKDB_PATH")) {
        auto pathValue = trim(envDuck);
        if (!pathValue.empty()) {
            config.duckdbPath = std::move(pathValue);
        }
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg, "--log-level");
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = trim(duckArg);
    }
    if (auto inputArg = valueFromArgs(argc, argv, "--input"); !inputArg.empty()) {
        config.inputDir = trim(inputArg);
    }
    if (auto yearsArg = valueFromArgs(argc, argv, "--initial-backfill-years"); !yearsArg.empty()) {
        config.initialBackfillYears = parsePositiveInt(trim(yearsArg), "--initial-backfill-years");
    }
    if (auto daysArg = valueFromArgs(argc, argv, "--incremental-backfill-days"); !daysArg.empty()) {
        config.incrementalBackfillDays = parsePositiveInt(trim(daysArg), "--incremental-backfill-days");
    }

    if (hasFlag(argc, argv, "--repair-report")) {
        config.repairReport = true;
    }
    else if (auto reportArg = valueFromArgs(argc, argv, "--repair-report"); !reportArg.empty()) {
        config.repairReport = parseBool(reportArg, "--repair-report");
    }

    if (config.duckdbPath != ":memory:") {
        const std::filesystem::path duckPath{config.duckdbPath};
        const auto parentDir = duckPath.parent_path();
        if (!parentDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parentDir, ec);
            if (ec) {
                throw std::runtime_error("Unable to create directory for DuckDB (" + parentDir.string() +
                                         "): " + ec.message());
            }
        }
    }

    LOG_INFO("DuckDB path: " << config.duckdbPath);

    return config;
}

}  // namespace cg::common
