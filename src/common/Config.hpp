#pragma once

#include <string>

#include "common/Log.hpp"

namespace cg::common {

struct Config {
    cg::log::Level logLevel = cg::log::Level::Info;
    std::string duckdbPath = "data/prices.duckdb";
    std::string inputDir;
    int initialBackfillYears = 10;
    int incrementalBackfillDays = 365;
    bool repairReport = false;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace cg::common
