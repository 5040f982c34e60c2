#include <cstddef>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "adapters/duckdb/DuckPriceRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/feeds/JsonFileSource.hpp"
#include "app/HistoricalSync.hpp"
#include "app/HistoryStore.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Dates.hpp"

namespace {

namespace fs = std::filesystem;

std::vector<std::string> listInstruments(const fs::path& dataDir) {
    std::vector<std::string> instruments;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dataDir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        instruments.push_back(entry.path().stem().string());
    }
    if (ec) {
        throw std::runtime_error("Error reading directory " + dataDir.string() + ": " + ec.message());
    }
    return instruments;
}

void printRepairReport(const std::string& instrument, const core::RepairReport& report) {
    std::cout << "Repair report for " << instrument << ": " << report.log.size() << "/" << report.candles.size()
              << " candles repaired" << std::endl;
    for (const auto& entry : report.log) {
        std::cout << "  " << entry.date << " close " << std::fixed << std::setprecision(4) << entry.originalClose
                  << " -> " << entry.repairedClose << " high " << entry.originalHigh << " -> "
                  << entry.repairedHigh << " low " << entry.originalLow << " -> " << entry.repairedLow << " ["
                  << core::methodToString(entry.method) << ", " << core::reasonToString(entry.reason) << "]"
                  << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        const auto config = cg::common::Config::fromArgs(argc, argv);
        cg::log::setLevel(config.logLevel);

        if (config.inputDir.empty()) {
            std::cerr << "Usage: candleguard-import --input <dir> [--duckdb <path>] [--repair-report]" << std::endl;
            return 1;
        }

        std::error_code ec;
        if (!fs::exists(config.inputDir, ec) || !fs::is_directory(config.inputDir, ec)) {
            std::cerr << "Data directory not found: " << config.inputDir << std::endl;
            return 1;
        }

        adapters::duckdb::DuckStore duckStore(config.duckdbPath);
        duckStore.migrate();
        adapters::duckdb::DuckPriceRepo repo(duckStore);
        app::HistoryStore store(repo);

        adapters::feeds::JsonFileSource source(config.inputDir);
        app::HistoricalSync sync(source, store, app::HistoricalSyncOptions::fromConfig(config));

        const auto today = domain::todayIsoDate();
        std::map<std::string, app::SyncSummary> summaries;
        std::size_t failures = 0;

        for (const auto& instrument : listInstruments(config.inputDir)) {
            try {
                auto summary = sync.syncInstrument(instrument, today);
                summaries[summary.instrument] = summary;
            }
            catch (const std::exception& ex) {
                LOG_ERR("Import failed for " << instrument << ": " << ex.what());
                ++failures;
            }
        }

        if (summaries.empty() && failures == 0) {
            std::cout << "No instruments imported from " << config.inputDir << std::endl;
            return 0;
        }

        std::cout << "Import summary:" << std::endl;
        for (const auto& [instrument, summary] : summaries) {
            std::cout << "  " << instrument << " [" << summary.fromDate << ", " << summary.toDate << "]"
                      << (summary.initialBackfill ? " initial" : " incremental") << ": " << summary.stored.stored
                      << " stored, " << summary.stored.accepted << " accepted, " << summary.stored.months
                      << " months" << std::endl;
        }

        if (config.repairReport) {
            for (const auto& entry : summaries) {
                printRepairReport(entry.first, store.repairReport(entry.first));
            }
        }

        if (failures > 0) {
            std::cerr << failures << " instrument(s) failed to import" << std::endl;
            return 1;
        }
        return 0;
    }
    catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
    }

    return 1;
}
