#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr auto kCreateDailyPricesTable = R"SQL(
    CREATE TABLE IF NOT EXISTS daily_prices (
        isin TEXT NOT NULL,
        date BIGINT NOT NULL,
        open DOUBLE NOT NULL,
        high DOUBLE NOT NULL,
        low DOUBLE NOT NULL,
        close DOUBLE NOT NULL,
        volume BIGINT,
        adjusted_close DOUBLE,
        PRIMARY KEY(isin, date)
    )
)SQL";

constexpr auto kCreateMonthlyPricesTable = R"SQL(
    CREATE TABLE IF NOT EXISTS monthly_prices (
        isin TEXT NOT NULL,
        year_month TEXT NOT NULL,
        avg_close DOUBLE NOT NULL,
        avg_adj_close DOUBLE NOT NULL,
        source TEXT NOT NULL,
        created_at BIGINT NOT NULL,
        PRIMARY KEY(isin, year_month)
    )
)SQL";

void runMigration(::duckdb::Connection& connection, const char* sql, const char* label) {
    auto result = connection.Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage =
            result ? result->GetError() : std::string{"unknown error creating "} + label;
        throw std::runtime_error("DuckStore: migration failed (" + std::string{label} + "): " + errorMessage);
    }
}

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    open();
}

DuckStore::~DuckStore() = default;

bool DuckStore::inMemory() const noexcept {
    return dbPath_.empty() || dbPath_ == ":memory:";
}

::duckdb::DuckDB& DuckStore::database() {
    return *database_;
}

void DuckStore::open() {
    if (inMemory()) {
        database_ = std::make_unique<::duckdb::DuckDB>(nullptr);
        LOG_INFO("DuckStore opened in-memory database");
        return;
    }

    const fs::path dbPath{dbPath_};
    if (dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" + dbPath.parent_path().string() +
                                     "': " + ec.message());
        }
    }

    database_ = std::make_unique<::duckdb::DuckDB>(dbPath.string());
    LOG_INFO("DuckStore opened " << dbPath.string());
}

void DuckStore::migrate() {
    ::duckdb::Connection connection(database());

    runMigration(connection, kCreateDailyPricesTable, "daily_prices");
    runMigration(connection, kCreateMonthlyPricesTable, "monthly_prices");

    LOG_INFO("DuckStore migration finished for " << (inMemory() ? std::string{":memory:"} : dbPath_));
}

}  // namespace adapters::duckdb
