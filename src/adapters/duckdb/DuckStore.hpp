#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the process-wide DuckDB instance. An empty path or ":memory:" opens an
// in-memory database; connections are created per operation by the repos.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/prices.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    void migrate();

    ::duckdb::DuckDB& database();
    const std::string& path() const noexcept { return dbPath_; }
    bool inMemory() const noexcept;

private:
    void open();

    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> database_;
};

}  // namespace adapters::duckdb
