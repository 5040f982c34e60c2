#include "adapters/duckdb/DuckPriceRepo.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "adapters/duckdb/DuckStore.hpp"
#include "common/Log.hpp"
#include "domain/Dates.hpp"
#include "domain/Errors.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr auto kUpsertDaily =
    "INSERT OR REPLACE INTO daily_prices "
    "(isin, date, open, high, low, close, volume, adjusted_close) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?)";

constexpr auto kUpsertMonthly =
    "INSERT OR REPLACE INTO monthly_prices "
    "(isin, year_month, avg_close, avg_adj_close, source, created_at) "
    "VALUES (?, ?, ?, ?, ?, ?)";

std::unique_ptr<::duckdb::PreparedStatement> prepareOrThrow(::duckdb::Connection& connection,
                                                            const std::string& sql,
                                                            const char* operation,
                                                            const domain::Instrument& instrument) {
    auto statement = connection.Prepare(sql);
    if (!statement || statement->HasError()) {
        const std::string errorMessage =
            statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw domain::PersistenceError(operation, instrument, errorMessage);
    }
    return statement;
}

std::unique_ptr<::duckdb::QueryResult> executeOrThrow(::duckdb::PreparedStatement& statement,
                                                      DuckdbValueVector& parameters,
                                                      const char* operation,
                                                      const domain::Instrument& instrument) {
    auto result = statement.Execute(parameters, false);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"failed to execute statement"};
        throw domain::PersistenceError(operation, instrument, errorMessage);
    }
    return result;
}

std::int64_t firstCount(::duckdb::QueryResult& result) {
    if (auto chunk = result.Fetch()) {
        if (chunk->size() > 0) {
            const auto value = chunk->GetValue(0, 0);
            if (!value.IsNull()) {
                return value.GetValue<std::int64_t>();
            }
        }
    }
    return 0;
}

::duckdb::Value optionalBigint(const std::optional<std::int64_t>& value) {
    if (value) {
        return ::duckdb::Value::BIGINT(*value);
    }
    return ::duckdb::Value(::duckdb::LogicalType::BIGINT);
}

::duckdb::Value optionalDouble(const std::optional<double>& value) {
    if (value) {
        return ::duckdb::Value::DOUBLE(*value);
    }
    return ::duckdb::Value(::duckdb::LogicalType::DOUBLE);
}

// Rolls back on scope exit unless commit() succeeded.
class TransactionScope {
public:
    TransactionScope(::duckdb::Connection& connection, const char* operation, domain::Instrument instrument)
        : connection_(connection), operation_(operation), instrument_(std::move(instrument)) {
        connection_.BeginTransaction();
        active_ = true;
    }

    ~TransactionScope() {
        if (!active_) {
            return;
        }
        try {
            connection_.Rollback();
        }
        catch (const std::exception& ex) {
            LOG_WARN("DuckPriceRepo rollback failed op=" << operation_ << " isin=" << instrument_
                                                          << " error=" << ex.what());
        }
    }

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    void commit() {
        connection_.Commit();
        active_ = false;
    }

private:
    ::duckdb::Connection& connection_;
    const char* operation_;
    domain::Instrument instrument_;
    bool active_{false};
};

}  // namespace

DuckPriceRepo::DuckPriceRepo(DuckStore& store) : store_(store) {}

domain::DailySeries DuckPriceRepo::fetchDailyAscending(const domain::Instrument& instrument) const {
    constexpr const char* kOperation = "fetchDailyAscending";
    ::duckdb::Connection connection(store_.database());

    auto statement = prepareOrThrow(connection,
                                    "SELECT date, open, high, low, close, volume, adjusted_close "
                                    "FROM daily_prices WHERE isin = ? ORDER BY date ASC",
                                    kOperation,
                                    instrument);

    DuckdbValueVector parameters;
    parameters.emplace_back(instrument);
    auto result = executeOrThrow(*statement, parameters, kOperation, instrument);

    domain::DailySeries candles;
    while (auto chunk = result->Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            const auto dateValue = chunk->GetValue(0, row);
            if (dateValue.IsNull()) {
                continue;
            }
            domain::DailyCandle candle{};
            candle.date = domain::unixToIsoDate(dateValue.GetValue<std::int64_t>());
            candle.open = chunk->GetValue(1, row).GetValue<double>();
            candle.high = chunk->GetValue(2, row).GetValue<double>();
            candle.low = chunk->GetValue(3, row).GetValue<double>();
            candle.close = chunk->GetValue(4, row).GetValue<double>();

            const auto volumeValue = chunk->GetValue(5, row);
            if (!volumeValue.IsNull()) {
                candle.volume = volumeValue.GetValue<std::int64_t>();
            }
            const auto adjustedValue = chunk->GetValue(6, row);
            if (!adjustedValue.IsNull()) {
                candle.adjustedClose = adjustedValue.GetValue<double>();
            }
            candles.push_back(std::move(candle));
        }
    }

    return candles;
}

void DuckPriceRepo::commitSync(const domain::Instrument& instrument,
                               const domain::DailySeries& daily,
                               const std::vector<domain::MonthlyAggregate>& monthly) {
    constexpr const char* kOperation = "commitSync";
    ::duckdb::Connection connection(store_.database());

    try {
        TransactionScope transaction(connection, kOperation, instrument);

        auto dailyStatement = prepareOrThrow(connection, kUpsertDaily, kOperation, instrument);
        DuckdbValueVector parameters;
        parameters.reserve(8);

        for (const auto& candle : daily) {
            parameters.clear();
            parameters.emplace_back(instrument);
            parameters.emplace_back(::duckdb::Value::BIGINT(domain::isoDateToUnix(candle.date)));
            parameters.emplace_back(::duckdb::Value::DOUBLE(candle.open));
            parameters.emplace_back(::duckdb::Value::DOUBLE(candle.high));
            parameters.emplace_back(::duckdb::Value::DOUBLE(candle.low));
            parameters.emplace_back(::duckdb::Value::DOUBLE(candle.close));
            parameters.emplace_back(optionalBigint(candle.volume));
            parameters.emplace_back(optionalDouble(candle.adjustedClose));
            executeOrThrow(*dailyStatement, parameters, kOperation, instrument);
        }

        auto monthlyStatement = prepareOrThrow(connection, kUpsertMonthly, kOperation, instrument);
        for (const auto& aggregate : monthly) {
            parameters.clear();
            parameters.emplace_back(instrument);
            parameters.emplace_back(aggregate.yearMonth);
            parameters.emplace_back(::duckdb::Value::DOUBLE(aggregate.avgClose));
            parameters.emplace_back(::duckdb::Value::DOUBLE(aggregate.avgAdjClose));
            parameters.emplace_back(aggregate.source);
            parameters.emplace_back(::duckdb::Value::BIGINT(aggregate.createdAt));
            executeOrThrow(*monthlyStatement, parameters, kOperation, instrument);
        }

        transaction.commit();
    }
    catch (const domain::PersistenceError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw domain::PersistenceError(kOperation, instrument, ex.what());
    }

    LOG_DEBUG("DuckPriceRepo committed isin=" << instrument << " daily=" << daily.size()
                                              << " monthly=" << monthly.size());
}

std::vector<domain::MonthlyAggregate> DuckPriceRepo::fetchMonthly(const domain::Instrument& instrument,
                                                                  std::size_t limit) const {
    constexpr const char* kOperation = "fetchMonthly";
    ::duckdb::Connection connection(store_.database());

    std::string query =
        "SELECT year_month, avg_close, avg_adj_close, source, created_at "
        "FROM monthly_prices WHERE isin = ? ORDER BY year_month DESC";
    DuckdbValueVector parameters;
    parameters.emplace_back(instrument);
    if (limit > 0) {
        query += " LIMIT ?";
        const auto limitValue = static_cast<std::int64_t>(
            std::min<std::size_t>(limit, static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max())));
        parameters.emplace_back(::duckdb::Value::BIGINT(limitValue));
    }

    auto statement = prepareOrThrow(connection, query, kOperation, instrument);
    auto result = executeOrThrow(*statement, parameters, kOperation, instrument);

    std::vector<domain::MonthlyAggregate> aggregates;
    while (auto chunk = result->Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::MonthlyAggregate aggregate{};
            aggregate.instrument = instrument;
            aggregate.yearMonth = chunk->GetValue(0, row).GetValue<std::string>();
            aggregate.avgClose = chunk->GetValue(1, row).GetValue<double>();
            aggregate.avgAdjClose = chunk->GetValue(2, row).GetValue<double>();
            aggregate.source = chunk->GetValue(3, row).GetValue<std::string>();
            aggregate.createdAt = chunk->GetValue(4, row).GetValue<std::int64_t>();
            aggregates.push_back(std::move(aggregate));
        }
    }
    return aggregates;
}

std::size_t DuckPriceRepo::countMonthly(const domain::Instrument& instrument) const {
    constexpr const char* kOperation = "countMonthly";
    ::duckdb::Connection connection(store_.database());

    auto statement =
        prepareOrThrow(connection, "SELECT COUNT(*) FROM monthly_prices WHERE isin = ?", kOperation, instrument);
    DuckdbValueVector parameters;
    parameters.emplace_back(instrument);
    auto result = executeOrThrow(*statement, parameters, kOperation, instrument);
    return static_cast<std::size_t>(std::max<std::int64_t>(0, firstCount(*result)));
}

domain::DeleteSummary DuckPriceRepo::deleteInstrument(const domain::Instrument& instrument) {
    constexpr const char* kOperation = "deleteInstrument";
    ::duckdb::Connection connection(store_.database());

    domain::DeleteSummary summary{};
    try {
        TransactionScope transaction(connection, kOperation, instrument);

        DuckdbValueVector parameters;
        parameters.emplace_back(instrument);

        auto dailyStatement =
            prepareOrThrow(connection, "DELETE FROM daily_prices WHERE isin = ?", kOperation, instrument);
        auto dailyResult = executeOrThrow(*dailyStatement, parameters, kOperation, instrument);
        summary.dailyRows = static_cast<std::size_t>(std::max<std::int64_t>(0, firstCount(*dailyResult)));

        auto monthlyStatement =
            prepareOrThrow(connection, "DELETE FROM monthly_prices WHERE isin = ?", kOperation, instrument);
        auto monthlyResult = executeOrThrow(*monthlyStatement, parameters, kOperation, instrument);
        summary.monthlyRows = static_cast<std::size_t>(std::max<std::int64_t>(0, firstCount(*monthlyResult)));

        transaction.commit();
    }
    catch (const domain::PersistenceError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw domain::PersistenceError(kOperation, instrument, ex.what());
    }

    return summary;
}

}  // namespace adapters::duckdb
