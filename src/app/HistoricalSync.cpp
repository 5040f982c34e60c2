#include "app/HistoricalSync.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Dates.hpp"
#include "domain/Errors.hpp"

namespace app {

HistoricalSyncOptions HistoricalSyncOptions::fromConfig(const cg::common::Config& config) {
    HistoricalSyncOptions options{};
    options.initialBackfillYears = config.initialBackfillYears;
    options.incrementalBackfillDays = config.incrementalBackfillDays;
    return options;
}

HistoricalSync::HistoricalSync(domain::IDailyPriceSource& source,
                               HistoryStore& store,
                               HistoricalSyncOptions options)
    : source_(source), store_(store), options_(options) {}

SyncSummary HistoricalSync::syncInstrument(const domain::Instrument& instrument, const domain::IsoDate& today) {
    SyncSummary summary{};
    summary.instrument = domain::normalize_instrument(instrument);
    if (summary.instrument.empty()) {
        throw std::invalid_argument("HistoricalSync: instrument must not be empty");
    }

    bool hasMonthly = false;
    try {
        hasMonthly = store_.hasMonthlyData(summary.instrument);
    }
    catch (const domain::PersistenceError& ex) {
        LOG_WARN("HistoricalSync failed to check monthly data for " << summary.instrument
                                                                    << ", assuming none: " << ex.what());
    }

    summary.initialBackfill = !hasMonthly;
    summary.toDate = today;
    if (summary.initialBackfill) {
        summary.fromDate = domain::shiftIsoDateYears(today, -options_.initialBackfillYears);
        LOG_INFO("HistoricalSync " << summary.instrument << ": no monthly data, initial backfill of "
                                   << options_.initialBackfillYears << " years");
    }
    else {
        summary.fromDate = domain::shiftIsoDate(today, -options_.incrementalBackfillDays);
    }

    domain::DailySeries candles;
    try {
        candles = source_.fetchDaily(summary.instrument, summary.fromDate, summary.toDate);
    }
    catch (const std::exception& ex) {
        throw std::runtime_error("HistoricalSync: fetch failed for " + summary.instrument + ": " + ex.what());
    }

    summary.fetched = candles.size();
    if (candles.empty()) {
        LOG_WARN("HistoricalSync " << summary.instrument << ": upstream returned no candles for ["
                                   << summary.fromDate << ", " << summary.toDate << "]");
        return summary;
    }

    summary.stored = store_.sync(summary.instrument, std::move(candles));

    LOG_INFO("HistoricalSync " << summary.instrument << ": fetched=" << summary.fetched
                               << " stored=" << summary.stored.stored << " accepted=" << summary.stored.accepted);
    return summary;
}

}  // namespace app
