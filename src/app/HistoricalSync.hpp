#pragma once

#include <cstddef>
#include <string>

#include "app/HistoryStore.hpp"
#include "domain/Ports.hpp"

namespace cg::common {
struct Config;
}

namespace app {

struct HistoricalSyncOptions {
    int initialBackfillYears = 10;
    int incrementalBackfillDays = 365;

    static HistoricalSyncOptions fromConfig(const cg::common::Config& config);
};

struct SyncSummary {
    domain::Instrument instrument;
    bool initialBackfill{false};
    domain::IsoDate fromDate;
    domain::IsoDate toDate;
    std::size_t fetched{0};
    SyncResult stored{};
};

// Pulls a window of daily candles from upstream into the history store. An
// instrument without monthly data gets the long initial window; afterwards
// only the incremental window is refreshed.
class HistoricalSync {
public:
    HistoricalSync(domain::IDailyPriceSource& source, HistoryStore& store, HistoricalSyncOptions options = {});

    SyncSummary syncInstrument(const domain::Instrument& instrument, const domain::IsoDate& today);

private:
    domain::IDailyPriceSource& source_;
    HistoryStore& store_;
    HistoricalSyncOptions options_;
};

}  // namespace app
