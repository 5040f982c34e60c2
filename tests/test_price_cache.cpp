#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/PriceCache.h"

using core::PriceCache;

namespace {

PriceCache::Snapshot seriesOf(const std::string& date, double close) {
    domain::DailyCandle c{};
    c.date = date;
    c.open = close;
    c.high = close;
    c.low = close;
    c.close = close;
    return std::make_shared<const std::vector<domain::DailyCandle>>(std::vector<domain::DailyCandle>{c});
}

}  // namespace

int main() {
    // Miss, store, hit.
    {
        PriceCache cache;
        if (cache.find("AAPL") != nullptr) {
            std::cerr << "Expected a miss on an empty cache\n";
            return 1;
        }
        const auto ticket = cache.ticket("AAPL");
        if (!cache.storeIfCurrent("AAPL", ticket, seriesOf("2025-01-02", 10.0))) {
            std::cerr << "Expected a fresh ticket to be accepted\n";
            return 1;
        }
        const auto hit = cache.find("AAPL");
        if (!hit || hit->size() != 1 || hit->front().close != 10.0) {
            std::cerr << "Expected the stored snapshot back\n";
            return 1;
        }
    }

    // A null snapshot is stored as an empty series rather than a miss.
    {
        PriceCache cache;
        cache.storeIfCurrent("EMPTY", cache.ticket("EMPTY"), nullptr);
        const auto hit = cache.find("EMPTY");
        if (!hit || !hit->empty()) {
            std::cerr << "Expected an empty cached series\n";
            return 1;
        }
    }

    // Invalidating one instrument leaves the others alone.
    {
        PriceCache cache;
        cache.storeIfCurrent("AAA", cache.ticket("AAA"), seriesOf("2025-01-02", 1.0));
        cache.storeIfCurrent("BBB", cache.ticket("BBB"), seriesOf("2025-01-02", 2.0));
        const auto before = cache.find("BBB");

        cache.invalidate("AAA");
        if (cache.find("AAA") != nullptr) {
            std::cerr << "Expected AAA to be evicted\n";
            return 1;
        }
        const auto after = cache.find("BBB");
        if (!after || after != before || after->front().close != 2.0) {
            std::cerr << "Invalidating AAA must not touch BBB\n";
            return 1;
        }
        if (cache.size() != 1) {
            std::cerr << "Expected one cached instrument, got " << cache.size() << "\n";
            return 1;
        }
    }

    // A result computed before an invalidation is rejected.
    {
        PriceCache cache;
        const auto stale = cache.ticket("MSFT");
        cache.invalidate("MSFT");
        if (cache.storeIfCurrent("MSFT", stale, seriesOf("2025-01-02", 5.0))) {
            std::cerr << "Expected a stale ticket to be rejected after invalidate\n";
            return 1;
        }
        if (cache.find("MSFT") != nullptr) {
            std::cerr << "Rejected store must not populate the cache\n";
            return 1;
        }

        const auto otherTicket = cache.ticket("NVDA");
        cache.invalidate("MSFT");
        if (!cache.storeIfCurrent("NVDA", otherTicket, seriesOf("2025-01-02", 6.0))) {
            std::cerr << "Invalidating MSFT must not reject an NVDA store\n";
            return 1;
        }
    }

    // invalidateAll clears everything and rejects every outstanding ticket.
    {
        PriceCache cache;
        cache.storeIfCurrent("AAA", cache.ticket("AAA"), seriesOf("2025-01-02", 1.0));
        const auto outstanding = cache.ticket("BBB");
        const auto kept = cache.find("AAA");

        cache.invalidateAll();
        if (cache.size() != 0 || cache.find("AAA") != nullptr) {
            std::cerr << "Expected an empty cache after invalidateAll\n";
            return 1;
        }
        if (cache.storeIfCurrent("BBB", outstanding, seriesOf("2025-01-02", 2.0))) {
            std::cerr << "Expected tickets issued before invalidateAll to be rejected\n";
            return 1;
        }
        if (!kept || kept->front().close != 1.0) {
            std::cerr << "A snapshot held by a reader must survive eviction\n";
            return 1;
        }
    }

    // Per-instrument generations are dropped by invalidateAll without reviving old tickets.
    {
        PriceCache cache;
        const auto beforeInvalidate = cache.ticket("CCC");
        cache.invalidate("AAA");
        cache.invalidate("BBB");
        cache.invalidate("CCC");
        if (cache.trackedGenerations() != 3) {
            std::cerr << "Expected three tracked generations, got " << cache.trackedGenerations() << "\n";
            return 1;
        }
        const auto afterInvalidate = cache.ticket("CCC");

        cache.invalidateAll();
        if (cache.trackedGenerations() != 0) {
            std::cerr << "invalidateAll must drop the generation map, got " << cache.trackedGenerations() << "\n";
            return 1;
        }
        // CCC is back at generation 0, but both older tickets carry the previous epoch.
        if (cache.storeIfCurrent("CCC", beforeInvalidate, seriesOf("2025-01-02", 3.0)) ||
            cache.storeIfCurrent("CCC", afterInvalidate, seriesOf("2025-01-02", 3.0))) {
            std::cerr << "Tickets from before invalidateAll must stay stale\n";
            return 1;
        }
        if (!cache.storeIfCurrent("CCC", cache.ticket("CCC"), seriesOf("2025-01-03", 3.5)) ||
            cache.find("CCC")->front().close != 3.5) {
            std::cerr << "Expected a fresh ticket to store after invalidateAll\n";
            return 1;
        }
    }

    // Concurrent readers and writers on distinct keys.
    {
        PriceCache cache;
        constexpr int kThreads = 8;
        constexpr int kIterations = 500;
        std::atomic<bool> failed{false};

        std::vector<std::thread> workers;
        for (int t = 0; t < kThreads; ++t) {
            workers.emplace_back([&cache, &failed, t]() {
                const auto instrument = "INST" + std::to_string(t);
                for (int i = 0; i < kIterations; ++i) {
                    const auto close = static_cast<double>(t * kIterations + i + 1);
                    cache.storeIfCurrent(instrument, cache.ticket(instrument), seriesOf("2025-01-02", close));
                    const auto hit = cache.find(instrument);
                    if (!hit || hit->size() != 1 || hit->front().close != close) {
                        failed = true;
                    }
                    if (i % 50 == 0) {
                        cache.invalidate(instrument);
                    }
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        if (failed) {
            std::cerr << "A worker observed another instrument's or a torn snapshot\n";
            return 1;
        }
    }

    return 0;
}
