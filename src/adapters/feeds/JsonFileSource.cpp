#include "adapters/feeds/JsonFileSource.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "common/Log.hpp"

namespace adapters::feeds {

JsonFileSource::JsonFileSource(std::filesystem::path directory) : directory_(std::move(directory)) {}

std::filesystem::path JsonFileSource::fileFor(const domain::Instrument& instrument) const {
    const auto exact = directory_ / (instrument + ".json");
    std::error_code ec;
    if (std::filesystem::exists(exact, ec)) {
        return exact;
    }

    // File names are not normalized; match stems the way instruments are.
    const auto wanted = domain::normalize_instrument(instrument);
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.path().extension() == ".json" &&
            domain::normalize_instrument(entry.path().stem().string()) == wanted) {
            return entry.path();
        }
    }
    return exact;
}

domain::DailySeries JsonFileSource::fetchDaily(const domain::Instrument& instrument,
                                               const domain::IsoDate& fromDate,
                                               const domain::IsoDate& toDate) {
    const auto path = fileFor(instrument);
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("JsonFileSource: unable to open " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parser_.parse(buffer.str());
    if (!parsed.issues.empty()) {
        LOG_WARN("JsonFileSource skipped " << parsed.issues.size() << " malformed rows in " << path.string()
                                           << " (first: row " << parsed.issues.front().index << ": "
                                           << parsed.issues.front().message << ")");
    }

    domain::DailySeries window;
    window.reserve(parsed.candles.size());
    for (auto& candle : parsed.candles) {
        if (candle.date >= fromDate && candle.date <= toDate) {
            window.push_back(std::move(candle));
        }
    }

    LOG_DEBUG("JsonFileSource " << instrument << " [" << fromDate << ", " << toDate << "] -> " << window.size()
                                << " candles");
    return window;
}

}  // namespace adapters::feeds
