#pragma once

#include <filesystem>
#include <string>

#include "adapters/feeds/CandleJsonParser.hpp"
#include "domain/Ports.hpp"

namespace adapters::feeds {

// Serves <directory>/<INSTRUMENT>.json as an upstream daily price source.
class JsonFileSource : public domain::IDailyPriceSource {
public:
    explicit JsonFileSource(std::filesystem::path directory);

    domain::DailySeries fetchDaily(const domain::Instrument& instrument,
                                   const domain::IsoDate& fromDate,
                                   const domain::IsoDate& toDate) override;

    std::filesystem::path fileFor(const domain::Instrument& instrument) const;

private:
    std::filesystem::path directory_;
    CandleJsonParser parser_{};
};

}  // namespace adapters::feeds
