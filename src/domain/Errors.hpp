#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace domain {

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

class PersistenceError : public std::runtime_error {
public:
    PersistenceError(std::string operation, std::string instrument, const std::string& detail)
        : std::runtime_error(operation + " failed for " + (instrument.empty() ? std::string{"<none>"} : instrument) +
                             ": " + detail),
          operation_(std::move(operation)),
          instrument_(std::move(instrument)) {}

    const std::string& operation() const noexcept { return operation_; }
    const std::string& instrument() const noexcept { return instrument_; }

private:
    std::string operation_;
    std::string instrument_;
};

}  // namespace domain
