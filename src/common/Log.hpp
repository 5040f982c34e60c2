#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace cg::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;

// Debug and info lines go to stdout, warn and error lines to stderr.
void log(Level level, std::string_view component, const std::string& message);

const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Restores the previous level on destruction.
class ScopedLevel {
public:
    explicit ScopedLevel(Level level) noexcept : previous_(getLevel()) { setLevel(level); }
    ~ScopedLevel() { setLevel(previous_); }

    ScopedLevel(const ScopedLevel&) = delete;
    ScopedLevel& operator=(const ScopedLevel&) = delete;

private:
    Level previous_;
};

}  // namespace cg::log

#ifndef CG_LOG_COMPONENT
#define CG_LOG_COMPONENT "candleguard"
#endif

#define CG_LOG_IMPL(level, expr)                                                           \
    do {                                                                                   \
        if (::cg::log::shouldLog(level)) {                                                 \
            std::ostringstream cg_log_stream__;                                            \
            cg_log_stream__ << expr;                                                       \
            ::cg::log::log(level, CG_LOG_COMPONENT, cg_log_stream__.str());                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) CG_LOG_IMPL(::cg::log::Level::Debug, expr)
#define LOG_INFO(expr) CG_LOG_IMPL(::cg::log::Level::Info, expr)
#define LOG_WARN(expr) CG_LOG_IMPL(::cg::log::Level::Warn, expr)
#define LOG_ERR(expr) CG_LOG_IMPL(::cg::log::Level::Error, expr)
