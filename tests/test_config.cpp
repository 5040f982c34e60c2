#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "app/HistoricalSync.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::string name) : name(std::move(name)) {
        const char* current = std::getenv(this->name.c_str());
        if (current) {
            originalValue = current;
            hadOriginal = true;
        }
    }

    ~EnvGuard() {
        if (hadOriginal) {
            ::setenv(name.c_str(), originalValue.c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    void clear() { ::unsetenv(name.c_str()); }

    void set(const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }

    std::string name;
    bool hadOriginal{false};
    std::string originalValue;
};

::cg::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::cg::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

// Swaps a stream's buffer for a capture buffer for the lifetime of the guard.
struct StreamCapture {
    explicit StreamCapture(std::ostream& stream) : stream(stream), previous(stream.rdbuf(captured.rdbuf())) {}
    ~StreamCapture() { stream.rdbuf(previous); }

    std::ostream& stream;
    std::ostringstream captured;
    std::streambuf* previous;
};

bool throwsRuntimeError(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard duckGuard("DUCKDB_PATH");
    EnvGuard levelGuard("LOG_LEVEL");
    const std::string flagPath = "/tmp/candleguard/flag/prices.duckdb";
    const std::string envPath = "/tmp/candleguard/env/prices.duckdb";

    // Defaults when env and flags are absent; ":memory:" avoids creating data/.
    duckGuard.set(":memory:");
    levelGuard.clear();
    auto configDefault = runConfig({"app"});
    if (configDefault.duckdbPath != ":memory:" || configDefault.logLevel != cg::log::Level::Info ||
        configDefault.initialBackfillYears != 10 || configDefault.incrementalBackfillDays != 365 ||
        configDefault.repairReport || !configDefault.inputDir.empty()) {
        std::cerr << "Unexpected defaults\n";
        return 1;
    }
    duckGuard.clear();
    if (cg::common::Config{}.duckdbPath != "data/prices.duckdb") {
        std::cerr << "Expected default DuckDB path data/prices.duckdb\n";
        return 1;
    }

    // Environment variable overrides default.
    duckGuard.set(envPath);
    std::filesystem::remove_all(std::filesystem::path(envPath).parent_path());
    auto configEnv = runConfig({"app"});
    if (configEnv.duckdbPath != envPath) {
        std::cerr << "Expected env DuckDB path to be " << envPath << " but got " << configEnv.duckdbPath << "\n";
        return 1;
    }
    if (!std::filesystem::exists(std::filesystem::path(envPath).parent_path())) {
        std::cerr << "Expected parent directory for env path to be created\n";
        return 1;
    }
    std::filesystem::remove_all(std::filesystem::path(envPath).parent_path());

    // CLI flag overrides environment variable.
    std::filesystem::remove_all(std::filesystem::path(flagPath).parent_path());
    auto configFlag = runConfig({"app", "--duckdb", flagPath});
    if (configFlag.duckdbPath != flagPath) {
        std::cerr << "Expected flag DuckDB path to be " << flagPath << " but got " << configFlag.duckdbPath << "\n";
        return 1;
    }
    if (!std::filesystem::exists(std::filesystem::path(flagPath).parent_path())) {
        std::cerr << "Expected parent directory for flag path to be created\n";
        return 1;
    }
    std::filesystem::remove_all(std::filesystem::path(flagPath).parent_path());

    // Remaining flags, both "--key value" and "--key=value".
    duckGuard.set(":memory:");
    levelGuard.set("warn");
    auto configFlags = runConfig({"app", "--input", "prices/", "--initial-backfill-years=5",
                                  "--incremental-backfill-days", "30", "--repair-report"});
    if (configFlags.inputDir != "prices/" || configFlags.initialBackfillYears != 5 ||
        configFlags.incrementalBackfillDays != 30 || !configFlags.repairReport ||
        configFlags.logLevel != cg::log::Level::Warn) {
        std::cerr << "Flags were not applied\n";
        return 1;
    }
    if (runConfig({"app", "--log-level=debug"}).logLevel != cg::log::Level::Debug) {
        std::cerr << "--log-level should override LOG_LEVEL\n";
        return 1;
    }
    if (runConfig({"app", "--repair-report=false"}).repairReport) {
        std::cerr << "--repair-report=false should disable the report\n";
        return 1;
    }

    const auto options = app::HistoricalSyncOptions::fromConfig(configFlags);
    if (options.initialBackfillYears != 5 || options.incrementalBackfillDays != 30) {
        std::cerr << "Sync options should follow the config\n";
        return 1;
    }

    // Invalid values are rejected.
    if (!throwsRuntimeError({"app", "--initial-backfill-years", "0"}) ||
        !throwsRuntimeError({"app", "--incremental-backfill-days=ten"}) ||
        !throwsRuntimeError({"app", "--log-level", "verbose"}) ||
        !throwsRuntimeError({"app", "--repair-report=maybe"})) {
        std::cerr << "Expected invalid values to be rejected\n";
        return 1;
    }
    // Level aliases and the scoped override.
    if (cg::log::levelFromString("WARNING") != cg::log::Level::Warn ||
        cg::log::levelFromString("trace") != cg::log::Level::Debug ||
        cg::log::levelFromString("3") != cg::log::Level::Error) {
        std::cerr << "Level aliases were not recognised\n";
        return 1;
    }
    cg::log::setLevel(cg::log::Level::Info);
    {
        const cg::log::ScopedLevel quiet(cg::log::Level::Error);
        if (cg::log::shouldLog(cg::log::Level::Warn) || !cg::log::shouldLog(cg::log::Level::Error)) {
            std::cerr << "ScopedLevel did not apply\n";
            return 1;
        }
    }
    if (cg::log::getLevel() != cg::log::Level::Info) {
        std::cerr << "ScopedLevel did not restore the previous level\n";
        return 1;
    }

    // Debug and info lines go to stdout, warn and error lines to stderr.
    {
        const cg::log::ScopedLevel verbose(cg::log::Level::Debug);
        std::string outText;
        std::string errText;
        {
            StreamCapture out(std::cout);
            StreamCapture err(std::cerr);
            cg::log::log(cg::log::Level::Debug, "config-test", "debug line");
            cg::log::log(cg::log::Level::Info, "config-test", "info line");
            cg::log::log(cg::log::Level::Warn, "config-test", "warn line");
            cg::log::log(cg::log::Level::Error, "config-test", "error line");
            outText = out.captured.str();
            errText = err.captured.str();
        }
        if (outText.find("debug line") == std::string::npos || outText.find("info line") == std::string::npos ||
            outText.find("warn line") != std::string::npos || outText.find("error line") != std::string::npos) {
            std::cerr << "Expected only debug and info lines on stdout, got: " << outText << "\n";
            return 1;
        }
        if (errText.find("warn line") == std::string::npos || errText.find("error line") == std::string::npos ||
            errText.find("info line") != std::string::npos || errText.find("[config-test]") == std::string::npos) {
            std::cerr << "Expected only warn and error lines on stderr, got: " << errText << "\n";
            return 1;
        }
    }

    levelGuard.set("loud");
    if (!throwsRuntimeError({"app"})) {
        std::cerr << "Expected an invalid LOG_LEVEL to be rejected\n";
        return 1;
    }

    return 0;
}
