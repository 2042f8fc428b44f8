#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Config.hpp"
#include "common/Errors.hpp"

namespace {

struct EnvGuard {
    explicit EnvGuard(std::vector<std::string> names) : names_(std::move(names)) {
        for (const auto& name : names_) {
            const char* current = std::getenv(name.c_str());
            saved_.push_back(current ? std::optional<std::string>{current} : std::nullopt);
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (saved_[i]) {
                ::setenv(names_[i].c_str(), saved_[i]->c_str(), 1);
            } else {
                ::unsetenv(names_[i].c_str());
            }
        }
    }

    std::vector<std::string> names_;
    std::vector<std::optional<std::string>> saved_;
};

gapfill::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return gapfill::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsConfigurationError(const std::vector<std::string>& args) {
    try {
        (void)runConfig(args);
    } catch (const gapfill::ConfigurationError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    EnvGuard env({"POLYGON_API_KEY", "LOG_LEVEL", "DUCKDB_PATH"});
    const std::filesystem::path workDir = std::filesystem::temp_directory_path() / "gapfill_test_config";
    std::filesystem::remove_all(workDir);
    std::filesystem::create_directories(workDir);
    const std::string duckPath = (workDir / "db" / "market.duckdb").string();

    // Missing or unknown data types are rejected.
    if (!throwsConfigurationError({"gapfill", "--duckdb", duckPath})) {
        std::cerr << "Expected ConfigurationError without data types\n";
        return 1;
    }
    if (!throwsConfigurationError({"gapfill", "--duckdb", duckPath, "--data-types", "candles,ticks"})) {
        std::cerr << "Expected ConfigurationError when no data type is valid\n";
        return 1;
    }
    if (!throwsConfigurationError(
            {"gapfill", "--duckdb", duckPath, "--data-types", "bars", "--query-start", "04/01/2021"})) {
        std::cerr << "Expected ConfigurationError for an unparseable query start\n";
        return 1;
    }
    if (!throwsConfigurationError(
            {"gapfill", "--duckdb", duckPath, "--data-types", "bars", "--query-start", "2021-02-30"})) {
        std::cerr << "Expected ConfigurationError for a query start on February 30th\n";
        return 1;
    }

    // Flags only; invalid names are dropped from the enabled set.
    {
        auto config = runConfig({"gapfill", "--duckdb", duckPath, "--data-types", "bars, quotes,candles",
                                 "--symbols", "aapl,msft", "--base-url", "https://api.example.test/",
                                 "--backfill-concurrency=16", "--add-bar-tick-count"});
        const auto types = config.enabledTypes();
        if (types.size() != 2 || types.count(domain::DataType::Bars) == 0 ||
            types.count(domain::DataType::Quotes) == 0) {
            std::cerr << "Expected bars and quotes to be enabled\n";
            return 1;
        }
        if (config.symbols != std::vector<std::string>{"AAPL", "MSFT"}) {
            std::cerr << "Expected symbols to be upper-cased\n";
            return 1;
        }
        if (config.baseUrl != "https://api.example.test") {
            std::cerr << "Expected trailing slash to be trimmed, got " << config.baseUrl << "\n";
            return 1;
        }
        if (config.backfillConcurrency != 16 || !config.addBarTickCount) {
            std::cerr << "Expected concurrency and tick count flags to apply\n";
            return 1;
        }
        if (!std::filesystem::exists(std::filesystem::path(duckPath).parent_path())) {
            std::cerr << "Expected the DuckDB parent directory to be created\n";
            return 1;
        }
    }

    // JSON file < environment < flags.
    {
        const auto file = workDir / "gapfill.json";
        std::ofstream out(file);
        out << R"({
            "api_key": "from-file",
            "data_types": ["bars", "trades"],
            "symbols": "SPY, QQQ",
            "query_start": "2021-01-04 09:30",
            "backfill_interval_ms": 5000,
            "backfill_per_core": 4,
            "backfill_max_requeues": 3,
            "log_level": "debug",
            "unknown_key": 1
        })";
        out.close();

        ::setenv("POLYGON_API_KEY", "from-env", 1);
        auto fromEnv = runConfig({"gapfill", "--config", file.string(), "--duckdb", duckPath});
        if (fromEnv.apiKey != "from-env") {
            std::cerr << "Expected environment to override the file, got " << fromEnv.apiKey << "\n";
            return 1;
        }
        if (fromEnv.symbols != std::vector<std::string>{"SPY", "QQQ"} || fromEnv.queryStart != "2021-01-04 09:30") {
            std::cerr << "Expected file values to be applied\n";
            return 1;
        }
        if (fromEnv.backfillIntervalMs != 5000 || fromEnv.backfillPerCore != 4 || fromEnv.backfillMaxRequeues != 3) {
            std::cerr << "Expected backfill tuning from the file\n";
            return 1;
        }
        if (fromEnv.logLevel != gapfill::log::Level::Debug) {
            std::cerr << "Expected log level from the file\n";
            return 1;
        }

        auto fromFlag = runConfig(
            {"gapfill", "--config", file.string(), "--duckdb", duckPath, "--api-key", "from-flag", "--log-level", "warn"});
        if (fromFlag.apiKey != "from-flag" || fromFlag.logLevel != gapfill::log::Level::Warn) {
            std::cerr << "Expected flags to override file and environment\n";
            return 1;
        }
        ::unsetenv("POLYGON_API_KEY");
    }

    // Type errors inside the JSON document.
    {
        bool thrown = false;
        try {
            (void)gapfill::common::Config::fromJson(R"({"backfill_concurrency": -2})");
        } catch (const gapfill::ConfigurationError&) {
            thrown = true;
        }
        if (!thrown) {
            std::cerr << "Expected ConfigurationError for a negative concurrency\n";
            return 1;
        }
    }

    // Scheme checks.
    if (!throwsConfigurationError(
            {"gapfill", "--duckdb", duckPath, "--data-types", "bars", "--ws-servers", "ws://insecure"})) {
        std::cerr << "Expected ConfigurationError for a non-TLS stream URL\n";
        return 1;
    }

    std::filesystem::remove_all(workDir);
    return 0;
}
