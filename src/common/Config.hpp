#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "common/Log.hpp"
#include "domain/Types.hpp"

namespace gapfill::common {

struct Config {
    Config();

    gapfill::log::Level logLevel = gapfill::log::Level::Info;

    std::string apiKey;
    std::string baseUrl = "https://api.polygon.io";
    std::string wsServers = "wss://socket.polygon.io";
    std::vector<std::string> dataTypes{};
    std::vector<std::string> symbols{};
    std::string queryStart;
    bool addBarTickCount = false;

    std::string duckdbPath = "data/market.duckdb";

    std::uint32_t backfillIntervalMs = 30000;
    std::size_t backfillConcurrency = 0;
    std::size_t backfillPerCore = 10;
    std::size_t backfillMaxRequeues = 0;

    // Valid entries of dataTypes; unknown names are dropped.
    std::set<domain::DataType> enabledTypes() const;

    // Throws gapfill::ConfigurationError.
    void validate() const;

    // Defaults < --config JSON file < environment < flags. Validates the result.
    static Config fromArgs(int argc, char** argv);

    // Applies the keys of a JSON object on top of `base`.
    static Config fromJson(const std::string& text, Config base = {});
};

inline Config::Config() = default;

}  // namespace gapfill::common
