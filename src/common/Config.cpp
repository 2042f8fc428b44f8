#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <boost/json.hpp>

#include "common/Errors.hpp"
#include "common/TimeParse.hpp"

namespace gapfill::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(value);
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw ConfigurationError("Invalid boolean for " + label + ": " + value);
}

std::uint32_t parseDurationMs(const std::string& value, const std::string& label) {
    try {
        const auto parsed = std::stoul(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("duration out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseSize(const std::string& value, const std::string& label) {
    try {
        if (!value.empty() && value.front() == '-') {
            throw std::out_of_range("negative size");
        }
        const auto parsed = std::stoull(value);
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid value for " + label + ": " + value);
    }
}

gapfill::log::Level parseLevel(const std::string& value) {
    try {
        return gapfill::log::levelFromString(toLower(value));
    } catch (const std::invalid_argument& ex) {
        throw ConfigurationError(ex.what());
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

std::string readFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigurationError("Unable to open config file: " + path);
    }
    return std::string{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

std::string jsonString(const boost::json::value& value, const char* key) {
    if (!value.is_string()) {
        throw ConfigurationError(std::string{"Config key '"} + key + "' must be a string");
    }
    return std::string{value.as_string().c_str()};
}

std::vector<std::string> jsonStringList(const boost::json::value& value, const char* key) {
    // A comma separated string is accepted as well.
    if (value.is_string()) {
        return parseCsvList(std::string{value.as_string().c_str()});
    }
    if (!value.is_array()) {
        throw ConfigurationError(std::string{"Config key '"} + key + "' must be a list of strings");
    }
    std::vector<std::string> items;
    for (const auto& item : value.as_array()) {
        auto text = trim(jsonString(item, key));
        if (!text.empty()) {
            items.push_back(std::move(text));
        }
    }
    return items;
}

std::uint64_t jsonUnsigned(const boost::json::value& value, const char* key) {
    if (value.is_uint64()) {
        return value.as_uint64();
    }
    if (value.is_int64() && value.as_int64() >= 0) {
        return static_cast<std::uint64_t>(value.as_int64());
    }
    if (value.is_string()) {
        return parseSize(std::string{value.as_string().c_str()}, key);
    }
    throw ConfigurationError(std::string{"Config key '"} + key + "' must be a non-negative integer");
}

bool jsonBool(const boost::json::value& value, const char* key) {
    if (value.is_bool()) {
        return value.as_bool();
    }
    if (value.is_string()) {
        return parseBool(std::string{value.as_string().c_str()}, key);
    }
    throw ConfigurationError(std::string{"Config key '"} + key + "' must be a boolean");
}

}  // namespace

std::set<domain::DataType> Config::enabledTypes() const {
    std::set<domain::DataType> types;
    for (const auto& name : dataTypes) {
        if (auto type = domain::data_type_from_string(name)) {
            types.insert(*type);
        }
    }
    return types;
}

void Config::validate() const {
    if (enabledTypes().empty()) {
        throw ConfigurationError("at least one valid data_type is required");
    }
    if (!queryStart.empty()) {
        parseQueryStart(queryStart);
    }
    if (baseUrl.rfind("https://", 0) != 0) {
        throw ConfigurationError("base_url must start with https://, got: " + baseUrl);
    }
    if (wsServers.rfind("wss://", 0) != 0) {
        throw ConfigurationError("ws_servers must start with wss://, got: " + wsServers);
    }
    if (backfillPerCore == 0) {
        throw ConfigurationError("backfill_per_core must be >= 1");
    }
}

Config Config::fromJson(const std::string& text, Config base) {
    boost::json::value root;
    try {
        root = boost::json::parse(text);
    } catch (const std::exception& ex) {
        throw ConfigurationError(std::string{"Config is not valid JSON: "} + ex.what());
    }
    if (!root.is_object()) {
        throw ConfigurationError("Config root must be a JSON object");
    }

    Config config = std::move(base);
    for (const auto& field : root.as_object()) {
        const std::string key(field.key().data(), field.key().size());
        const auto& value = field.value();
        if (value.is_null()) {
            continue;
        }

        if (key == "api_key") {
            config.apiKey = jsonString(value, "api_key");
        } else if (key == "base_url") {
            config.baseUrl = trim(jsonString(value, "base_url"));
        } else if (key == "ws_servers") {
            config.wsServers = trim(jsonString(value, "ws_servers"));
        } else if (key == "data_types") {
            config.dataTypes = jsonStringList(value, "data_types");
        } else if (key == "symbols") {
            config.symbols = jsonStringList(value, "symbols");
        } else if (key == "query_start") {
            config.queryStart = trim(jsonString(value, "query_start"));
        } else if (key == "add_bar_tick_count") {
            config.addBarTickCount = jsonBool(value, "add_bar_tick_count");
        } else if (key == "duckdb_path") {
            config.duckdbPath = trim(jsonString(value, "duckdb_path"));
        } else if (key == "backfill_interval_ms") {
            config.backfillIntervalMs =
                parseDurationMs(std::to_string(jsonUnsigned(value, "backfill_interval_ms")), "backfill_interval_ms");
        } else if (key == "backfill_concurrency") {
            config.backfillConcurrency = static_cast<std::size_t>(jsonUnsigned(value, "backfill_concurrency"));
        } else if (key == "backfill_per_core") {
            config.backfillPerCore = static_cast<std::size_t>(jsonUnsigned(value, "backfill_per_core"));
        } else if (key == "backfill_max_requeues") {
            config.backfillMaxRequeues = static_cast<std::size_t>(jsonUnsigned(value, "backfill_max_requeues"));
        } else if (key == "log_level") {
            config.logLevel = parseLevel(jsonString(value, "log_level"));
        } else {
            LOG_WARN("Config: ignoring unknown key '" << key << "'");
        }
    }
    return config;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto fileArg = valueFromArgs(argc, argv, "--config"); !fileArg.empty()) {
        config = fromJson(readFile(fileArg), std::move(config));
    }

    if (const char* envKey = std::getenv("POLYGON_API_KEY")) {
        config.apiKey = envKey;
    }
    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLevel(envLogLevel);
    }
    if (const char* envDuck = std::getenv("DUCKDB_PATH")) {
        auto pathValue = trim(envDuck);
        if (!pathValue.empty()) {
            config.duckdbPath = std::move(pathValue);
        }
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg);
    }
    if (auto keyArg = valueFromArgs(argc, argv, "--api-key"); !keyArg.empty()) {
        config.apiKey = keyArg;
    }
    if (auto baseArg = valueFromArgs(argc, argv, "--base-url"); !baseArg.empty()) {
        config.baseUrl = trim(baseArg);
    }
    if (auto wsArg = valueFromArgs(argc, argv, "--ws-servers"); !wsArg.empty()) {
        config.wsServers = trim(wsArg);
    }
    if (auto typesArg = valueFromArgs(argc, argv, "--data-types"); !typesArg.empty()) {
        config.dataTypes = parseCsvList(typesArg);
    }
    if (auto symbolsArg = valueFromArgs(argc, argv, "--symbols"); !symbolsArg.empty()) {
        config.symbols = parseCsvList(symbolsArg);
    }
    if (auto startArg = valueFromArgs(argc, argv, "--query-start"); !startArg.empty()) {
        config.queryStart = trim(startArg);
    }
    if (hasFlag(argc, argv, "--add-bar-tick-count")) {
        config.addBarTickCount = true;
    }
    if (auto duckArg = valueFromArgs(argc, argv, "--duckdb"); !duckArg.empty()) {
        config.duckdbPath = duckArg;
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--backfill-interval-ms"); !intervalArg.empty()) {
        config.backfillIntervalMs = parseDurationMs(intervalArg, "--backfill-interval-ms");
    }
    if (auto concurrencyArg = valueFromArgs(argc, argv, "--backfill-concurrency"); !concurrencyArg.empty()) {
        config.backfillConcurrency = parseSize(concurrencyArg, "--backfill-concurrency");
    }
    if (auto perCoreArg = valueFromArgs(argc, argv, "--backfill-per-core"); !perCoreArg.empty()) {
        config.backfillPerCore = parseSize(perCoreArg, "--backfill-per-core");
    }
    if (auto requeueArg = valueFromArgs(argc, argv, "--backfill-max-requeues"); !requeueArg.empty()) {
        config.backfillMaxRequeues = parseSize(requeueArg, "--backfill-max-requeues");
    }

    for (auto& symbol : config.symbols) {
        std::transform(symbol.begin(), symbol.end(), symbol.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
    }
    while (!config.baseUrl.empty() && config.baseUrl.back() == '/') {
        config.baseUrl.pop_back();
    }
    while (!config.wsServers.empty() && config.wsServers.back() == '/') {
        config.wsServers.pop_back();
    }

    config.validate();

    const std::filesystem::path duckPath{config.duckdbPath};
    const auto parentDir = duckPath.parent_path();
    if (!parentDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parentDir, ec);
        if (ec) {
            throw ConfigurationError("Unable to create DuckDB directory (" + parentDir.string() + "): " +
                                     ec.message());
        }
    }

    return config;
}

}  // namespace gapfill::common
