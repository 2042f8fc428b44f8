#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr auto kCreateBarsTable = R"SQL(
    CREATE TABLE IF NOT EXISTS bars (
        symbol TEXT,
        timeframe TEXT,
        ts BIGINT,
        o DOUBLE,
        h DOUBLE,
        l DOUBLE,
        c DOUBLE,
        v DOUBLE,
        tick_count BIGINT,
        PRIMARY KEY(symbol, timeframe, ts)
    )
)SQL";

constexpr auto kCreateQuotesTable = R"SQL(
    CREATE TABLE IF NOT EXISTS quotes (
        symbol TEXT,
        ts BIGINT,
        nanos INTEGER,
        bid_price DOUBLE,
        ask_price DOUBLE,
        bid_size BIGINT,
        ask_size BIGINT,
        bid_exchange INTEGER,
        ask_exchange INTEGER
    )
)SQL";

constexpr auto kCreateTradesTable = R"SQL(
    CREATE TABLE IF NOT EXISTS trades (
        symbol TEXT,
        ts BIGINT,
        nanos INTEGER,
        price DOUBLE,
        size BIGINT,
        exchange INTEGER,
        conditions TEXT
    )
)SQL";

void run_statement(::duckdb::Connection& connection, const char* sql, const char* what) {
    auto result = connection.Query(sql);
    if (!result || result->HasError()) {
        const std::string errorMessage =
            result ? result->GetError() : std::string("unknown error creating ") + what + " table";
        throw std::runtime_error("DuckStore: migration failed: " + errorMessage);
    }
}

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    if (dbPath_ == kInMemory) {
        db_ = std::make_unique<::duckdb::DuckDB>(nullptr);
        return;
    }

    const fs::path path{dbPath_};
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("DuckStore: unable to create directory '" +
                                     path.parent_path().string() + "': " + ec.message());
        }
    }
    db_ = std::make_unique<::duckdb::DuckDB>(path.string());
}

DuckStore::~DuckStore() = default;

void DuckStore::migrate() {
    ::duckdb::Connection connection(*db_);
    run_statement(connection, kCreateBarsTable, "bars");
    run_statement(connection, kCreateQuotesTable, "quotes");
    run_statement(connection, kCreateTradesTable, "trades");
    LOG_INFO("DuckStore migration finished for " << dbPath_);
}

}  // namespace adapters::duckdb
