#include "adapters/duckdb/DuckMarketRepo.hpp"

#include <cstdint>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <duckdb.hpp>

#include "common/Errors.hpp"
#include "common/Log.hpp"

namespace adapters::duckdb {
namespace {

constexpr const char* kBarsGroup = "OHLCV";

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload and avoids the template path that triggers the static assert.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;
using BindRow = std::function<void(std::size_t, DuckdbValueVector&)>;

std::string join_conditions(const std::vector<std::int32_t>& conditions) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < conditions.size(); ++i) {
        if (i != 0) {
            oss << ',';
        }
        oss << conditions[i];
    }
    return oss.str();
}

// Executes `sql` once per row inside one transaction. Any failure rolls back and throws.
std::size_t execute_batch(::duckdb::DuckDB& db,
                          const char* table,
                          const char* sql,
                          std::size_t count,
                          const BindRow& bind) {
    if (count == 0) {
        return 0;
    }

    ::duckdb::Connection connection(db);
    connection.BeginTransaction();
    try {
        auto statement = connection.Prepare(sql);
        if (!statement || statement->HasError()) {
            const std::string errorMessage =
                statement ? statement->GetError() : std::string{"failed to prepare statement"};
            throw std::runtime_error(errorMessage);
        }

        DuckdbValueVector parameters;
        for (std::size_t index = 0; index < count; ++index) {
            parameters.clear();
            bind(index, parameters);
            auto result = statement->Execute(parameters);
            if (!result || result->HasError()) {
                const std::string errorMessage =
                    result ? result->GetError() : std::string{"failed to execute statement"};
                throw std::runtime_error(errorMessage);
            }
        }
        connection.Commit();
    } catch (const std::exception& ex) {
        try {
            connection.Rollback();
        } catch (const std::exception& rollbackEx) {
            LOG_WARN("DuckMarketRepo: rollback failed on " << table << ": " << rollbackEx.what());
        }
        throw std::runtime_error(std::string{"DuckMarketRepo: write to "} + table + " failed: " + ex.what());
    }
    return count;
}

}  // namespace

DuckMarketRepo::DuckMarketRepo(DuckStore& store) : store_(store) {}

std::optional<domain::TimestampSec> DuckMarketRepo::last_record_before(const domain::TimeBucketKey& key,
                                                                       domain::TimestampSec end) const {
    if (key.attributeGroup != kBarsGroup) {
        throw gapfill::TransientStoreError("DuckMarketRepo: unsupported attribute group for key " + key.str());
    }

    try {
        ::duckdb::Connection connection(store_.database());
        auto statement =
            connection.Prepare("SELECT MAX(ts) FROM bars WHERE symbol = ? AND timeframe = ? AND ts <= ?");
        if (!statement || statement->HasError()) {
            const std::string errorMessage =
                statement ? statement->GetError() : std::string{"failed to prepare statement"};
            throw gapfill::TransientStoreError("DuckMarketRepo prepare failed: " + errorMessage);
        }

        DuckdbValueVector parameters;
        parameters.emplace_back(key.symbol);
        parameters.emplace_back(key.timeframe);
        parameters.emplace_back(::duckdb::Value::BIGINT(end));

        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
            throw gapfill::TransientStoreError("DuckMarketRepo query failed for " + key.str() + ": " +
                                               errorMessage);
        }

        if (auto chunk = result->Fetch()) {
            if (chunk->size() > 0) {
                const auto value = chunk->GetValue(0, 0);
                if (!value.IsNull()) {
                    return value.GetValue<std::int64_t>();
                }
            }
        }
        return std::nullopt;
    } catch (const gapfill::TransientStoreError&) {
        throw;
    } catch (const std::exception& ex) {
        throw gapfill::TransientStoreError("DuckMarketRepo query exception for " + key.str() + ": " + ex.what());
    }
}

std::size_t DuckMarketRepo::write_bars(const std::vector<domain::Bar>& bars) {
    const std::string timeframe = domain::minute_timeframe().label;
    return execute_batch(store_.database(),
                         "bars",
                         "INSERT OR REPLACE INTO bars (symbol, timeframe, ts, o, h, l, c, v, tick_count) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
                         bars.size(),
                         [&](std::size_t index, DuckdbValueVector& parameters) {
                             const auto& bar = bars[index];
                             parameters.emplace_back(bar.symbol);
                             parameters.emplace_back(timeframe);
                             parameters.emplace_back(::duckdb::Value::BIGINT(bar.epoch));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(bar.open));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(bar.high));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(bar.low));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(bar.close));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(bar.volume));
                             if (bar.tickCount) {
                                 parameters.emplace_back(::duckdb::Value::BIGINT(*bar.tickCount));
                             } else {
                                 parameters.emplace_back(::duckdb::Value(::duckdb::LogicalType::BIGINT));
                             }
                         });
}

std::size_t DuckMarketRepo::write_quotes(const std::vector<domain::Quote>& quotes) {
    return execute_batch(store_.database(),
                         "quotes",
                         "INSERT INTO quotes (symbol, ts, nanos, bid_price, ask_price, bid_size, ask_size, "
                         "bid_exchange, ask_exchange) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)",
                         quotes.size(),
                         [&](std::size_t index, DuckdbValueVector& parameters) {
                             const auto& quote = quotes[index];
                             parameters.emplace_back(quote.symbol);
                             parameters.emplace_back(::duckdb::Value::BIGINT(quote.epoch));
                             parameters.emplace_back(::duckdb::Value::INTEGER(quote.nanos));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(quote.bidPrice));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(quote.askPrice));
                             parameters.emplace_back(::duckdb::Value::BIGINT(quote.bidSize));
                             parameters.emplace_back(::duckdb::Value::BIGINT(quote.askSize));
                             parameters.emplace_back(::duckdb::Value::INTEGER(quote.bidExchange));
                             parameters.emplace_back(::duckdb::Value::INTEGER(quote.askExchange));
                         });
}

std::size_t DuckMarketRepo::write_trades(const std::vector<domain::Trade>& trades) {
    return execute_batch(store_.database(),
                         "trades",
                         "INSERT INTO trades (symbol, ts, nanos, price, size, exchange, conditions) "
                         "VALUES (?, ?, ?, ?, ?, ?, ?)",
                         trades.size(),
                         [&](std::size_t index, DuckdbValueVector& parameters) {
                             const auto& trade = trades[index];
                             parameters.emplace_back(trade.symbol);
                             parameters.emplace_back(::duckdb::Value::BIGINT(trade.epoch));
                             parameters.emplace_back(::duckdb::Value::INTEGER(trade.nanos));
                             parameters.emplace_back(::duckdb::Value::DOUBLE(trade.price));
                             parameters.emplace_back(::duckdb::Value::BIGINT(trade.size));
                             parameters.emplace_back(::duckdb::Value::INTEGER(trade.exchange));
                             parameters.emplace_back(join_conditions(trade.conditions));
                         });
}

std::vector<domain::Bar> DuckMarketRepo::bars_between(const domain::Symbol& symbol,
                                                      domain::TimestampSec from,
                                                      domain::TimestampSec to) const {
    ::duckdb::Connection connection(store_.database());
    auto statement = connection.Prepare(
        "SELECT ts, o, h, l, c, v, tick_count FROM bars "
        "WHERE symbol = ? AND timeframe = ? AND ts >= ? AND ts < ? ORDER BY ts ASC");
    if (!statement || statement->HasError()) {
        const std::string errorMessage =
            statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw gapfill::TransientStoreError("DuckMarketRepo prepare failed: " + errorMessage);
    }

    DuckdbValueVector parameters;
    parameters.emplace_back(symbol);
    parameters.emplace_back(domain::minute_timeframe().label);
    parameters.emplace_back(::duckdb::Value::BIGINT(from));
    parameters.emplace_back(::duckdb::Value::BIGINT(to));

    auto result = statement->Execute(parameters);
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
        throw gapfill::TransientStoreError("DuckMarketRepo query failed: " + errorMessage);
    }

    std::vector<domain::Bar> bars;
    while (auto chunk = result->Fetch()) {
        const auto count = chunk->size();
        for (::duckdb::idx_t row = 0; row < count; ++row) {
            domain::Bar bar{};
            bar.symbol = symbol;
            bar.epoch = chunk->GetValue(0, row).GetValue<std::int64_t>();
            bar.open = chunk->GetValue(1, row).GetValue<double>();
            bar.high = chunk->GetValue(2, row).GetValue<double>();
            bar.low = chunk->GetValue(3, row).GetValue<double>();
            bar.close = chunk->GetValue(4, row).GetValue<double>();
            bar.volume = chunk->GetValue(5, row).GetValue<double>();
            const auto tickCount = chunk->GetValue(6, row);
            if (!tickCount.IsNull()) {
                bar.tickCount = tickCount.GetValue<std::int64_t>();
            }
            bars.push_back(bar);
        }
    }
    return bars;
}

}  // namespace adapters::duckdb
