#pragma once

#include <optional>
#include <vector>

#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckMarketRepo : public domain::contracts::ILastRecordQuery,
                       public domain::contracts::IMarketDataWriter {
public:
    explicit DuckMarketRepo(DuckStore& store);

    std::optional<domain::TimestampSec> last_record_before(const domain::TimeBucketKey& key,
                                                           domain::TimestampSec end) const override;

    // Upserts on (symbol, timeframe, ts); replaying a range leaves one row per minute.
    std::size_t write_bars(const std::vector<domain::Bar>& bars) override;
    std::size_t write_quotes(const std::vector<domain::Quote>& quotes) override;
    std::size_t write_trades(const std::vector<domain::Trade>& trades) override;

    // Read-back of stored minute bars in [from, to), ordered by ts. The service never calls it;
    // it is there for checks against a store file.
    std::vector<domain::Bar> bars_between(const domain::Symbol& symbol,
                                          domain::TimestampSec from,
                                          domain::TimestampSec to) const;

private:
    DuckStore& store_;
};

}  // namespace adapters::duckdb
