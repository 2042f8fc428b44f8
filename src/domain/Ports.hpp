#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace domain::contracts {

class ILastRecordQuery {
public:
    virtual ~ILastRecordQuery() = default;

    // Epoch of the newest record for `key` at or before `end`, nullopt when there is none.
    // Throws gapfill::TransientStoreError when the store cannot be read.
    virtual std::optional<TimestampSec> last_record_before(const TimeBucketKey& key,
                                                           TimestampSec end) const = 0;
};

class IMarketDataWriter {
public:
    virtual ~IMarketDataWriter() = default;

    virtual std::size_t write_bars(const std::vector<Bar>& bars) = 0;
    virtual std::size_t write_quotes(const std::vector<Quote>& quotes) = 0;
    virtual std::size_t write_trades(const std::vector<Trade>& trades) = 0;
};

class IBackfillExecutor {
public:
    virtual ~IBackfillExecutor() = default;

    // Fetches and persists [from, to). Throws gapfill::FetchError on failure.
    virtual std::size_t fetch_and_persist(const Symbol& symbol,
                                          TimestampSec from,
                                          std::optional<TimestampSec> to) = 0;
};

class IGapNotifier {
public:
    virtual ~IGapNotifier() = default;

    virtual void notify_gap(const Symbol& symbol, TimestampSec lastKnown) = 0;
};

class IHistoricalBars {
public:
    virtual ~IHistoricalBars() = default;

    virtual std::vector<Bar> fetch_minute_bars(const Symbol& symbol,
                                               TimestampSec from,
                                               TimestampSec to) = 0;
};

struct StreamHandlers {
    std::function<void(const Bar&)> onBar;
    std::function<void(const Quote&)> onQuote;
    std::function<void(const Trade&)> onTrade;
    std::function<void()> onReconnected;
};

class IMarketStream {
public:
    virtual ~IMarketStream() = default;

    virtual void start(StreamHandlers handlers) = 0;
    virtual void stop() = 0;
};

}  // namespace domain::contracts
