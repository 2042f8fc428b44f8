#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "app/FetcherService.hpp"
#include "common/Config.hpp"

namespace {

class MemoryStore : public domain::contracts::ILastRecordQuery, public domain::contracts::IMarketDataWriter {
public:
    std::optional<domain::TimestampSec> last_record_before(const domain::TimeBucketKey& key,
                                                           domain::TimestampSec end) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<domain::TimestampSec> best;
        for (const auto& bar : bars_) {
            if (bar.symbol == key.symbol && bar.epoch <= end && (!best || bar.epoch > *best)) {
                best = bar.epoch;
            }
        }
        return best;
    }

    std::size_t write_bars(const std::vector<domain::Bar>& bars) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bars_.insert(bars_.end(), bars.begin(), bars.end());
        return bars.size();
    }
    std::size_t write_quotes(const std::vector<domain::Quote>& quotes) override { return quotes.size(); }
    std::size_t write_trades(const std::vector<domain::Trade>& trades) override { return trades.size(); }

    std::size_t bar_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bars_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::Bar> bars_;
};

class ScriptedHistory : public domain::contracts::IHistoricalBars {
public:
    std::vector<domain::Bar> fetch_minute_bars(const domain::Symbol& symbol,
                                               domain::TimestampSec from,
                                               domain::TimestampSec to) override {
        requests.push_back({from, to});
        std::vector<domain::Bar> bars;
        for (auto ts = from + 60; ts < to && ts <= from + 240; ts += 60) {
            domain::Bar bar{};
            bar.symbol = symbol;
            bar.epoch = ts;
            bars.push_back(bar);
        }
        return bars;
    }

    std::vector<std::pair<domain::TimestampSec, domain::TimestampSec>> requests;
};

class FakeStream : public domain::contracts::IMarketStream {
public:
    void start(domain::contracts::StreamHandlers h) override {
        handlers = std::move(h);
        started = true;
        if (handlers.onReconnected) {
            handlers.onReconnected();
        }
    }
    void stop() override { stopped = true; }

    domain::contracts::StreamHandlers handlers;
    bool started{false};
    bool stopped{false};
};

domain::Bar liveBar(domain::TimestampSec epoch) {
    domain::Bar bar{};
    bar.symbol = "AAPL";
    bar.epoch = epoch;
    return bar;
}

}  // namespace

int main() {
    gapfill::common::Config config;
    config.dataTypes = {"bars"};
    config.backfillIntervalMs = 60000;
    config.backfillConcurrency = 2;

    MemoryStore store;
    ScriptedHistory history;
    FakeStream stream;

    // History up to 09:00, stream resumes at 09:30.
    constexpr domain::TimestampSec kLastStored = 1609750800;
    constexpr domain::TimestampSec kResume = 1609752600;
    (void)store.write_bars({liveBar(kLastStored)});

    app::FetcherService service(config, store, store, history, stream);
    service.start();
    if (!stream.started || !stream.handlers.onBar) {
        std::cerr << "Expected the stream to be started with router handlers\n";
        return 1;
    }

    stream.handlers.onBar(liveBar(kResume));
    if (service.registry().pending_marker("AAPL") != kResume) {
        std::cerr << "Expected the first live bar to mark AAPL\n";
        return 1;
    }

    const auto stats = service.scheduler().run_cycle();
    if (stats.backfilled != 1 || stats.rows != 4) {
        std::cerr << "Expected one backfill with 4 rows, got backfilled=" << stats.backfilled
                  << " rows=" << stats.rows << "\n";
        return 1;
    }
    if (history.requests.size() != 1 || history.requests[0].first != kLastStored) {
        std::cerr << "Expected the backfill to start at the last stored bar\n";
        return 1;
    }
    if (store.bar_count() != 6) {
        std::cerr << "Expected stored + live + backfilled bars, got " << store.bar_count() << "\n";
        return 1;
    }

    // Second live bar of the same session is not a gap.
    stream.handlers.onBar(liveBar(kResume + 60));
    if (service.registry().pending_count() != 0) {
        std::cerr << "Expected no new gap inside a session\n";
        return 1;
    }

    service.stop();
    if (!stream.stopped || service.scheduler().running()) {
        std::cerr << "Expected stop to halt stream and scheduler\n";
        return 1;
    }
    return 0;
}
