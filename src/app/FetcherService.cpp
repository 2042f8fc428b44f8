#include "app/FetcherService.hpp"

#include <chrono>

#include "common/Log.hpp"

namespace app {
namespace {

RangeResolver::Options resolver_options(const gapfill::common::Config& config) {
    RangeResolver::Options options;
    options.queryStart = config.queryStart;
    return options;
}

BackfillScheduler::Options scheduler_options(const gapfill::common::Config& config) {
    BackfillScheduler::Options options;
    options.interval = std::chrono::milliseconds(config.backfillIntervalMs);
    options.concurrency = config.backfillConcurrency;
    options.perCore = config.backfillPerCore;
    options.maxRequeues = config.backfillMaxRequeues;
    return options;
}

StreamRouter::Options router_options(const gapfill::common::Config& config) {
    StreamRouter::Options options;
    options.dataTypes = config.enabledTypes();
    options.symbols = config.symbols;
    options.addBarTickCount = config.addBarTickCount;
    return options;
}

}  // namespace

FetcherService::FetcherService(const gapfill::common::Config& config,
                               const domain::contracts::ILastRecordQuery& store,
                               domain::contracts::IMarketDataWriter& writer,
                               domain::contracts::IHistoricalBars& history,
                               domain::contracts::IMarketStream& stream)
    : stream_(stream),
      resolver_(store, resolver_options(config)),
      backfiller_(history, writer),
      scheduler_(registry_, resolver_, backfiller_, scheduler_options(config)),
      router_(writer, registry_, router_options(config)) {}

FetcherService::~FetcherService() {
    stop();
}

void FetcherService::start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) {
        return;
    }
    scheduler_.start();
    stream_.start(router_.handlers());
    LOG_INFO("FetcherService: started, backfill concurrency=" << scheduler_.concurrency());
}

void FetcherService::stop() {
    bool expected = true;
    if (!started_.compare_exchange_strong(expected, false)) {
        return;
    }
    LOG_INFO("FetcherService: stopping");
    stream_.stop();
    scheduler_.stop();
    LOG_INFO("FetcherService: stopped after " << scheduler_.cycles() << " backfill cycle(s)");
}

}  // namespace app
