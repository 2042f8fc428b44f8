#pragma once

#include <atomic>

#include "app/BackfillScheduler.hpp"
#include "app/BarsBackfiller.hpp"
#include "app/GapRegistry.hpp"
#include "app/RangeResolver.hpp"
#include "app/StreamRouter.hpp"
#include "common/Config.hpp"
#include "domain/Ports.hpp"

namespace app {

// Owns the gap pipeline for one stream: router -> registry -> scheduler -> backfiller.
class FetcherService {
public:
    FetcherService(const gapfill::common::Config& config,
                   const domain::contracts::ILastRecordQuery& store,
                   domain::contracts::IMarketDataWriter& writer,
                   domain::contracts::IHistoricalBars& history,
                   domain::contracts::IMarketStream& stream);
    ~FetcherService();

    FetcherService(const FetcherService&) = delete;
    FetcherService& operator=(const FetcherService&) = delete;

    void start();

    // Stream first so no new gaps arrive, then the scheduler drains its running cycle.
    void stop();

    GapRegistry& registry() noexcept { return registry_; }
    BackfillScheduler& scheduler() noexcept { return scheduler_; }
    StreamRouter& router() noexcept { return router_; }

private:
    domain::contracts::IMarketStream& stream_;
    GapRegistry registry_;
    RangeResolver resolver_;
    BarsBackfiller backfiller_;
    BackfillScheduler scheduler_;
    StreamRouter router_;
    std::atomic<bool> started_{false};
};

}  // namespace app
