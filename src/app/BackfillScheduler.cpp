#include "app/BackfillScheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "common/TimeParse.hpp"

namespace app {

std::size_t BackfillScheduler::default_concurrency(std::size_t perCore) {
    const auto cores = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    return std::max<std::size_t>(1, cores * std::max<std::size_t>(1, perCore));
}

BackfillScheduler::BackfillScheduler(GapRegistry& registry,
                                     const RangeResolver& resolver,
                                     domain::contracts::IBackfillExecutor& executor,
                                     Options options)
    : registry_(registry), resolver_(resolver), executor_(executor), options_(options) {
    if (options_.interval.count() <= 0) {
        options_.interval = kDefaultInterval;
    }
    concurrency_ = options_.concurrency > 0 ? options_.concurrency : default_concurrency(options_.perCore);
}

BackfillScheduler::~BackfillScheduler() {
    stop();
}

void BackfillScheduler::start() {
    if (worker_.joinable()) {
        return;
    }

    stopRequested_.store(false, std::memory_order_relaxed);
    worker_ = std::thread([this]() {
        try {
            LOG_INFO("BackfillScheduler thread starting interval_ms=" << options_.interval.count()
                                                                      << " concurrency=" << concurrency_);
            run_loop_();
            LOG_INFO("BackfillScheduler thread finished cleanly");
        } catch (const std::exception& ex) {
            LOG_ERR("BackfillScheduler thread crashed: " << ex.what());
        }
    });
}

void BackfillScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_.store(true, std::memory_order_relaxed);
    }
    waitCv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void BackfillScheduler::run_loop_() {
    auto nextCycle = std::chrono::steady_clock::now() + options_.interval;

    while (!stopRequested_.load(std::memory_order_relaxed)) {
        {
            std::unique_lock<std::mutex> lock(waitMutex_);
            const bool stopping = waitCv_.wait_until(lock, nextCycle, [this]() {
                return stopRequested_.load(std::memory_order_relaxed);
            });
            if (stopping) {
                break;
            }
        }

        // A cycle that overruns pushes the next scan back instead of skipping it.
        nextCycle = std::chrono::steady_clock::now() + options_.interval;

        const auto stats = run_cycle();
        if (stats.claimed > 0) {
            LOG_INFO("BackfillScheduler: cycle done claimed=" << stats.claimed << " backfilled=" << stats.backfilled
                                                              << " no_gap=" << stats.noGap
                                                              << " failed=" << stats.failed
                                                              << " requeued=" << stats.requeued
                                                              << " rows=" << stats.rows);
        }
    }
}

BackfillScheduler::CycleStats BackfillScheduler::run_cycle() {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    cycles_.fetch_add(1, std::memory_order_relaxed);

    CycleStats stats;
    auto claims = registry_.claim_all(concurrency_);
    stats.claimed = claims.size();
    if (claims.empty()) {
        return stats;
    }

    LOG_DEBUG("BackfillScheduler: claimed " << claims.size() << " symbol(s), pending left="
                                             << registry_.pending_count());

    std::vector<Outcome> outcomes(claims.size(), Outcome::Failed);
    std::vector<std::size_t> rows(claims.size(), 0);
    std::vector<char> requeued(claims.size(), 0);

    {
        boost::asio::thread_pool pool(claims.size());
        for (std::size_t index = 0; index < claims.size(); ++index) {
            boost::asio::post(pool, [this, &claims, &outcomes, &rows, &requeued, index]() {
                const auto& claim = claims[index];
                outcomes[index] = backfill_symbol_(claim, rows[index]);
                const auto retry = retry_marker_(claim, outcomes[index]);
                requeued[index] = retry.has_value() ? 1 : 0;
                registry_.release(claim.symbol, retry);
            });
        }
        pool.join();
    }

    for (std::size_t index = 0; index < claims.size(); ++index) {
        switch (outcomes[index]) {
        case Outcome::Backfilled:
            ++stats.backfilled;
            break;
        case Outcome::NoGap:
            ++stats.noGap;
            break;
        case Outcome::Failed:
            ++stats.failed;
            break;
        }
        if (requeued[index] != 0) {
            ++stats.requeued;
        }
        stats.rows += rows[index];
    }
    return stats;
}

BackfillScheduler::Outcome BackfillScheduler::backfill_symbol_(const GapClaim& claim, std::size_t& rows) {
    const auto& symbol = claim.symbol;
    gapfill::log::ScopedTag tag(domain::bars_key(symbol).str());
    try {
        const auto range = resolver_.resolve(symbol, claim.lastKnown);
        if (!range.has_value()) {
            LOG_DEBUG("BackfillScheduler: no gap to fill");
            return Outcome::NoGap;
        }

        LOG_INFO("BackfillScheduler: backfilling from=" << gapfill::common::formatTimestamp(range->from)
                                                         << " to=now");
        rows = executor_.fetch_and_persist(symbol, range->from, range->to);
        LOG_INFO("BackfillScheduler: backfill done rows=" << rows);
        return Outcome::Backfilled;
    } catch (const gapfill::ConfigurationError& ex) {
        LOG_ERR("BackfillScheduler: configuration error symbol=" << symbol << " error=" << ex.what());
    } catch (const gapfill::TransientStoreError& ex) {
        LOG_ERR("BackfillScheduler: store query failure symbol=" << symbol << " error=" << ex.what());
    } catch (const gapfill::FetchError& ex) {
        LOG_ERR("BackfillScheduler: bars backfill failure for key: [" << domain::bars_key(symbol).str()
                                                                      << "] (" << ex.what() << ")");
    } catch (const std::exception& ex) {
        LOG_ERR("BackfillScheduler: unexpected failure symbol=" << symbol << " error=" << ex.what());
    }
    return Outcome::Failed;
}

std::optional<domain::TimestampSec> BackfillScheduler::retry_marker_(const GapClaim& claim, Outcome outcome) {
    std::lock_guard<std::mutex> lock(failuresMutex_);
    if (outcome != Outcome::Failed) {
        consecutiveFailures_.erase(claim.symbol);
        return std::nullopt;
    }
    if (options_.maxRequeues == 0) {
        return std::nullopt;
    }

    auto& failures = consecutiveFailures_[claim.symbol];
    ++failures;
    if (failures > options_.maxRequeues) {
        LOG_WARN("BackfillScheduler: giving up on symbol=" << claim.symbol << " after " << (failures - 1)
                                                            << " requeue(s)");
        consecutiveFailures_.erase(claim.symbol);
        return std::nullopt;
    }
    LOG_INFO("BackfillScheduler: requeue symbol=" << claim.symbol << " attempt=" << failures << "/"
                                                   << options_.maxRequeues);
    return claim.lastKnown;
}

}  // namespace app
