#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "app/GapRegistry.hpp"
#include "app/RangeResolver.hpp"
#include "domain/Ports.hpp"

namespace app {

// Fixed-interval driver that drains the GapRegistry with bounded parallelism. Each cycle
// claims at most `concurrency` symbols, runs resolve + fetch for each on its own worker and
// joins all of them before the next claim scan.
class BackfillScheduler {
public:
    static constexpr std::size_t kDefaultPerCore = 10;
    static constexpr std::chrono::milliseconds kDefaultInterval{30000};

    struct Options {
        std::chrono::milliseconds interval{kDefaultInterval};
        // 0 selects perCore x hardware threads.
        std::size_t concurrency{0};
        std::size_t perCore{kDefaultPerCore};
        // Consecutive failures re-armed with the old marker; 0 keeps the fail-open policy.
        std::size_t maxRequeues{0};
    };

    struct CycleStats {
        std::size_t claimed{0};
        std::size_t backfilled{0};
        std::size_t noGap{0};
        std::size_t failed{0};
        std::size_t requeued{0};
        std::size_t rows{0};
    };

    BackfillScheduler(GapRegistry& registry,
                      const RangeResolver& resolver,
                      domain::contracts::IBackfillExecutor& executor,
                      Options options);
    ~BackfillScheduler();

    BackfillScheduler(const BackfillScheduler&) = delete;
    BackfillScheduler& operator=(const BackfillScheduler&) = delete;

    void start();

    // Stops the driver after the running cycle has joined its tasks.
    void stop();

    // One claim / fan-out / join pass. Used by the driver thread and by tests.
    CycleStats run_cycle();

    std::size_t concurrency() const noexcept { return concurrency_; }
    std::uint64_t cycles() const noexcept { return cycles_.load(std::memory_order_relaxed); }
    bool running() const noexcept { return worker_.joinable(); }

    static std::size_t default_concurrency(std::size_t perCore);

private:
    enum class Outcome { Backfilled, NoGap, Failed };

    void run_loop_();
    Outcome backfill_symbol_(const GapClaim& claim, std::size_t& rows);
    std::optional<domain::TimestampSec> retry_marker_(const GapClaim& claim, Outcome outcome);

    GapRegistry& registry_;
    const RangeResolver& resolver_;
    domain::contracts::IBackfillExecutor& executor_;
    Options options_;
    std::size_t concurrency_{1};

    std::mutex cycleMutex_;
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<std::uint64_t> cycles_{0};
    std::thread worker_;

    std::mutex failuresMutex_;
    std::unordered_map<domain::Symbol, std::size_t> consecutiveFailures_;
};

}  // namespace app
