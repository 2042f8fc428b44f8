#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "domain/Ports.hpp"

namespace app {

// Live message dispatch: persists what the stream delivers and reports a possible gap the
// first time a symbol's bars show up after startup or after a reconnect.
class StreamRouter {
public:
    struct Options {
        std::set<domain::DataType> dataTypes;
        // Empty accepts every symbol.
        std::vector<domain::Symbol> symbols;
        bool addBarTickCount{false};
    };

    StreamRouter(domain::contracts::IMarketDataWriter& writer,
                 domain::contracts::IGapNotifier& gaps,
                 Options options);

    void on_bar(const domain::Bar& bar);
    void on_quote(const domain::Quote& quote);
    void on_trade(const domain::Trade& trade);

    // Every symbol is treated as possibly gapped again.
    void on_reconnected();

    domain::contracts::StreamHandlers handlers();

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }

private:
    bool accepts_(domain::DataType type, const domain::Symbol& symbol) const;
    bool first_bar_since_resume_(const domain::Symbol& symbol);

    domain::contracts::IMarketDataWriter& writer_;
    domain::contracts::IGapNotifier& gaps_;
    Options options_;
    std::unordered_set<domain::Symbol> allowlist_;

    std::mutex seenMutex_;
    std::unordered_set<domain::Symbol> seenSinceResume_;
    std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace app
