#include "app/StreamRouter.hpp"

#include <exception>
#include <utility>

#include "common/Log.hpp"

namespace app {

StreamRouter::StreamRouter(domain::contracts::IMarketDataWriter& writer,
                           domain::contracts::IGapNotifier& gaps,
                           Options options)
    : writer_(writer), gaps_(gaps), options_(std::move(options)) {
    for (const auto& symbol : options_.symbols) {
        if (!symbol.empty()) {
            allowlist_.insert(symbol);
        }
    }
}

bool StreamRouter::accepts_(domain::DataType type, const domain::Symbol& symbol) const {
    if (symbol.empty() || options_.dataTypes.count(type) == 0) {
        return false;
    }
    return allowlist_.empty() || allowlist_.count(symbol) > 0;
}

bool StreamRouter::first_bar_since_resume_(const domain::Symbol& symbol) {
    std::lock_guard<std::mutex> lock(seenMutex_);
    return seenSinceResume_.insert(symbol).second;
}

void StreamRouter::on_bar(const domain::Bar& bar) {
    if (!accepts_(domain::DataType::Bars, bar.symbol)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    auto row = bar;
    if (!options_.addBarTickCount) {
        row.tickCount.reset();
    }

    try {
        writer_.write_bars({row});
    } catch (const std::exception& ex) {
        LOG_ERR("StreamRouter: bar write failed key=" << domain::bars_key(bar.symbol).str()
                                                      << " epoch=" << bar.epoch << " error=" << ex.what());
    }

    if (first_bar_since_resume_(bar.symbol)) {
        LOG_INFO("StreamRouter: symbol=" << bar.symbol << " resumed at epoch=" << bar.epoch
                                         << ", marking for backfill");
        gaps_.notify_gap(bar.symbol, bar.epoch);
    }
}

void StreamRouter::on_quote(const domain::Quote& quote) {
    if (!accepts_(domain::DataType::Quotes, quote.symbol)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    try {
        writer_.write_quotes({quote});
    } catch (const std::exception& ex) {
        LOG_ERR("StreamRouter: quote write failed symbol=" << quote.symbol << " error=" << ex.what());
    }
}

void StreamRouter::on_trade(const domain::Trade& trade) {
    if (!accepts_(domain::DataType::Trades, trade.symbol)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    try {
        writer_.write_trades({trade});
    } catch (const std::exception& ex) {
        LOG_ERR("StreamRouter: trade write failed symbol=" << trade.symbol << " error=" << ex.what());
    }
}

void StreamRouter::on_reconnected() {
    std::size_t cleared = 0;
    {
        std::lock_guard<std::mutex> lock(seenMutex_);
        cleared = seenSinceResume_.size();
        seenSinceResume_.clear();
    }
    LOG_INFO("StreamRouter: stream (re)connected, " << cleared << " symbol(s) re-armed for gap detection");
}

domain::contracts::StreamHandlers StreamRouter::handlers() {
    domain::contracts::StreamHandlers h;
    h.onBar = [this](const domain::Bar& bar) { on_bar(bar); };
    h.onQuote = [this](const domain::Quote& quote) { on_quote(quote); };
    h.onTrade = [this](const domain::Trade& trade) { on_trade(trade); };
    h.onReconnected = [this]() { on_reconnected(); };
    return h;
}

}  // namespace app
