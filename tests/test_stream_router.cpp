#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "app/StreamRouter.hpp"

namespace {

class RecordingWriter : public domain::contracts::IMarketDataWriter {
public:
    std::size_t write_bars(const std::vector<domain::Bar>& rows) override {
        if (failBars) {
            throw std::runtime_error("disk full");
        }
        bars.insert(bars.end(), rows.begin(), rows.end());
        return rows.size();
    }
    std::size_t write_quotes(const std::vector<domain::Quote>& rows) override {
        quotes.insert(quotes.end(), rows.begin(), rows.end());
        return rows.size();
    }
    std::size_t write_trades(const std::vector<domain::Trade>& rows) override {
        trades.insert(trades.end(), rows.begin(), rows.end());
        return rows.size();
    }

    bool failBars{false};
    std::vector<domain::Bar> bars;
    std::vector<domain::Quote> quotes;
    std::vector<domain::Trade> trades;
};

class RecordingNotifier : public domain::contracts::IGapNotifier {
public:
    void notify_gap(const domain::Symbol& symbol, domain::TimestampSec lastKnown) override {
        gaps.emplace_back(symbol, lastKnown);
    }

    std::vector<std::pair<std::string, domain::TimestampSec>> gaps;
};

domain::Bar makeBar(const std::string& symbol, domain::TimestampSec epoch) {
    domain::Bar bar{};
    bar.symbol = symbol;
    bar.epoch = epoch;
    bar.close = 1.0;
    bar.tickCount = 12;
    return bar;
}

app::StreamRouter::Options allTypes() {
    app::StreamRouter::Options options;
    options.dataTypes = {domain::DataType::Bars, domain::DataType::Quotes, domain::DataType::Trades};
    return options;
}

}  // namespace

int main() {
    // First bar per symbol signals a gap; later ones do not.
    {
        RecordingWriter writer;
        RecordingNotifier notifier;
        app::StreamRouter router(writer, notifier, allTypes());
        router.on_bar(makeBar("AAPL", 600));
        router.on_bar(makeBar("AAPL", 660));
        router.on_bar(makeBar("MSFT", 660));

        if (writer.bars.size() != 3) {
            std::cerr << "Expected every bar to be written\n";
            return 1;
        }
        if (notifier.gaps.size() != 2 || notifier.gaps[0].first != "AAPL" || notifier.gaps[0].second != 600 ||
            notifier.gaps[1].first != "MSFT") {
            std::cerr << "Expected one gap signal per symbol\n";
            return 1;
        }
        if (writer.bars[0].tickCount.has_value()) {
            std::cerr << "Expected tick count to be dropped by default\n";
            return 1;
        }

        router.on_reconnected();
        router.on_bar(makeBar("AAPL", 720));
        if (notifier.gaps.size() != 3 || notifier.gaps.back().second != 720) {
            std::cerr << "Expected a reconnect to re-arm gap detection\n";
            return 1;
        }
    }

    // Quotes and trades are stored but never signal a gap.
    {
        RecordingWriter writer;
        RecordingNotifier notifier;
        app::StreamRouter router(writer, notifier, allTypes());
        domain::Quote quote{};
        quote.symbol = "AAPL";
        domain::Trade trade{};
        trade.symbol = "AAPL";
        router.on_quote(quote);
        router.on_trade(trade);
        if (writer.quotes.size() != 1 || writer.trades.size() != 1 || !notifier.gaps.empty()) {
            std::cerr << "Expected quote and trade to be stored without gap signals\n";
            return 1;
        }
    }

    // Allowlist and data type filters.
    {
        RecordingWriter writer;
        RecordingNotifier notifier;
        app::StreamRouter::Options options;
        options.dataTypes = {domain::DataType::Bars};
        options.symbols = {"AAPL"};
        options.addBarTickCount = true;
        app::StreamRouter router(writer, notifier, options);

        router.on_bar(makeBar("TSLA", 600));
        domain::Quote quote{};
        quote.symbol = "AAPL";
        router.on_quote(quote);
        router.on_bar(makeBar("AAPL", 600));

        if (writer.bars.size() != 1 || !writer.quotes.empty() || router.dropped() != 2) {
            std::cerr << "Expected filtered records to be dropped, dropped=" << router.dropped() << "\n";
            return 1;
        }
        if (writer.bars[0].tickCount != 12) {
            std::cerr << "Expected tick count to be kept when enabled\n";
            return 1;
        }
        if (notifier.gaps.size() != 1 || notifier.gaps[0].first != "AAPL") {
            std::cerr << "Expected only the allowed symbol to signal a gap\n";
            return 1;
        }
    }

    // Write failures are contained and still signal the gap.
    {
        RecordingWriter writer;
        writer.failBars = true;
        RecordingNotifier notifier;
        app::StreamRouter router(writer, notifier, allTypes());
        auto handlers = router.handlers();
        handlers.onBar(makeBar("AAPL", 600));
        if (notifier.gaps.size() != 1) {
            std::cerr << "Expected a gap signal despite the failed write\n";
            return 1;
        }
    }

    return 0;
}
