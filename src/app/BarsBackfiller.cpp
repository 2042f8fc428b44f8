#include "app/BarsBackfiller.hpp"

#include <exception>
#include <string>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "common/TimeParse.hpp"

namespace app {

BarsBackfiller::BarsBackfiller(domain::contracts::IHistoricalBars& source,
                               domain::contracts::IMarketDataWriter& writer,
                               std::function<domain::TimestampSec()> clock)
    : source_(source), writer_(writer), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return gapfill::common::nowSeconds(); };
    }
}

std::size_t BarsBackfiller::fetch_and_persist(const domain::Symbol& symbol,
                                              domain::TimestampSec from,
                                              std::optional<domain::TimestampSec> to) {
    const auto effectiveFrom = from <= 0 ? kDefaultFrom : from;
    const auto effectiveTo = to ? *to : clock_();
    if (effectiveFrom >= effectiveTo) {
        LOG_DEBUG("BarsBackfiller: empty range for " << symbol << " from="
                                                     << gapfill::common::formatTimestamp(effectiveFrom));
        return 0;
    }

    try {
        const auto bars = source_.fetch_minute_bars(symbol, effectiveFrom, effectiveTo);
        if (bars.empty()) {
            LOG_INFO("BarsBackfiller: no bars for " << symbol << " in ["
                                                    << gapfill::common::formatTimestamp(effectiveFrom) << ", "
                                                    << gapfill::common::formatTimestamp(effectiveTo) << ")");
            return 0;
        }
        const auto written = writer_.write_bars(bars);
        LOG_INFO("BarsBackfiller: " << symbol << " wrote " << written << " bars ["
                                    << gapfill::common::formatTimestamp(effectiveFrom) << ", "
                                    << gapfill::common::formatTimestamp(effectiveTo) << ")");
        return written;
    } catch (const gapfill::FetchError&) {
        throw;
    } catch (const std::exception& ex) {
        throw gapfill::FetchError(ex.what());
    }
}

}  // namespace app
