#include "app/RangeResolver.hpp"

#include <exception>
#include <utility>

#include "common/Errors.hpp"
#include "common/Log.hpp"
#include "common/TimeParse.hpp"

namespace app {

RangeResolver::RangeResolver(const domain::contracts::ILastRecordQuery& store, Options options)
    : store_(store), options_(std::move(options)) {}

std::optional<domain::ResolvedRange> RangeResolver::resolve(const domain::Symbol& symbol,
                                                            domain::TimestampSec endTime) const {
    if (hasFallback()) {
        const auto from = gapfill::common::parseQueryStart(options_.queryStart);
        return domain::ResolvedRange{symbol, from, std::nullopt};
    }

    auto from = lastStoredBefore_(symbol, endTime);
    if (!from.has_value()) {
        LOG_DEBUG("RangeResolver: no stored history symbol=" << symbol << " before="
                                                             << gapfill::common::formatTimestamp(endTime));
        return std::nullopt;
    }
    return domain::ResolvedRange{symbol, *from, std::nullopt};
}

std::optional<domain::TimestampSec> RangeResolver::lastStoredBefore_(const domain::Symbol& symbol,
                                                                     domain::TimestampSec endTime) const {
    const auto key = domain::TimeBucketKey{symbol, options_.timeframe.label, "OHLCV"};
    // Step back one period so the record that revealed the gap is not picked up.
    const auto queryEnd = endTime - options_.timeframe.seconds;

    try {
        return store_.last_record_before(key, queryEnd);
    } catch (const gapfill::TransientStoreError&) {
        throw;
    } catch (const std::exception& ex) {
        throw gapfill::TransientStoreError("last record query failed for key " + key.str() + ": " + ex.what());
    }
}

}  // namespace app
