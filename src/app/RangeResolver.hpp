#pragma once

#include <optional>
#include <string>

#include "domain/Ports.hpp"

namespace app {

class RangeResolver {
public:
    struct Options {
        // Fallback gap start; when empty the store is always consulted.
        std::string queryStart;
        domain::Timeframe timeframe = domain::minute_timeframe();
    };

    RangeResolver(const domain::contracts::ILastRecordQuery& store, Options options);

    // Range to backfill for a gap that ends at `endTime`. nullopt means nothing to fill.
    // Throws gapfill::ConfigurationError or gapfill::TransientStoreError.
    std::optional<domain::ResolvedRange> resolve(const domain::Symbol& symbol,
                                                 domain::TimestampSec endTime) const;

    bool hasFallback() const noexcept { return !options_.queryStart.empty(); }

private:
    std::optional<domain::TimestampSec> lastStoredBefore_(const domain::Symbol& symbol,
                                                          domain::TimestampSec endTime) const;

    const domain::contracts::ILastRecordQuery& store_;
    Options options_;
};

}  // namespace app
