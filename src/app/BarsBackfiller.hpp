#pragma once

#include <functional>
#include <optional>

#include "domain/Ports.hpp"

namespace app {

// Fetches minute bars for one resolved range and upserts them.
class BarsBackfiller : public domain::contracts::IBackfillExecutor {
public:
    static constexpr domain::TimestampSec kDefaultFrom = 1388534400;  // 2014-01-01 00:00:00 UTC

    BarsBackfiller(domain::contracts::IHistoricalBars& source,
                   domain::contracts::IMarketDataWriter& writer,
                   std::function<domain::TimestampSec()> clock = {});

    std::size_t fetch_and_persist(const domain::Symbol& symbol,
                                  domain::TimestampSec from,
                                  std::optional<domain::TimestampSec> to) override;

private:
    domain::contracts::IHistoricalBars& source_;
    domain::contracts::IMarketDataWriter& writer_;
    std::function<domain::TimestampSec()> clock_;
};

}  // namespace app
