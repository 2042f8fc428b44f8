#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace app {

struct GapClaim {
    domain::Symbol symbol;
    domain::TimestampSec lastKnown{0};
};

// Pending backfill markers per symbol. The stream side marks, the scheduler claims and
// releases; a claimed symbol stays in flight until released and cannot be claimed again.
class GapRegistry : public domain::contracts::IGapNotifier {
public:
    GapRegistry() = default;

    GapRegistry(const GapRegistry&) = delete;
    GapRegistry& operator=(const GapRegistry&) = delete;

    void notify_gap(const domain::Symbol& symbol, domain::TimestampSec lastKnown) override;

    // Last write wins, also while the symbol is in flight.
    void mark_pending(const domain::Symbol& symbol, domain::TimestampSec lastKnown);

    // Moves up to `limit` pending, idle symbols to in flight and returns them. The scan
    // resumes after the last symbol claimed by the previous call.
    std::vector<GapClaim> claim_all(std::size_t limit);

    // Ends the in-flight state. `retryMarker` re-arms the symbol unless a fresher marker
    // arrived while the task was running.
    void release(const domain::Symbol& symbol,
                 std::optional<domain::TimestampSec> retryMarker = std::nullopt);

    std::optional<domain::TimestampSec> pending_marker(const domain::Symbol& symbol) const;
    bool is_in_flight(const domain::Symbol& symbol) const;
    std::size_t pending_count() const;
    std::size_t in_flight_count() const;

private:
    struct Entry {
        std::optional<domain::TimestampSec> pending;
        bool inFlight{false};
    };

    mutable std::mutex mutex_;
    std::map<domain::Symbol, Entry> entries_;
    domain::Symbol cursor_;
};

}  // namespace app
