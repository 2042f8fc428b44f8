#include "app/GapRegistry.hpp"

#include <utility>

#include "common/Log.hpp"

namespace app {

void GapRegistry::notify_gap(const domain::Symbol& symbol, domain::TimestampSec lastKnown) {
    mark_pending(symbol, lastKnown);
}

void GapRegistry::mark_pending(const domain::Symbol& symbol, domain::TimestampSec lastKnown) {
    if (symbol.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[symbol];
    entry.pending = lastKnown;
    LOG_DEBUG("GapRegistry: pending symbol=" << symbol << " last_known=" << lastKnown
                                              << (entry.inFlight ? " (in flight)" : ""));
}

std::vector<GapClaim> GapRegistry::claim_all(std::size_t limit) {
    std::vector<GapClaim> claims;
    if (limit == 0) {
        return claims;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return claims;
    }

    auto tryClaim = [&](std::map<domain::Symbol, Entry>::iterator it) {
        auto& entry = it->second;
        if (!entry.pending.has_value() || entry.inFlight) {
            return;
        }
        claims.push_back(GapClaim{it->first, *entry.pending});
        entry.pending.reset();
        entry.inFlight = true;
    };

    // Start right after the previous cursor and wrap once around the map.
    const auto start = cursor_.empty() ? entries_.begin() : entries_.upper_bound(cursor_);
    for (auto it = start; it != entries_.end() && claims.size() < limit; ++it) {
        tryClaim(it);
    }
    for (auto it = entries_.begin(); it != start && claims.size() < limit; ++it) {
        tryClaim(it);
    }

    if (!claims.empty()) {
        cursor_ = claims.back().symbol;
    }
    return claims;
}

void GapRegistry::release(const domain::Symbol& symbol, std::optional<domain::TimestampSec> retryMarker) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        LOG_WARN("GapRegistry: release for unknown symbol=" << symbol);
        return;
    }

    auto& entry = it->second;
    entry.inFlight = false;
    if (retryMarker.has_value() && !entry.pending.has_value()) {
        entry.pending = retryMarker;
    }
    if (!entry.pending.has_value()) {
        entries_.erase(it);
    }
}

std::optional<domain::TimestampSec> GapRegistry::pending_marker(const domain::Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(symbol);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.pending;
}

bool GapRegistry::is_in_flight(const domain::Symbol& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(symbol);
    return it != entries_.end() && it->second.inFlight;
}

std::size_t GapRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [_, entry] : entries_) {
        if (entry.pending.has_value()) {
            ++count;
        }
    }
    return count;
}

std::size_t GapRegistry::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [_, entry] : entries_) {
        if (entry.inFlight) {
            ++count;
        }
    }
    return count;
}

}  // namespace app
