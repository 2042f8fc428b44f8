#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "app/RangeResolver.hpp"
#include "common/Errors.hpp"
#include "common/TimeParse.hpp"

namespace {

class FakeStore : public domain::contracts::ILastRecordQuery {
public:
    std::optional<domain::TimestampSec> last_record_before(const domain::TimeBucketKey& key,
                                                           domain::TimestampSec end) const override {
        ++calls;
        lastKey = key.str();
        lastEnd = end;
        if (throwGeneric) {
            throw std::runtime_error("disk unplugged");
        }
        if (throwTransient) {
            throw gapfill::TransientStoreError("locked");
        }
        if (answer && *answer <= end) {
            return answer;
        }
        return std::nullopt;
    }

    std::optional<domain::TimestampSec> answer;
    bool throwGeneric{false};
    bool throwTransient{false};
    mutable int calls{0};
    mutable std::string lastKey;
    mutable domain::TimestampSec lastEnd{0};
};

bool check(bool condition, const char* message) {
    if (!condition) {
        std::cerr << message << "\n";
    }
    return condition;
}

}  // namespace

int main() {
    constexpr domain::TimestampSec kT = 1609752600;  // 2021-01-04 09:30:00 UTC

    // No stored history: nothing to fill.
    {
        FakeStore store;
        app::RangeResolver resolver(store, {});
        if (!check(!resolver.resolve("AAPL", kT).has_value(), "Expected no range without history")) {
            return 1;
        }
        if (!check(store.lastKey == "AAPL/1Min/OHLCV", "Expected the minute bars key")) {
            return 1;
        }
        if (!check(store.lastEnd == kT - 60, "Expected the lookup to end one minute before the gap")) {
            return 1;
        }
    }

    // Last record five minutes back becomes the start of an open range.
    {
        FakeStore store;
        store.answer = kT - 300;
        app::RangeResolver resolver(store, {});
        const auto range = resolver.resolve("AAPL", kT);
        if (!check(range.has_value() && range->from == kT - 300 && !range->to.has_value(),
                   "Expected [T-5min, open)")) {
            return 1;
        }
        if (!check(range->symbol == "AAPL", "Expected range symbol AAPL")) {
            return 1;
        }
    }

    // The bar that revealed the gap is not its own start.
    {
        FakeStore store;
        store.answer = kT;
        app::RangeResolver resolver(store, {});
        if (!check(!resolver.resolve("AAPL", kT).has_value(), "Expected the triggering bar to be skipped")) {
            return 1;
        }
    }

    // Store failures surface as TransientStoreError.
    {
        FakeStore store;
        store.throwGeneric = true;
        app::RangeResolver resolver(store, {});
        bool thrown = false;
        try {
            (void)resolver.resolve("AAPL", kT);
        } catch (const gapfill::TransientStoreError&) {
            thrown = true;
        }
        if (!check(thrown, "Expected generic store errors to become TransientStoreError")) {
            return 1;
        }

        store.throwGeneric = false;
        store.throwTransient = true;
        thrown = false;
        try {
            (void)resolver.resolve("AAPL", kT);
        } catch (const gapfill::TransientStoreError& ex) {
            thrown = std::string{ex.what()} == "locked";
        }
        if (!check(thrown, "Expected TransientStoreError to pass through unchanged")) {
            return 1;
        }
    }

    // A configured fallback start skips the store entirely.
    {
        FakeStore store;
        store.answer = kT - 300;
        app::RangeResolver::Options options;
        options.queryStart = "2021-01-04";
        app::RangeResolver resolver(store, options);
        const auto range = resolver.resolve("MSFT", kT);
        if (!check(range.has_value() && range->from == 1609718400, "Expected fallback start 2021-01-04")) {
            return 1;
        }
        if (!check(store.calls == 0, "Expected no store lookup with a fallback")) {
            return 1;
        }
    }

    // Fallback that no layout accepts.
    {
        FakeStore store;
        app::RangeResolver::Options options;
        options.queryStart = "not-a-date";
        app::RangeResolver resolver(store, options);
        bool thrown = false;
        try {
            (void)resolver.resolve("MSFT", kT);
        } catch (const gapfill::ConfigurationError&) {
            thrown = true;
        }
        if (!check(thrown, "Expected ConfigurationError for an unparseable fallback")) {
            return 1;
        }
    }

    // Accepted layouts, all UTC on a 24-hour clock.
    {
        using gapfill::common::parseTimestamp;
        if (!check(parseTimestamp("2021-01-04") == 1609718400, "date only")) {
            return 1;
        }
        if (!check(parseTimestamp("2021-01-04 09:30") == 1609752600, "date and minutes")) {
            return 1;
        }
        if (!check(parseTimestamp("2021-01-04T09:30") == 1609752600, "T separated minutes")) {
            return 1;
        }
        if (!check(parseTimestamp("2021-01-04 09:30:15") == 1609752615, "date and seconds")) {
            return 1;
        }
        if (!check(parseTimestamp("2021-01-04T15:45:00") == 1609775100, "afternoon hour")) {
            return 1;
        }
        if (!check(parseTimestamp(" 2021-01-04 ") == 1609718400, "surrounding blanks are ignored")) {
            return 1;
        }
        if (!check(!parseTimestamp("2021-01-04 09:30 junk").has_value(), "trailing text is rejected")) {
            return 1;
        }
        if (!check(!parseTimestamp("").has_value(), "empty input is rejected")) {
            return 1;
        }
        if (!check(!parseTimestamp("2021-02-30").has_value(), "February 30th is rejected")) {
            return 1;
        }
        if (!check(!parseTimestamp("2021-04-31T09:30").has_value(), "April 31st is rejected")) {
            return 1;
        }
        if (!check(!parseTimestamp("2021-02-31 10:00").has_value(), "February 31st with time is rejected")) {
            return 1;
        }
        if (!check(parseTimestamp("2020-02-29") == 1582934400, "leap day is accepted")) {
            return 1;
        }
    }

    // Impossible calendar dates in the fallback fail resolution instead of rolling forward.
    {
        FakeStore store;
        app::RangeResolver::Options options;
        options.queryStart = "2021-04-31T09:30:00";
        app::RangeResolver resolver(store, options);
        bool thrown = false;
        try {
            (void)resolver.resolve("MSFT", kT);
        } catch (const gapfill::ConfigurationError&) {
            thrown = true;
        }
        if (!check(thrown, "Expected ConfigurationError for April 31st")) {
            return 1;
        }
        if (!check(gapfill::common::formatTimestamp(1609752600) == "2021-01-04T09:30:00Z", "formatting")) {
            return 1;
        }
    }

    return 0;
}
