#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using Symbol = std::string;
using TimestampSec = std::int64_t;

struct Timeframe {
    std::int64_t seconds{0};
    std::string label;

    bool valid() const noexcept { return seconds > 0 && !label.empty(); }
};

inline Timeframe minute_timeframe() {
    return Timeframe{60, "1Min"};
}

// Canonical store key, rendered as "<symbol>/<timeframe>/<attribute group>".
struct TimeBucketKey {
    Symbol symbol;
    std::string timeframe;
    std::string attributeGroup;

    std::string str() const { return symbol + "/" + timeframe + "/" + attributeGroup; }
};

inline TimeBucketKey bars_key(const Symbol& symbol) {
    return TimeBucketKey{symbol, minute_timeframe().label, "OHLCV"};
}

struct Bar {
    Symbol symbol;
    TimestampSec epoch{0};
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    std::optional<std::int64_t> tickCount;
};

struct Quote {
    Symbol symbol;
    TimestampSec epoch{0};
    std::int32_t nanos{0};
    double bidPrice{0.0};
    double askPrice{0.0};
    std::int64_t bidSize{0};
    std::int64_t askSize{0};
    std::int32_t bidExchange{0};
    std::int32_t askExchange{0};
};

struct Trade {
    Symbol symbol;
    TimestampSec epoch{0};
    std::int32_t nanos{0};
    double price{0.0};
    std::int64_t size{0};
    std::int32_t exchange{0};
    std::vector<std::int32_t> conditions;
};

enum class DataType { Bars, Quotes, Trades };

inline std::optional<DataType> data_type_from_string(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "bars") {
        return DataType::Bars;
    }
    if (normalized == "quotes") {
        return DataType::Quotes;
    }
    if (normalized == "trades") {
        return DataType::Trades;
    }
    return std::nullopt;
}

inline const char* to_string(DataType type) {
    switch (type) {
    case DataType::Bars:
        return "bars";
    case DataType::Quotes:
        return "quotes";
    case DataType::Trades:
        return "trades";
    }
    return "";
}

// [from, to) handed to one backfill task; an empty `to` runs through now.
struct ResolvedRange {
    Symbol symbol;
    TimestampSec from{0};
    std::optional<TimestampSec> to;
};

}  // namespace domain
