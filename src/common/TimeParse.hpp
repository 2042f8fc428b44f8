#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gapfill::common {

// Accepted layouts for a configured start time, tried in order. All are UTC.
inline constexpr std::array<const char*, 5> kQueryStartLayouts{
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%dT%H:%M",
    "%Y-%m-%d",
};

std::optional<std::int64_t> parseWithLayout(std::string_view value, const char* layout);

// Returns epoch seconds for the first layout that consumes the whole string.
std::optional<std::int64_t> parseTimestamp(std::string_view value);

// Same as parseTimestamp but throws ConfigurationError when nothing matches.
std::int64_t parseQueryStart(const std::string& value);

std::string formatTimestamp(std::int64_t epochSeconds);

std::int64_t nowSeconds();

}  // namespace gapfill::common
