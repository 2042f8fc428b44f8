#include "common/TimeParse.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include "common/Errors.hpp"

namespace gapfill::common {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::string trim(std::string_view value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        --end;
    }
    return std::string{value.substr(begin, end - begin)};
}

}  // namespace

std::optional<std::int64_t> parseWithLayout(std::string_view value, const char* layout) {
    if (value.empty() || layout == nullptr) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream input{std::string{value}};
    input >> std::get_time(&tm, layout);
    if (input.fail()) {
        return std::nullopt;
    }
    // A layout only matches when nothing is left over ("2021-01-04 09:30" is not a date).
    if (input.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    std::tm normalized = tm;
    const auto raw = timegm_compat(&normalized);
    if (raw == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    // timegm rolls impossible dates forward ("2021-02-30" becomes March 2nd).
    if (normalized.tm_year != tm.tm_year || normalized.tm_mon != tm.tm_mon ||
        normalized.tm_mday != tm.tm_mday || normalized.tm_hour != tm.tm_hour ||
        normalized.tm_min != tm.tm_min || normalized.tm_sec != tm.tm_sec) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(raw);
}

std::optional<std::int64_t> parseTimestamp(std::string_view value) {
    const auto trimmed = trim(value);
    for (const char* layout : kQueryStartLayouts) {
        if (auto parsed = parseWithLayout(trimmed, layout)) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::int64_t parseQueryStart(const std::string& value) {
    auto parsed = parseTimestamp(value);
    if (!parsed.has_value()) {
        throw ConfigurationError("query_start '" + value +
                                 "' does not match any of YYYY-MM-DD[( |T)HH:MM[:SS]]");
    }
    return *parsed;
}

std::string formatTimestamp(std::int64_t epochSeconds) {
    const auto raw = static_cast<std::time_t>(epochSeconds);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &raw);
#else
    gmtime_r(&raw, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::int64_t nowSeconds() {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

}  // namespace gapfill::common
