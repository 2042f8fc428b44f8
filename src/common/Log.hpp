#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace gapfill::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Tags every record logged from this thread with a symbol or bucket key until it is destroyed.
// Tags nest; the innermost one wins and the outer one comes back on destruction.
class ScopedTag {
public:
    explicit ScopedTag(std::string tag);
    ~ScopedTag();

    ScopedTag(const ScopedTag&) = delete;
    ScopedTag& operator=(const ScopedTag&) = delete;

private:
    std::string previous_;
};

const std::string& currentTag() noexcept;

// "[LEVEL] [tag] message", or "[LEVEL] message" outside any tag. log() prefixes clock and thread.
std::string formatRecord(Level level, std::string_view message);

}  // namespace gapfill::log

#define GAPFILL_LOG_IMPL(level, expr)                                                      \
    do {                                                                                   \
        if (::gapfill::log::shouldLog(level)) {                                            \
            std::ostringstream gapfill_log_stream__;                                       \
            gapfill_log_stream__ << expr;                                                  \
            ::gapfill::log::log(level, gapfill_log_stream__.str());                        \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) GAPFILL_LOG_IMPL(::gapfill::log::Level::Debug, expr)
#define LOG_INFO(expr) GAPFILL_LOG_IMPL(::gapfill::log::Level::Info, expr)
#define LOG_WARN(expr) GAPFILL_LOG_IMPL(::gapfill::log::Level::Warn, expr)
#define LOG_ERR(expr) GAPFILL_LOG_IMPL(::gapfill::log::Level::Error, expr)
