#pragma once

#include <chrono>
#include <sstream>
#include <string>
#include <string_view>

namespace ohlcv::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
bool shouldLog(Level level) noexcept;

// Writes one formatted line; Warn and Error go to stderr, the rest to stdout.
void log(Level level, const std::string& message);

// "2024-01-02T03:04:05.678Z WARN  [thread] message" (UTC, millisecond precision).
std::string formatLine(Level level, std::chrono::system_clock::time_point when, std::string_view thread,
                       std::string_view message);

const char* levelToString(Level level) noexcept;

// Accepts the level names and their common aliases, case-insensitive.
// Throws std::invalid_argument for anything else.
Level levelFromString(std::string_view text);

}  // namespace ohlcv::log

#define OHLCV_LOG_IMPL(level, expr)                                                        \
    do {                                                                                   \
        if (::ohlcv::log::shouldLog(level)) {                                              \
            std::ostringstream ohlcv_log_stream__;                                         \
            ohlcv_log_stream__ << expr;                                                    \
            ::ohlcv::log::log(level, ohlcv_log_stream__.str());                            \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) OHLCV_LOG_IMPL(::ohlcv::log::Level::Debug, expr)
#define LOG_INFO(expr) OHLCV_LOG_IMPL(::ohlcv::log::Level::Info, expr)
#define LOG_WARN(expr) OHLCV_LOG_IMPL(::ohlcv::log::Level::Warn, expr)
#define LOG_ERR(expr) OHLCV_LOG_IMPL(::ohlcv::log::Level::Error, expr)
