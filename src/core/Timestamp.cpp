#include "core/Timestamp.hpp"

#include <array>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace core {
namespace {

constexpr std::int64_t kMillisPerSecond = 1000;

constexpr std::array<const char*, 5> kAcceptedFormats{
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%dT%H:%M",
    "%Y-%m-%d",
};

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
    auto quotient = value / divisor;
    if ((value % divisor) != 0 && value < 0) {
        --quotient;
    }
    return quotient;
}

std::optional<std::tm> parseWithFormat(const std::string& text, const char* format) {
    std::tm tm{};
    std::istringstream input(text);
    input >> std::get_time(&tm, format);
    if (input.fail()) {
        return std::nullopt;
    }
    if (input.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return tm;
}

}  // namespace

std::string formatTimestamp(std::int64_t epochMs) {
    const auto seconds = static_cast<std::time_t>(floorDiv(epochMs, kMillisPerSecond));
    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(),
                  buffer.size(),
                  "%04d-%02d-%02d %02d:%02d:%02d",
                  tm.tm_year + 1900,
                  tm.tm_mon + 1,
                  tm.tm_mday,
                  tm.tm_hour,
                  tm.tm_min,
                  tm.tm_sec);
    return std::string(buffer.data());
}

std::optional<std::int64_t> parseTimestamp(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    const std::string value{text};
    for (const char* format : kAcceptedFormats) {
        auto parsed = parseWithFormat(value, format);
        if (!parsed) {
            continue;
        }

        std::tm tm = *parsed;
        tm.tm_isdst = 0;
        const std::tm requested = tm;
        const auto raw = timegm(&tm);

        // timegm normalizes out-of-range fields (Feb 30 -> Mar 2); reject those.
        if (tm.tm_year != requested.tm_year || tm.tm_mon != requested.tm_mon
            || tm.tm_mday != requested.tm_mday || tm.tm_hour != requested.tm_hour
            || tm.tm_min != requested.tm_min || tm.tm_sec != requested.tm_sec) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw) * kMillisPerSecond;
    }
    return std::nullopt;
}

}  // namespace core
