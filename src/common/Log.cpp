#include "common/Log.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace ohlcv::log {
namespace {

struct LevelName {
    Level level;
    const char* label;
    std::array<const char*, 3> names;
};

constexpr std::array<LevelName, 4> kLevels{{
    {Level::Debug, "DEBUG", {"debug", "trace", nullptr}},
    {Level::Info, "INFO", {"info", nullptr, nullptr}},
    {Level::Warn, "WARN", {"warn", "warning", nullptr}},
    {Level::Error, "ERROR", {"error", "err", nullptr}},
}};

std::atomic<int> g_threshold{static_cast<int>(Level::Info)};
std::mutex g_writeMutex;

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

std::string currentThreadTag() {
    std::ostringstream tag;
    tag << std::this_thread::get_id();
    return tag.str();
}

}  // namespace

void setLevel(Level level) noexcept { g_threshold.store(static_cast<int>(level), std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept { return static_cast<int>(level) >= g_threshold.load(std::memory_order_relaxed); }

std::string formatLine(Level level, std::chrono::system_clock::time_point when, std::string_view thread,
                       std::string_view message) {
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    auto millis = sinceEpoch - seconds;
    if (millis.count() < 0) {
        seconds -= std::chrono::seconds{1};
        millis += std::chrono::seconds{1};
    }

    const std::time_t raw = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&raw, &utc);

    char stamp[32];
    std::snprintf(stamp, sizeof(stamp), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900, utc.tm_mon + 1,
                  utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis.count()));

    std::string label = levelToString(level);
    label.resize(5, ' ');

    std::string line;
    line.reserve(48 + thread.size() + message.size());
    line.append(stamp).append(" ").append(label).append(" [").append(thread).append("] ").append(message);
    return line;
}

void log(Level level, const std::string& message) {
    const auto line = formatLine(level, std::chrono::system_clock::now(), currentThreadTag(), message);

    std::lock_guard<std::mutex> lock(g_writeMutex);
    auto& out = level >= Level::Warn ? std::cerr : std::cout;
    out << line << '\n';
    out.flush();
}

const char* levelToString(Level level) noexcept {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.label;
        }
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    for (const auto& entry : kLevels) {
        for (const char* name : entry.names) {
            if (name != nullptr && equalsIgnoreCase(text, name)) {
                return entry.level;
            }
        }
    }
    throw std::invalid_argument("Nivel de log desconocido: " + std::string{text});
}

}  // namespace ohlcv::log
