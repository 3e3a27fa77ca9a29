#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ohlcv::common::metrics {

// Fixed-capacity ring of latency samples in milliseconds. Once full, each new
// sample replaces the oldest one.
class LatencyWindow {
public:
    explicit LatencyWindow(std::size_t capacity);

    void add(double latencyMs);

    std::size_t size() const noexcept { return full_ ? samples_.size() : next_; }

    // Nearest-rank percentile for q in (0, 1]; nullopt while empty.
    std::optional<double> percentile(double q) const;

private:
    std::vector<double> samples_;
    std::size_t next_{0};
    bool full_{false};
};

struct RouteStats {
    std::uint64_t requests{0};
    std::optional<double> p95Ms;
    std::optional<double> p99Ms;
};

struct StatsSnapshot {
    double uptimeSeconds{0.0};
    std::map<std::string, RouteStats> routes;
    std::map<std::string, std::uint64_t> counters;
};

// Process-wide request accounting rendered by GET /stats.
class Registry {
public:
    static constexpr std::size_t kLatencySamples = 1024;

    static Registry& instance();

    void incrementRequest(const std::string& route);
    void recordLatency(const std::string& route, double latencyMs);

    void incrementCounter(const std::string& name, std::uint64_t by = 1);
    std::uint64_t counter(const std::string& name) const;

    StatsSnapshot snapshot() const;

private:
    struct Route {
        Route() : latencies(kLatencySamples) {}

        std::uint64_t requests{0};
        LatencyWindow latencies;
    };

    Registry();

    Route& routeLocked(const std::string& route);

    const std::chrono::steady_clock::time_point started_;
    mutable std::mutex mutex_;
    std::map<std::string, Route> routes_;
    std::map<std::string, std::uint64_t> counters_;
};

// Times a handler from construction to destruction and records the sample
// under `route`.
class RouteTimer {
public:
    explicit RouteTimer(std::string route);
    ~RouteTimer();

    RouteTimer(const RouteTimer&) = delete;
    RouteTimer& operator=(const RouteTimer&) = delete;

private:
    std::string route_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace ohlcv::common::metrics
