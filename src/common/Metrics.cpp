#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace ohlcv::common::metrics {

LatencyWindow::LatencyWindow(std::size_t capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("LatencyWindow capacity must be positive");
    }
    samples_.resize(capacity);
}

void LatencyWindow::add(double latencyMs) {
    samples_[next_] = latencyMs;
    next_ = (next_ + 1) % samples_.size();
    if (next_ == 0) {
        full_ = true;
    }
}

std::optional<double> LatencyWindow::percentile(double q) const {
    const auto count = size();
    if (count == 0) {
        return std::nullopt;
    }

    std::vector<double> sorted(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(count));
    const double clamped = std::min(1.0, std::max(0.0, q));
    // The epsilon keeps products such as 0.95 * 100 from rounding up a rank.
    auto rank = static_cast<std::size_t>(std::ceil(clamped * static_cast<double>(count) - 1e-9));
    rank = std::max<std::size_t>(rank, 1);

    const auto nth = sorted.begin() + static_cast<std::ptrdiff_t>(rank - 1);
    std::nth_element(sorted.begin(), nth, sorted.end());
    return *nth;
}

Registry::Registry() : started_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry registry;
    return registry;
}

Registry::Route& Registry::routeLocked(const std::string& route) {
    return routes_.try_emplace(route).first->second;
}

void Registry::incrementRequest(const std::string& route) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++routeLocked(route).requests;
}

void Registry::recordLatency(const std::string& route, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    routeLocked(route).latencies.add(latencyMs);
}

void Registry::incrementCounter(const std::string& name, std::uint64_t by) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += by;
}

std::uint64_t Registry::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

StatsSnapshot Registry::snapshot() const {
    StatsSnapshot snapshot;
    snapshot.uptimeSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, route] : routes_) {
        RouteStats stats;
        stats.requests = route.requests;
        stats.p95Ms = route.latencies.percentile(0.95);
        stats.p99Ms = route.latencies.percentile(0.99);
        snapshot.routes.emplace(name, stats);
    }
    snapshot.counters = counters_;
    return snapshot;
}

RouteTimer::RouteTimer(std::string route)
    : route_(std::move(route)), start_(std::chrono::steady_clock::now()) {}

RouteTimer::~RouteTimer() {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
    Registry::instance().recordLatency(route_, elapsed.count());
}

}  // namespace ohlcv::common::metrics
