#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace domain::contracts {
class ICandleReadRepo;
}

namespace ohlcv::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    std::string body;
};

struct Response {
    int statusCode;
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

Response healthz(const domain::contracts::ICandleReadRepo& repo);

Response version();

// GET /api/candles?limit=N
Response candles(const Request& request, const domain::contracts::ICandleReadRepo& repo);

// GET /api/indicators[?start=..&end=..]
Response indicators(const Request& request, const domain::contracts::ICandleReadRepo& repo);

// GET /api/fib[?start=..&end=..]
Response fibonacci(const Request& request, const domain::contracts::ICandleReadRepo& repo);

// Uptime, configured worker count, stored candles, per-route request counts
// and latency percentiles, error counters.
Response stats(const domain::contracts::ICandleReadRepo& repo, std::size_t workerThreads);

void setHttpLimits(std::int32_t defaultLimit, std::int32_t maxLimit);

}  // namespace ohlcv::api
