#include "api/Controllers.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/Timestamp.hpp"
#include "domain/Ports.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/QueryParams.hpp"
#include "http/json_error.hpp"
#include "indicators/Fibonacci.hpp"
#include "indicators/IndicatorEngine.hpp"
#include "indicators/RangeSelection.hpp"

namespace ohlcv::api {

namespace {

constexpr char kCandlesRouteKey[] = "GET /api/candles";
constexpr char kIndicatorsRouteKey[] = "GET /api/indicators";
constexpr char kFibRouteKey[] = "GET /api/fib";
constexpr char kDataIntegrityCounter[] = "data_integrity_errors_total";
constexpr char kStoreErrorCounter[] = "store_errors_total";

struct HttpLimitState {
    std::atomic<std::int32_t> defaultLimit{500};
    std::atomic<std::int32_t> maxLimit{5000};
};

HttpLimitState& httpLimitState() {
    static HttpLimitState state;
    return state;
}

boost::json::value optionalNumber(const std::optional<double>& value) {
    if (value) {
        return boost::json::value(*value);
    }
    return boost::json::value(nullptr);
}

bool isFiniteCandle(const domain::contracts::Candle& candle) {
    return std::isfinite(candle.o) && std::isfinite(candle.h) && std::isfinite(candle.l)
        && std::isfinite(candle.c) && std::isfinite(candle.v);
}

void storeFailure(Response& response, const char* label, const std::exception& ex) {
    common::metrics::Registry::instance().incrementCounter(kStoreErrorCounter);
    LOG_ERR(label << " database error: " << ex.what());
    ohlcv::http::json_error(response, 500, ohlcv::http::errors::internal_error, ex.what());
}

void dataIntegrityFailure(Response& response, const char* label, const std::string& detail) {
    common::metrics::Registry::instance().incrementCounter(kDataIntegrityCounter);
    LOG_ERR(label << " data integrity failure: " << detail);
    ohlcv::http::json_error(response, 500, ohlcv::http::errors::data_integrity, detail);
}

std::string_view rangeErrorCode(::indicators::RangeError::Kind kind) {
    switch (kind) {
    case ::indicators::RangeError::Kind::Incomplete:
        return ohlcv::http::errors::range_incomplete;
    case ::indicators::RangeError::Kind::TimestampInvalid:
        return ohlcv::http::errors::timestamp_invalid;
    case ::indicators::RangeError::Kind::Inverted:
        return ohlcv::http::errors::range_inverted;
    }
    return ohlcv::http::errors::bad_request;
}

// Fills `range` from the start/end query parameters. On a caller error the
// 400 response is written and false is returned.
bool resolveRange(const Request& request,
                  Response& response,
                  const char* label,
                  std::optional<domain::contracts::TimeRange>& range) {
    try {
        const ohlcv::http::QueryString query(request.query);
        range = ::indicators::RangeSelection::fromBounds(query.value("start"), query.value("end"));
        return true;
    }
    catch (const ::indicators::RangeError& ex) {
        LOG_WARN(label << " rejected range: " << ex.what() << " query=" << request.query);
        ohlcv::http::json_error(response, 400, rangeErrorCode(ex.kind()), ex.what());
        return false;
    }
}

boost::json::object candleToJson(const domain::contracts::Candle& candle) {
    boost::json::object row;
    row["timestamp"] = core::formatTimestamp(candle.ts);
    row["open"] = candle.o;
    row["high"] = candle.h;
    row["low"] = candle.l;
    row["close"] = candle.c;
    row["volume"] = candle.v;
    return row;
}

}  // namespace

Response healthz(const domain::contracts::ICandleReadRepo& repo) {
    Response response{};
    try {
        const auto total = repo.count();
        boost::json::object payload;
        payload["status"] = "ok";
        payload["candles"] = static_cast<std::uint64_t>(total);
        ohlcv::http::write_json(response, payload);
    }
    catch (const std::exception& ex) {
        LOG_WARN("Controllers::healthz store unavailable: " << ex.what());
        boost::json::object detail;
        detail["issue"] = "store_unavailable";
        detail["message"] = ex.what();
        boost::json::array details;
        details.emplace_back(std::move(detail));
        boost::json::object payload;
        payload["status"] = "error";
        payload["details"] = std::move(details);
        ohlcv::http::write_json(response, payload, 503);
    }
    return response;
}

Response version() {
    Response response{};
    boost::json::object payload;
    payload["name"] = "ohlcv-server";
    payload["version"] = "0.1.0";
    ohlcv::http::write_json(response, payload);
    return response;
}

Response candles(const Request& request, const domain::contracts::ICandleReadRepo& repo) {
    common::metrics::RouteTimer requestTimer(kCandlesRouteKey);

    Response response{};

    const auto maxLimit = std::max<std::int32_t>(1, httpLimitState().maxLimit.load(std::memory_order_relaxed));
    std::int32_t limitValue = std::min(
        maxLimit, std::max<std::int32_t>(1, httpLimitState().defaultLimit.load(std::memory_order_relaxed)));

    // An empty value counts as absent. Anything else must be an integer in
    // [0, maxLimit]; 0 selects nothing.
    const ohlcv::http::QueryString query(request.query);
    if (const auto rawLimit = query.value("limit"); rawLimit && !rawLimit->empty()) {
        const auto parsed = query.integer("limit");
        if (!parsed || *parsed < 0 || *parsed > maxLimit) {
            LOG_WARN("Controllers::candles invalid limit query=" << request.query);
            ohlcv::http::json_error(response,
                                    400,
                                    ohlcv::http::errors::limit_invalid,
                                    "limit must be an integer between 0 and " + std::to_string(maxLimit));
            return response;
        }
        limitValue = static_cast<std::int32_t>(*parsed);
    }

    std::vector<domain::contracts::Candle> rows;
    try {
        rows = repo.getCandles(static_cast<std::size_t>(limitValue));
    }
    catch (const std::exception& ex) {
        storeFailure(response, "Controllers::candles", ex);
        return response;
    }

    boost::json::array data;
    data.reserve(rows.size());
    for (const auto& candle : rows) {
        if (!isFiniteCandle(candle)) {
            dataIntegrityFailure(response,
                                 "Controllers::candles",
                                 "non-finite price at " + core::formatTimestamp(candle.ts));
            return response;
        }
        data.emplace_back(candleToJson(candle));
    }

    ohlcv::http::write_json(response, data);

    LOG_INFO("Controllers::candles limit=" << limitValue << " result=" << rows.size());
    return response;
}

Response indicators(const Request& request, const domain::contracts::ICandleReadRepo& repo) {
    common::metrics::RouteTimer requestTimer(kIndicatorsRouteKey);

    Response response{};

    std::optional<domain::contracts::TimeRange> range;
    if (!resolveRange(request, response, "Controllers::indicators", range)) {
        return response;
    }

    std::vector<domain::contracts::Candle> series;
    try {
        series = repo.getSeries(range);
    }
    catch (const std::exception& ex) {
        storeFailure(response, "Controllers::indicators", ex);
        return response;
    }

    const ::indicators::IndicatorEngine engine{};
    std::vector<::indicators::IndicatorPoint> points;
    try {
        points = engine.compute(series);
    }
    catch (const ::indicators::DataIntegrityError& ex) {
        dataIntegrityFailure(response, "Controllers::indicators", ex.what());
        return response;
    }

    const auto& params = engine.params();
    const auto smaKey = params.smaName();
    const auto emaKey = params.emaName();
    const auto rsiKey = params.rsiName();

    boost::json::array data;
    data.reserve(points.size());
    for (const auto& point : points) {
        boost::json::object row;
        row["timestamp"] = core::formatTimestamp(point.ts);
        row[smaKey] = optionalNumber(point.sma);
        row[emaKey] = optionalNumber(point.ema);
        row[rsiKey] = optionalNumber(point.rsi);
        data.emplace_back(std::move(row));
    }

    ohlcv::http::write_json(response, data);

    LOG_INFO("Controllers::indicators ranged=" << (range ? "true" : "false") << " result=" << points.size());
    return response;
}

Response fibonacci(const Request& request, const domain::contracts::ICandleReadRepo& repo) {
    common::metrics::RouteTimer requestTimer(kFibRouteKey);

    Response response{};

    std::optional<domain::contracts::TimeRange> range;
    if (!resolveRange(request, response, "Controllers::fibonacci", range)) {
        return response;
    }

    std::optional<domain::contracts::PriceRange> priceRange;
    try {
        priceRange = repo.getPriceRange(range);
    }
    catch (const std::exception& ex) {
        storeFailure(response, "Controllers::fibonacci", ex);
        return response;
    }

    if (!priceRange) {
        LOG_WARN("Controllers::fibonacci no candles in selection query=" << request.query);
        ohlcv::http::json_error(response, 404, ohlcv::http::errors::no_data);
        return response;
    }

    if (!std::isfinite(priceRange->low) || !std::isfinite(priceRange->high)) {
        dataIntegrityFailure(response, "Controllers::fibonacci", "non-finite min(low)/max(high)");
        return response;
    }

    if (priceRange->high < priceRange->low) {
        LOG_WARN("Controllers::fibonacci inverted price range low=" << priceRange->low
                                                                   << " high=" << priceRange->high);
        ohlcv::http::json_error(response, 400, ohlcv::http::errors::range_invalid);
        return response;
    }

    const auto levels = ::indicators::computeFibonacci(priceRange->low, priceRange->high);

    boost::json::array levelArray;
    levelArray.reserve(levels.levels.size());
    for (const auto& level : levels.levels) {
        boost::json::object entry;
        entry["ratio"] = level.ratio;
        entry["value"] = level.value;
        levelArray.emplace_back(std::move(entry));
    }

    boost::json::object payload;
    payload["low"] = levels.low;
    payload["high"] = levels.high;
    payload["levels"] = std::move(levelArray);

    ohlcv::http::write_json(response, payload);

    LOG_INFO("Controllers::fibonacci low=" << levels.low << " high=" << levels.high);
    return response;
}

Response stats(const domain::contracts::ICandleReadRepo& repo, std::size_t workerThreads) {
    const auto snapshot = common::metrics::Registry::instance().snapshot();

    boost::json::object payload;
    payload["uptime_seconds"] = snapshot.uptimeSeconds;
    payload["threads"] = static_cast<std::uint64_t>(workerThreads);

    try {
        payload["candles"] = static_cast<std::uint64_t>(repo.count());
    }
    catch (const std::exception& ex) {
        LOG_WARN("Controllers::stats candle count unavailable: " << ex.what());
        payload["candles"] = nullptr;
    }

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }
    payload["counters"] = std::move(counters);

    boost::json::object routes;
    for (const auto& [route, metrics] : snapshot.routes) {
        boost::json::object entry;
        entry["requests"] = metrics.requests;
        if (metrics.p95Ms.has_value()) {
            entry["p95_ms"] = *metrics.p95Ms;
        }
        if (metrics.p99Ms.has_value()) {
            entry["p99_ms"] = *metrics.p99Ms;
        }
        routes[route] = std::move(entry);
    }
    payload["routes"] = std::move(routes);

    Response response{};
    ohlcv::http::write_json(response, payload);
    return response;
}

void setHttpLimits(std::int32_t defaultLimit, std::int32_t maxLimit) {
    if (maxLimit < 1) {
        maxLimit = 1;
    }
    if (defaultLimit < 1) {
        defaultLimit = 1;
    }
    if (defaultLimit > maxLimit) {
        defaultLimit = maxLimit;
    }

    auto& state = httpLimitState();
    state.maxLimit.store(maxLimit, std::memory_order_relaxed);
    state.defaultLimit.store(defaultLimit, std::memory_order_relaxed);
}

}  // namespace ohlcv::api
