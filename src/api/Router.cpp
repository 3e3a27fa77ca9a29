#include "api/Router.hpp"

#include <stdexcept>
#include <utility>

#include "common/Metrics.hpp"
#include "domain/Ports.hpp"
#include "http/ErrorCodes.hpp"
#include "http/json_error.hpp"

namespace ohlcv::api {

namespace {

constexpr char kStaticRouteKey[] = "GET /*";

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

}  // namespace

Router::Router(std::shared_ptr<const domain::contracts::ICandleReadRepo> repo,
               std::string staticDir,
               std::size_t workerThreads)
    : repo_(std::move(repo)), staticFiles_(std::move(staticDir)) {
    if (!repo_) {
        throw std::invalid_argument("Router requires a candle repository");
    }

    const auto store = repo_;
    routes_.emplace(makeKey("GET", "/healthz"), [store](const Request&) { return healthz(*store); });
    routes_.emplace(makeKey("GET", "/version"), [](const Request&) { return version(); });
    routes_.emplace(makeKey("GET", "/stats"),
                    [store, workerThreads](const Request&) { return stats(*store, workerThreads); });
    routes_.emplace(makeKey("GET", "/api/candles"),
                    [store](const Request& request) { return candles(request, *store); });
    routes_.emplace(makeKey("GET", "/api/indicators"),
                    [store](const Request& request) { return indicators(request, *store); });
    routes_.emplace(makeKey("GET", "/api/fib"),
                    [store](const Request& request) { return fibonacci(request, *store); });
}

Response Router::handle(const Request& request) const {
    if (request.method != "GET" && request.method != "HEAD") {
        Response response{};
        ohlcv::http::json_error(response, 405, ohlcv::http::errors::method_not_allowed);
        response.headers.emplace_back("Allow", "GET, HEAD");
        return response;
    }

    // HEAD is answered like GET; the server drops the body.
    const auto key = makeKey("GET", request.path);
    const auto it = routes_.find(key);
    if (it != routes_.end()) {
        common::metrics::Registry::instance().incrementRequest(key);
        return it->second(request);
    }

    if (auto file = staticFiles_.serve(request.path)) {
        common::metrics::Registry::instance().incrementRequest(kStaticRouteKey);
        return std::move(*file);
    }

    Response response{};
    ohlcv::http::json_error(response, 404, ohlcv::http::errors::not_found);
    return response;
}

}  // namespace ohlcv::api
