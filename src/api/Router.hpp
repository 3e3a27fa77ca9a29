#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "api/Controllers.hpp"
#include "api/StaticFiles.hpp"

namespace domain::contracts {
class ICandleReadRepo;
}

namespace ohlcv::api {

// Dispatches GET/HEAD requests to the API controllers and falls back to the
// static file root. Indicator and Fibonacci responses are computed per request;
// nothing is cached. `workerThreads` is the server's pool size, reported by
// /stats.
class Router {
public:
    Router(std::shared_ptr<const domain::contracts::ICandleReadRepo> repo,
           std::string staticDir,
           std::size_t workerThreads = 1);

    Response handle(const Request& request) const;

private:
    using Handler = std::function<Response(const Request&)>;

    std::map<std::string, Handler> routes_;
    std::shared_ptr<const domain::contracts::ICandleReadRepo> repo_;
    StaticFiles staticFiles_;
};

}  // namespace ohlcv::api
