#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "api/Controllers.hpp"

namespace ohlcv::api {

struct CorsPolicy {
    bool enabled{false};
    std::string origin;
};

// Reads "METHOD TARGET HTTP/x.y" from the first line of `head` and splits the
// target into path and query. nullopt when the line is malformed or the path
// is not absolute. Header fields are not interpreted.
std::optional<Request> parseRequestHead(std::string_view head);

// Status line, headers and (unless `includeBody` is false) the body. Every
// response closes the connection.
std::string renderResponse(const Response& response, const CorsPolicy& cors, bool includeBody);

}  // namespace ohlcv::api
