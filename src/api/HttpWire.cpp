#include "api/HttpWire.hpp"

#include <string>

namespace ohlcv::api {
namespace {

// Splits off the next space-delimited token; empty when none is left.
std::string_view nextToken(std::string_view& line) {
    const auto begin = line.find_first_not_of(' ');
    if (begin == std::string_view::npos) {
        line = {};
        return {};
    }
    line.remove_prefix(begin);
    const auto end = line.find(' ');
    const auto token = line.substr(0, end);
    line = end == std::string_view::npos ? std::string_view{} : line.substr(end);
    return token;
}

void appendHeader(std::string& out, std::string_view name, std::string_view value) {
    out.append(name).append(": ").append(value).append("\r\n");
}

}  // namespace

std::optional<Request> parseRequestHead(std::string_view head) {
    auto line = head.substr(0, head.find('\n'));
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    Request request{};
    request.method = std::string(nextToken(line));
    request.target = std::string(nextToken(line));
    request.version = std::string(nextToken(line));
    if (request.method.empty() || request.target.empty() || request.version.rfind("HTTP/", 0) != 0 ||
        !nextToken(line).empty()) {
        return std::nullopt;
    }

    const auto queryPos = request.target.find('?');
    request.path = request.target.substr(0, queryPos);
    if (queryPos != std::string::npos) {
        request.query = request.target.substr(queryPos + 1);
    }
    if (request.path.empty() || request.path.front() != '/') {
        return std::nullopt;
    }
    return request;
}

std::string renderResponse(const Response& response, const CorsPolicy& cors, bool includeBody) {
    std::string out;
    out.reserve(256 + (includeBody ? response.body.size() : 0));
    out.append("HTTP/1.1 ")
        .append(std::to_string(response.statusCode))
        .append(" ")
        .append(response.statusText)
        .append("\r\n");

    appendHeader(out, "Content-Type", response.contentType.empty() ? "application/json" : response.contentType);
    for (const auto& [name, value] : response.headers) {
        if (!name.empty()) {
            appendHeader(out, name, value);
        }
    }
    if (cors.enabled && !cors.origin.empty()) {
        appendHeader(out, "Access-Control-Allow-Origin", cors.origin);
        appendHeader(out, "Vary", "Origin");
        appendHeader(out, "Access-Control-Allow-Headers", "Content-Type");
    }
    appendHeader(out, "Content-Length", std::to_string(response.body.size()));
    appendHeader(out, "Connection", "close");
    out.append("\r\n");

    if (includeBody) {
        out.append(response.body);
    }
    return out;
}

}  // namespace ohlcv::api
