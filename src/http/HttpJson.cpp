#include "http/HttpJson.hpp"

#include <array>
#include <string>
#include <utility>

#include <boost/json/serialize.hpp>

namespace ohlcv::http {
namespace {

constexpr std::array<std::pair<int, const char*>, 6> kReasons{{
    {200, "OK"},
    {400, "Bad Request"},
    {404, "Not Found"},
    {405, "Method Not Allowed"},
    {500, "Internal Server Error"},
    {503, "Service Unavailable"},
}};

std::string status_reason(int statusCode) {
    for (const auto& [code, reason] : kReasons) {
        if (code == statusCode) {
            return reason;
        }
    }
    return "Unknown";
}

}  // namespace

void write_json(ohlcv::api::Response& response, const boost::json::value& value, int statusCode) {
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
    response.body = boost::json::serialize(value);
}

}  // namespace ohlcv::http
