#include "http/json_error.hpp"

#include <boost/json/object.hpp>

#include "http/HttpJson.hpp"

namespace ohlcv::http {

void json_error(ohlcv::api::Response& response, int statusCode, std::string_view errorCode) {
    boost::json::object payload;
    payload["error"] = errorCode;
    write_json(response, payload, statusCode);
}

void json_error(ohlcv::api::Response& response,
                int statusCode,
                std::string_view errorCode,
                std::string_view message) {
    boost::json::object payload;
    payload["error"] = errorCode;
    if (!message.empty()) {
        payload["message"] = message;
    }
    write_json(response, payload, statusCode);
}

}  // namespace ohlcv::http
