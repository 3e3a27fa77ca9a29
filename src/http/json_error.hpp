#pragma once

#include <string_view>

#include "api/Controllers.hpp"

namespace ohlcv::http {

// Serializa un error JSON con el formato {"error":"..."} y ajusta la respuesta HTTP.
void json_error(ohlcv::api::Response& response, int statusCode, std::string_view errorCode);

// Igual que el anterior, con un campo "message" que describe la causa.
void json_error(ohlcv::api::Response& response,
                int statusCode,
                std::string_view errorCode,
                std::string_view message);

}  // namespace ohlcv::http
