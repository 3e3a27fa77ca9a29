#pragma once

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace ohlcv::http {

// Replaces the response with `value` serialized as JSON under `statusCode`.
// Headers set earlier are dropped.
void write_json(ohlcv::api::Response& response, const boost::json::value& value, int statusCode = 200);

}  // namespace ohlcv::http
