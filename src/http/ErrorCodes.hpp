#pragma once

#include <string_view>

namespace ohlcv::http::errors {

inline constexpr std::string_view limit_invalid = "limit_invalid";
inline constexpr std::string_view timestamp_invalid = "timestamp_invalid";
inline constexpr std::string_view range_incomplete = "range_incomplete";
inline constexpr std::string_view range_inverted = "range_inverted";
inline constexpr std::string_view range_invalid = "range_invalid";
inline constexpr std::string_view no_data = "no_data";
inline constexpr std::string_view data_integrity = "data_integrity";
inline constexpr std::string_view internal_error = "internal_error";
inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view method_not_allowed = "method_not_allowed";
inline constexpr std::string_view bad_request = "bad_request";

}  // namespace ohlcv::http::errors
