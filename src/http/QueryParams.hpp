#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ohlcv::http {

// Percent-decodes `value`. Query components also map '+' to a space; paths
// keep it. Malformed escapes are copied through unchanged.
std::string url_decode(std::string_view value, bool plusAsSpace);

// Decoded `key=value` pairs of a request query, in request order.
class QueryString {
public:
    explicit QueryString(std::string_view raw);

    // First value for `key`. A bare `key` or `key=` yields an empty string.
    std::optional<std::string> value(std::string_view key) const;

    // nullopt when absent, empty, or not a base-10 integer that fits int64.
    std::optional<std::int64_t> integer(std::string_view key) const;

private:
    std::vector<std::pair<std::string, std::string>> params_;
};

}  // namespace ohlcv::http
