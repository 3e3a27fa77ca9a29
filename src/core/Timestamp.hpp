#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace core {

// Renders epoch milliseconds as "YYYY-MM-DD HH:MM:SS" in UTC. Sub-second
// precision is dropped.
std::string formatTimestamp(std::int64_t epochMs);

// Parses "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS", the same two forms
// without seconds, or a bare "YYYY-MM-DD" (UTC). Returns epoch milliseconds,
// or nullopt when the text is not one of those forms or names an impossible
// calendar date.
std::optional<std::int64_t> parseTimestamp(std::string_view text);

}  // namespace core
