#include "indicators/RangeSelection.hpp"

#include <algorithm>
#include <iterator>

#include "core/Timestamp.hpp"

namespace indicators {
namespace {

bool isPresent(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

std::int64_t parseBound(const std::string& text, const char* label) {
    const auto parsed = core::parseTimestamp(text);
    if (!parsed) {
        throw RangeError(RangeError::Kind::TimestampInvalid,
                         std::string(label) + " is not a timestamp: '" + text + "'");
    }
    return *parsed;
}

}  // namespace

std::optional<domain::contracts::TimeRange> RangeSelection::fromBounds(const std::optional<std::string>& start,
                                                                       const std::optional<std::string>& end) {
    const bool hasStart = isPresent(start);
    const bool hasEnd = isPresent(end);

    if (!hasStart && !hasEnd) {
        return std::nullopt;
    }
    if (hasStart != hasEnd) {
        throw RangeError(RangeError::Kind::Incomplete,
                         hasStart ? "start supplied without end" : "end supplied without start");
    }

    domain::contracts::TimeRange range;
    range.fromMs = parseBound(*start, "start");
    range.toMs = parseBound(*end, "end");
    if (range.fromMs > range.toMs) {
        throw RangeError(RangeError::Kind::Inverted, "start is after end");
    }
    return range;
}

std::vector<domain::contracts::Candle> RangeSelection::apply(
    const std::vector<domain::contracts::Candle>& series,
    const std::optional<domain::contracts::TimeRange>& range) {
    if (!range) {
        return series;
    }

    const auto byTs = [](const domain::contracts::Candle& candle, std::int64_t ts) { return candle.ts < ts; };
    const auto first = std::lower_bound(series.begin(), series.end(), range->fromMs, byTs);
    auto last = first;
    while (last != series.end() && last->ts <= range->toMs) {
        ++last;
    }
    return std::vector<domain::contracts::Candle>(first, last);
}

}  // namespace indicators
