#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Models.hpp"

namespace indicators {

class RangeError : public std::invalid_argument {
public:
    enum class Kind {
        Incomplete,        // only one of start/end supplied
        TimestampInvalid,  // a bound does not parse as a timestamp
        Inverted,          // start > end
    };

    RangeError(Kind kind, const std::string& message) : std::invalid_argument(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

class RangeSelection {
public:
    // Neither bound selects the full series (nullopt). Both bounds select the
    // inclusive [start, end] range. Anything else throws RangeError. Empty
    // strings count as absent.
    static std::optional<domain::contracts::TimeRange> fromBounds(const std::optional<std::string>& start,
                                                                  const std::optional<std::string>& end);

    // Candles of an ordered series that fall inside `range`, order preserved.
    static std::vector<domain::contracts::Candle> apply(const std::vector<domain::contracts::Candle>& series,
                                                        const std::optional<domain::contracts::TimeRange>& range);
};

}  // namespace indicators
