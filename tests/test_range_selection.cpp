#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "indicators/RangeSelection.hpp"

namespace {

using indicators::RangeError;
using indicators::RangeSelection;

constexpr std::int64_t kFeb1 = 1706745600000LL;
constexpr std::int64_t kDayMs = 86'400'000LL;

std::vector<domain::contracts::Candle> dailySeries(int days) {
    std::vector<domain::contracts::Candle> series;
    for (int i = 0; i < days; ++i) {
        const double price = 100.0 + i;
        series.push_back(domain::contracts::Candle{kFeb1 + i * kDayMs, price, price + 2, price - 2, price, 10.0});
    }
    return series;
}

bool expectKind(const std::optional<std::string>& start,
                const std::optional<std::string>& end,
                RangeError::Kind expected,
                const char* label) {
    try {
        (void)RangeSelection::fromBounds(start, end);
    }
    catch (const RangeError& ex) {
        if (ex.kind() != expected) {
            std::cerr << label << ": unexpected error kind (" << ex.what() << ")\n";
            return false;
        }
        return true;
    }
    std::cerr << label << ": expected a RangeError\n";
    return false;
}

}  // namespace

int main() {
    if (RangeSelection::fromBounds(std::nullopt, std::nullopt)) {
        std::cerr << "Expected no range when both bounds are absent\n";
        return 1;
    }
    if (RangeSelection::fromBounds(std::string{}, std::string{})) {
        std::cerr << "Expected empty bounds to count as absent\n";
        return 1;
    }

    if (!expectKind(std::string("2024-02-01"), std::nullopt, RangeError::Kind::Incomplete, "start only")) return 1;
    if (!expectKind(std::string{}, std::string("2024-02-01"), RangeError::Kind::Incomplete, "end only")) return 1;
    if (!expectKind(std::string("not-a-date"), std::string("2024-02-01"), RangeError::Kind::TimestampInvalid,
                    "bad start")) {
        return 1;
    }
    if (!expectKind(std::string("2024-02-07"), std::string("2024-02-01"), RangeError::Kind::Inverted, "inverted")) {
        return 1;
    }

    const auto range = RangeSelection::fromBounds(std::string("2024-02-02 00:00:00"),
                                                  std::string("2024-02-04 00:00:00"));
    if (!range || range->fromMs != kFeb1 + kDayMs || range->toMs != kFeb1 + 3 * kDayMs) {
        std::cerr << "Unexpected parsed range\n";
        return 1;
    }

    const auto series = dailySeries(7);
    const auto selected = RangeSelection::apply(series, range);
    if (selected.size() != 3) {
        std::cerr << "Expected inclusive bounds to select 3 candles, got " << selected.size() << "\n";
        return 1;
    }
    if (selected.front().ts != range->fromMs || selected.back().ts != range->toMs) {
        std::cerr << "Expected selection to start and end on the bounds\n";
        return 1;
    }

    if (RangeSelection::apply(series, std::nullopt).size() != series.size()) {
        std::cerr << "Expected the full series without a range\n";
        return 1;
    }

    const auto single = RangeSelection::fromBounds(std::string("2024-02-03"), std::string("2024-02-03"));
    if (!single || RangeSelection::apply(series, single).size() != 1) {
        std::cerr << "Expected start == end to select exactly one candle\n";
        return 1;
    }

    const auto outside = RangeSelection::fromBounds(std::string("2023-01-01"), std::string("2023-01-31"));
    if (!RangeSelection::apply(series, outside).empty()) {
        std::cerr << "Expected a range before the data to select nothing\n";
        return 1;
    }

    return 0;
}
