#pragma once

#include <cstdint>

namespace domain::contracts {

// One OHLCV row. `ts` is the open time in epoch milliseconds (UTC).
struct Candle {
    std::int64_t ts{0};
    double o{0.0};
    double h{0.0};
    double l{0.0};
    double c{0.0};
    double v{0.0};
};

// Inclusive [fromMs, toMs] selection over candle timestamps.
struct TimeRange {
    std::int64_t fromMs{0};
    std::int64_t toMs{0};

    bool contains(std::int64_t ts) const noexcept { return ts >= fromMs && ts <= toMs; }
};

struct PriceRange {
    double low{0.0};
    double high{0.0};
};

}  // namespace domain::contracts
