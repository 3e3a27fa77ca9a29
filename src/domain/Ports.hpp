#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "domain/Models.hpp"

namespace domain::contracts {

// Read side of the candle store. Implementations throw std::runtime_error on
// store failures and report NULL prices as NaN.
class ICandleReadRepo {
public:
    virtual ~ICandleReadRepo() = default;

    // First `limit` candles ordered by timestamp ascending.
    virtual std::vector<Candle> getCandles(std::size_t limit) const = 0;

    // Every candle, or those inside `range`, ordered by timestamp ascending.
    virtual std::vector<Candle> getSeries(const std::optional<TimeRange>& range) const = 0;

    // {min(low), max(high)} over the selection; nullopt when it holds no rows.
    // Both bounds are NaN when any low or high in the selection is NULL or not
    // finite.
    virtual std::optional<PriceRange> getPriceRange(const std::optional<TimeRange>& range) const = 0;

    virtual std::size_t count() const = 0;
};

}  // namespace domain::contracts
