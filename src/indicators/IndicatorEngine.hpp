#pragma once

#include <optional>
#include <vector>

#include "domain/Models.hpp"
#include "indicators/IndicatorTypes.hpp"

namespace indicators {

// Computes SMA, EMA and RSI for an ordered candle series in one forward pass
// per indicator. Output has one point per input candle, in input order.
class IndicatorEngine {
public:
    explicit IndicatorEngine(IndicatorParams params = {});

    // Throws DataIntegrityError when any close is not finite.
    std::vector<IndicatorPoint> compute(const std::vector<domain::contracts::Candle>& series) const;

    const IndicatorParams& params() const noexcept { return params_; }

    // Mean of closes over the trailing `period` points, shrinking at the start.
    static std::vector<double> computeSMA(const std::vector<double>& closes, int period);

    // EMA[0] = closes[0]; EMA[i] = a * closes[i] + (1 - a) * EMA[i - 1], a = 2 / (period + 1).
    static std::vector<double> computeEMA(const std::vector<double>& closes, int period);

    // RSI from trailing means of gains and losses (not Wilder smoothing).
    // Absent at index 0 and wherever the average loss is zero.
    static std::vector<std::optional<double>> computeRSI(const std::vector<double>& closes, int period);

private:
    IndicatorParams params_;
};

// Default 14-period indicators for a series.
std::vector<IndicatorPoint> computeIndicators(const std::vector<domain::contracts::Candle>& series);

}  // namespace indicators
