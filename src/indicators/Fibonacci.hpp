#pragma once

#include <array>

#include "indicators/IndicatorTypes.hpp"

namespace indicators {

inline constexpr std::array<double, 7> kFibonacciRatios{0.0, 0.236, 0.382, 0.5, 0.618, 0.786, 1.0};

// Retracement levels between `low` and `high`: value = high - (high - low) * ratio,
// so ratio 0 maps to high and ratio 1 to low.
// Throws std::invalid_argument when high < low and DataIntegrityError when a
// bound is not finite.
FibonacciLevels computeFibonacci(double low, double high);

}  // namespace indicators
