#include "indicators/Fibonacci.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace indicators {

FibonacciLevels computeFibonacci(double low, double high) {
    if (!std::isfinite(low) || !std::isfinite(high)) {
        throw DataIntegrityError("non-finite price range low=" + std::to_string(low)
                                     + " high=" + std::to_string(high),
                                 0);
    }
    if (high < low) {
        throw std::invalid_argument("Fibonacci range requires high >= low (low=" + std::to_string(low)
                                    + " high=" + std::to_string(high) + ")");
    }

    FibonacciLevels result;
    result.low = low;
    result.high = high;
    result.levels.reserve(kFibonacciRatios.size());

    const double span = high - low;
    for (const double ratio : kFibonacciRatios) {
        // high - (high - low) can round away from low; pin the bottom level.
        const double value = ratio == 1.0 ? low : high - span * ratio;
        result.levels.push_back(FibonacciLevel{ratio, value});
    }
    return result;
}

}  // namespace indicators
