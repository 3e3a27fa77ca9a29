#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <stdexcept>

#include "indicators/Fibonacci.hpp"

namespace {

bool near(double actual, double expected) {
    return std::fabs(actual - expected) <= 1e-9;
}

}  // namespace

int main() {
    const auto levels = indicators::computeFibonacci(100.0, 200.0);
    if (levels.low != 100.0 || levels.high != 200.0) {
        std::cerr << "Expected bounds to be echoed back\n";
        return 1;
    }
    if (levels.levels.size() != indicators::kFibonacciRatios.size()) {
        std::cerr << "Expected " << indicators::kFibonacciRatios.size() << " levels, got "
                  << levels.levels.size() << "\n";
        return 1;
    }

    const double expected[] = {200.0, 176.4, 161.8, 150.0, 138.2, 121.4, 100.0};
    for (std::size_t i = 0; i < levels.levels.size(); ++i) {
        const auto& level = levels.levels[i];
        if (level.ratio != indicators::kFibonacciRatios[i]) {
            std::cerr << "Level " << i << " has ratio " << level.ratio << "\n";
            return 1;
        }
        if (!near(level.value, expected[i])) {
            std::cerr << "Level " << i << " expected " << expected[i] << " got " << level.value << "\n";
            return 1;
        }
        if (i > 0 && level.value > levels.levels[i - 1].value) {
            std::cerr << "Levels must not increase with the ratio\n";
            return 1;
        }
    }

    const auto wide = indicators::computeFibonacci(50.0, 150.0);
    if (wide.levels[0].value != 150.0 || wide.levels[3].value != 100.0 || wide.levels[6].value != 50.0) {
        std::cerr << "Unexpected levels for [50, 150]\n";
        return 1;
    }

    // Ratio 0 is exactly high and ratio 1 exactly low, even where the
    // subtraction would round.
    const auto awkward = indicators::computeFibonacci(0.1, 0.7);
    if (awkward.levels.front().value != 0.7 || awkward.levels.back().value != 0.1) {
        std::cerr << "Expected exact endpoints\n";
        return 1;
    }

    const auto flat = indicators::computeFibonacci(42.0, 42.0);
    for (const auto& level : flat.levels) {
        if (level.value != 42.0) {
            std::cerr << "Expected every level equal to the price on a flat range\n";
            return 1;
        }
    }

    bool inverted = false;
    try {
        (void)indicators::computeFibonacci(10.0, 5.0);
    }
    catch (const std::invalid_argument&) {
        inverted = true;
    }
    if (!inverted) {
        std::cerr << "Expected high < low to be rejected\n";
        return 1;
    }

    bool nonFinite = false;
    try {
        (void)indicators::computeFibonacci(std::numeric_limits<double>::quiet_NaN(), 5.0);
    }
    catch (const indicators::DataIntegrityError&) {
        nonFinite = true;
    }
    if (!nonFinite) {
        std::cerr << "Expected NaN bound to be rejected\n";
        return 1;
    }

    return 0;
}
