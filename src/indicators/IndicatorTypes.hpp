#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace indicators {

inline constexpr int kDefaultPeriod = 14;

struct IndicatorParams {
    int smaPeriod = kDefaultPeriod;
    int emaPeriod = kDefaultPeriod;
    int rsiPeriod = kDefaultPeriod;

    std::string smaName() const { return "sma_" + std::to_string(smaPeriod); }
    std::string emaName() const { return "ema_" + std::to_string(emaPeriod); }
    std::string rsiName() const { return "rsi_" + std::to_string(rsiPeriod); }
};

// One output row per input candle. A disengaged optional means the value is
// not computable at that point.
struct IndicatorPoint {
    std::int64_t ts{0};
    std::optional<double> sma;
    std::optional<double> ema;
    std::optional<double> rsi;
};

struct FibonacciLevel {
    double ratio{0.0};
    double value{0.0};
};

struct FibonacciLevels {
    double low{0.0};
    double high{0.0};
    std::vector<FibonacciLevel> levels;
};

// Raised when the input carries a price the indicators cannot be computed
// from (NaN, infinity, or a NULL column read back as NaN).
class DataIntegrityError : public std::runtime_error {
public:
    DataIntegrityError(const std::string& message, std::size_t index)
        : std::runtime_error(message), index_(index) {}

    std::size_t index() const noexcept { return index_; }

private:
    std::size_t index_;
};

}  // namespace indicators
