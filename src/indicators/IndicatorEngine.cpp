#include "indicators/IndicatorEngine.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

#include "indicators/RollingWindow.hpp"

namespace indicators {
namespace {

double smoothingFactor(int period) {
    return 2.0 / (static_cast<double>(period) + 1.0);
}

void requirePositive(int period, const char* label) {
    if (period <= 0) {
        throw std::invalid_argument(std::string(label) + " period must be positive");
    }
}

std::vector<double> extractCloses(const std::vector<domain::contracts::Candle>& series) {
    std::vector<double> closes;
    closes.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        const double close = series[i].c;
        if (!std::isfinite(close)) {
            throw DataIntegrityError("non-finite close at index " + std::to_string(i) + " (ts="
                                         + std::to_string(series[i].ts) + ")",
                                     i);
        }
        closes.push_back(close);
    }
    return closes;
}

}  // namespace

IndicatorEngine::IndicatorEngine(IndicatorParams params) : params_(params) {
    requirePositive(params_.smaPeriod, "SMA");
    requirePositive(params_.emaPeriod, "EMA");
    requirePositive(params_.rsiPeriod, "RSI");
}

std::vector<IndicatorPoint> IndicatorEngine::compute(
    const std::vector<domain::contracts::Candle>& series) const {
    const auto closes = extractCloses(series);

    const auto sma = computeSMA(closes, params_.smaPeriod);
    const auto ema = computeEMA(closes, params_.emaPeriod);
    const auto rsi = computeRSI(closes, params_.rsiPeriod);

    std::vector<IndicatorPoint> points;
    points.reserve(series.size());
    for (std::size_t i = 0; i < series.size(); ++i) {
        IndicatorPoint point;
        point.ts = series[i].ts;
        point.sma = sma[i];
        point.ema = ema[i];
        point.rsi = rsi[i];
        points.push_back(point);
    }
    return points;
}

std::vector<double> IndicatorEngine::computeSMA(const std::vector<double>& closes, int period) {
    requirePositive(period, "SMA");

    std::vector<double> values;
    values.reserve(closes.size());

    RollingMean window(static_cast<std::size_t>(period));
    for (const double close : closes) {
        window.push(close);
        values.push_back(window.mean());
    }
    return values;
}

std::vector<double> IndicatorEngine::computeEMA(const std::vector<double>& closes, int period) {
    requirePositive(period, "EMA");

    std::vector<double> values;
    values.reserve(closes.size());
    if (closes.empty()) {
        return values;
    }

    const double alpha = smoothingFactor(period);
    double ema = closes.front();
    values.push_back(ema);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        ema = alpha * closes[i] + (1.0 - alpha) * ema;
        values.push_back(ema);
    }
    return values;
}

std::vector<std::optional<double>> IndicatorEngine::computeRSI(const std::vector<double>& closes,
                                                               int period) {
    requirePositive(period, "RSI");

    std::vector<std::optional<double>> values;
    values.reserve(closes.size());
    if (closes.empty()) {
        return values;
    }

    RollingMean gains(static_cast<std::size_t>(period));
    RollingMean losses(static_cast<std::size_t>(period));

    // The first point has no delta; it still occupies a slot in the window
    // with zero gain and zero loss.
    gains.push(0.0);
    losses.push(0.0);
    values.emplace_back(std::nullopt);

    for (std::size_t i = 1; i < closes.size(); ++i) {
        const double delta = closes[i] - closes[i - 1];
        gains.push(delta > 0.0 ? delta : 0.0);
        losses.push(delta < 0.0 ? -delta : 0.0);

        const double avgLoss = losses.mean();
        if (avgLoss == 0.0) {
            values.emplace_back(std::nullopt);
            continue;
        }
        const double avgGain = gains.mean();
        values.emplace_back(100.0 - 100.0 / (1.0 + avgGain / avgLoss));
    }
    return values;
}

std::vector<IndicatorPoint> computeIndicators(const std::vector<domain::contracts::Candle>& series) {
    static const IndicatorEngine engine{};
    return engine.compute(series);
}

}  // namespace indicators
