#include "indicators/RollingWindow.hpp"

#include <cmath>
#include <stdexcept>

namespace indicators {

RollingMean::RollingMean(std::size_t window) {
    if (window == 0) {
        throw std::invalid_argument("RollingMean window must be positive");
    }
    buffer_.assign(window, 0.0);
}

void RollingMean::push(double value) {
    if (count_ == buffer_.size()) {
        const double evicted = buffer_[next_];
        if (evicted != 0.0) {
            --nonZero_;
        }
        accumulate(-evicted);
    }
    else {
        ++count_;
    }

    buffer_[next_] = value;
    if (value != 0.0) {
        ++nonZero_;
    }
    accumulate(value);
    next_ = (next_ + 1) % buffer_.size();

    if (nonZero_ == 0) {
        sum_ = 0.0;
        compensation_ = 0.0;
    }
}

double RollingMean::mean() const noexcept {
    if (count_ == 0 || nonZero_ == 0) {
        return 0.0;
    }
    return (sum_ + compensation_) / static_cast<double>(count_);
}

// Neumaier summation keeps add/evict drift out of long series.
void RollingMean::accumulate(double value) noexcept {
    const double total = sum_ + value;
    if (std::fabs(sum_) >= std::fabs(value)) {
        compensation_ += (sum_ - total) + value;
    }
    else {
        compensation_ += (value - total) + sum_;
    }
    sum_ = total;
}

}  // namespace indicators
