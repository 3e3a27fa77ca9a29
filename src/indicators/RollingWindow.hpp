#pragma once

#include <cstddef>
#include <vector>

namespace indicators {

// Mean over the last `window` pushed values, or over all of them while fewer
// than `window` have been pushed. Push and mean are O(1).
class RollingMean {
public:
    explicit RollingMean(std::size_t window);

    void push(double value);

    // Precondition: size() > 0.
    double mean() const noexcept;

    std::size_t size() const noexcept { return count_; }
    std::size_t window() const noexcept { return buffer_.size(); }

private:
    void accumulate(double value) noexcept;

    std::vector<double> buffer_;
    std::size_t next_{0};
    std::size_t count_{0};
    // Values in the window that are not exactly zero; lets mean() report an
    // exact 0 once every non-zero sample has left the window.
    std::size_t nonZero_{0};
    double sum_{0.0};
    double compensation_{0.0};
};

}  // namespace indicators
