#pragma once

#include <cstdint>

namespace itrack {

/// Streaming mean/variance/min/max over a scalar series (Welford).
/// Plain value type: copy it to snapshot or hand it to another owner.
class RunningStats {
public:
    RunningStats() = default;
    explicit RunningStats(double first) { addValue(first); }

    void addValue(double value);

    uint64_t n() const { return count_; }
    double avg() const { return mean_; }
    double sum() const { return sum_; }
    double min() const { return min_; }
    double max() const { return max_; }
    double lastValue() const { return last_; }

    /// Sample variance, 0 for fewer than two values
    double variance() const;
    double stdev() const;

private:
    uint64_t count_ = 0;
    double mean_ = 0.0;
    double sum_ = 0.0;
    double sum_sq_dev_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
    double last_ = 0.0;
};

}  // namespace itrack
