#include "running_stats.h"

#include <cmath>

namespace itrack {

void RunningStats::addValue(double value) {
    last_ = value;
    ++count_;

    if (count_ == 1) {
        min_ = value;
        max_ = value;
    } else {
        if (value < min_) min_ = value;
        if (value > max_) max_ = value;
    }

    double prev_mean = mean_;
    sum_ += value;
    mean_ += (value - prev_mean) / static_cast<double>(count_);
    sum_sq_dev_ += (value - prev_mean) * (value - mean_);
}

double RunningStats::variance() const {
    return count_ > 1 ? sum_sq_dev_ / static_cast<double>(count_ - 1) : 0.0;
}

double RunningStats::stdev() const {
    return std::sqrt(variance());
}

}  // namespace itrack
