#include "RunningStatistic.hpp"
#include <algorithm>
#include <cmath>

namespace target_finder::statistics {

void RunningStatistic::addSample(double x) {
    ++count_;

    if (count_ == 1) {
        min_ = mean_ = max_ = x;
        sumSquaredDeviations_ = 0.0;
        return;
    }

    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(count_);
    sumSquaredDeviations_ += delta * (x - mean_);

    min_ = std::min(x, min_);
    max_ = std::max(x, max_);
}

void RunningStatistic::clear() {
    count_ = 0;
    mean_ = 0.0;
    sumSquaredDeviations_ = 0.0;
    min_ = 0.0;
    max_ = 0.0;
}

double RunningStatistic::sum() const {
    return mean_ * static_cast<double>(count_);
}

double RunningStatistic::variance() const {
    if (count_ < 2) {
        return 0.0;
    }
    return sumSquaredDeviations_ / static_cast<double>(count_ - 1);
}

double RunningStatistic::stdDev() const {
    return std::sqrt(variance());
}

double RunningStatistic::stdErr() const {
    if (count_ < 2) {
        return 0.0;
    }
    return std::sqrt(variance() / static_cast<double>(count_));
}

} // namespace target_finder::statistics
