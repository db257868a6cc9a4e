#pragma once

#include <cstddef>

namespace target_finder::statistics {

/**
 * @brief Constant-memory accumulator for a stream of scalar samples
 *
 * Uses B. P. Welford's update (via Knuth, TAOCP vol. 2) so the variance
 * stays accurate for long streams without storing samples or suffering
 * catastrophic cancellation.
 *
 * With no samples every derived quantity is 0. With a single sample the
 * variance and standard error are 0. NaN samples propagate into the mean
 * and variance; they are not filtered.
 */
class RunningStatistic {
public:
    RunningStatistic() = default;

    void addSample(double x);

    /**
     * @brief Discard all history, returning to the freshly-constructed state
     */
    void clear();

    size_t count() const { return count_; }
    double mean() const { return mean_; }
    double min() const { return min_; }
    double max() const { return max_; }

    /**
     * @brief Sum of all samples, reconstructed as mean * count
     */
    double sum() const;

    /**
     * @brief Sample variance S / (N - 1), or 0 for fewer than two samples
     */
    double variance() const;

    double stdDev() const;

    /**
     * @brief Standard error of the mean, sqrt(variance / N), or 0 for fewer
     *        than two samples
     */
    double stdErr() const;

private:
    size_t count_ = 0;
    double mean_ = 0.0;
    double sumSquaredDeviations_ = 0.0;  ///< Welford's S
    double min_ = 0.0;
    double max_ = 0.0;
};

} // namespace target_finder::statistics
