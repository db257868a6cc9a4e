#pragma once

#include "RunningStatistic.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace target_finder::statistics {

/**
 * @brief Named RunningStatistic instances addressed by name or index
 *
 * Names keep their insertion order, which is the order reports list them in.
 * Indices returned by addName() stay valid for the lifetime of the set.
 */
class StatisticsSet {
public:
    /**
     * @brief Register a statistic, or look up an existing one
     * @return Index of the statistic with this name
     */
    size_t addName(const std::string& name);

    /**
     * @brief Add a sample to a statistic by index
     * @throws std::out_of_range if the index was never returned by addName()
     */
    size_t addSample(size_t index, double value);

    /**
     * @brief Add a sample by name, registering the name on first use
     */
    size_t addNamedSample(const std::string& name, double value);

    bool contains(const std::string& name) const;

    /**
     * @throws std::out_of_range for an unknown name
     */
    size_t indexOf(const std::string& name) const;

    const RunningStatistic& at(size_t index) const;
    const RunningStatistic& at(const std::string& name) const;

    const std::string& nameAt(size_t index) const;

    size_t size() const { return stats_.size(); }

    /**
     * @brief Sum of the means of every statistic in the set
     */
    double sumOfMeans() const;

    /**
     * @brief Clear every statistic; names and indices are kept
     */
    void clear();

private:
    std::unordered_map<std::string, size_t> indexByName_;
    std::vector<std::string> names_;
    std::vector<RunningStatistic> stats_;
};

} // namespace target_finder::statistics
