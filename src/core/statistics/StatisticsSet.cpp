#include "StatisticsSet.hpp"
#include <stdexcept>

namespace target_finder::statistics {

size_t StatisticsSet::addName(const std::string& name) {
    auto it = indexByName_.find(name);
    if (it != indexByName_.end()) {
        return it->second;
    }

    const size_t index = stats_.size();
    indexByName_.emplace(name, index);
    names_.push_back(name);
    stats_.emplace_back();
    return index;
}

size_t StatisticsSet::addSample(size_t index, double value) {
    if (index >= stats_.size()) {
        throw std::out_of_range("Statistic index " + std::to_string(index) + " is not registered");
    }
    stats_[index].addSample(value);
    return index;
}

size_t StatisticsSet::addNamedSample(const std::string& name, double value) {
    return addSample(addName(name), value);
}

bool StatisticsSet::contains(const std::string& name) const {
    return indexByName_.count(name) > 0;
}

size_t StatisticsSet::indexOf(const std::string& name) const {
    auto it = indexByName_.find(name);
    if (it == indexByName_.end()) {
        throw std::out_of_range("Unknown statistic: " + name);
    }
    return it->second;
}

const RunningStatistic& StatisticsSet::at(size_t index) const {
    if (index >= stats_.size()) {
        throw std::out_of_range("Statistic index " + std::to_string(index) + " is not registered");
    }
    return stats_[index];
}

const RunningStatistic& StatisticsSet::at(const std::string& name) const {
    return stats_[indexOf(name)];
}

const std::string& StatisticsSet::nameAt(size_t index) const {
    if (index >= names_.size()) {
        throw std::out_of_range("Statistic index " + std::to_string(index) + " is not registered");
    }
    return names_[index];
}

double StatisticsSet::sumOfMeans() const {
    double total = 0.0;
    for (const auto& stat : stats_) {
        total += stat.mean();
    }
    return total;
}

void StatisticsSet::clear() {
    for (auto& stat : stats_) {
        stat.clear();
    }
}

} // namespace target_finder::statistics
