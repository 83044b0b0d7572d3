#include "gambit/core/comparison/RunningStats.h"

#include <algorithm>
#include <cmath>

namespace gambit::core::comparison {

void RunningStats::Add(double value) {
    if (count_ == 0) {
        min_ = value;
        max_ = value;
    } else {
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }
    ++count_;
    const double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (value - mean_);
}

void RunningStats::Merge(const RunningStats& other) {
    if (other.count_ == 0) {
        return;
    }
    if (count_ == 0) {
        *this = other;
        return;
    }
    const double total = static_cast<double>(count_ + other.count_);
    const double delta = other.mean_ - mean_;
    mean_ += delta * static_cast<double>(other.count_) / total;
    m2_ += other.m2_ + delta * delta * static_cast<double>(count_) * static_cast<double>(other.count_) / total;
    count_ += other.count_;
    min_ = std::min(min_, other.min_);
    max_ = std::max(max_, other.max_);
}

std::optional<double> RunningStats::Variance() const {
    if (count_ < 2) {
        return std::nullopt;
    }
    return m2_ / static_cast<double>(count_ - 1);
}

std::optional<double> RunningStats::StdDev() const {
    const auto variance = Variance();
    if (!variance) {
        return std::nullopt;
    }
    return std::sqrt(*variance);
}

std::optional<double> RunningStats::ConfidenceHalfWidth95() const {
    const auto stddev = StdDev();
    if (!stddev) {
        return std::nullopt;
    }
    return 1.96 * *stddev / std::sqrt(static_cast<double>(count_));
}

}  // namespace gambit::core::comparison
