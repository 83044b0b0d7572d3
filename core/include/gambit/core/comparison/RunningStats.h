#pragma once

#include <cstddef>
#include <optional>

namespace gambit::core::comparison {

// Welford accumulator. Two accumulators over disjoint samples can be merged
// into the accumulator of the union.
class RunningStats {
public:
    void Add(double value);
    void Merge(const RunningStats& other);

    std::size_t count() const { return count_; }
    bool empty() const { return count_ == 0; }
    double mean() const { return mean_; }
    double min() const { return min_; }
    double max() const { return max_; }
    double sum() const { return mean_ * static_cast<double>(count_); }

    // Sample variance (n - 1); undefined below two samples.
    std::optional<double> Variance() const;
    std::optional<double> StdDev() const;
    // Half width of the normal approximation 95% confidence interval.
    std::optional<double> ConfidenceHalfWidth95() const;

private:
    std::size_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
};

}  // namespace gambit::core::comparison
