#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/comparison/ComparisonEngine.h"
#include "gambit/core/comparison/RunningStats.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gambit::core::comparison {

struct MetricSummary {
    int count = 0;
    double mean = 0.0;
    std::optional<double> variance;
    std::optional<double> stddev;
    double min = 0.0;
    double max = 0.0;
    std::optional<double> ci95;

    static MetricSummary FromStats(const RunningStats& stats);
};

struct EngineSummary {
    std::string name;
    MetricSummary fide;
    MetricSummary quality;
    MetricSummary overall;
    MetricSummary elapsed_ms;
    std::optional<double> median_fide;
    std::optional<double> median_quality;
    int failures = 0;
    std::map<std::string, int> violations;
};

struct DivergenceSummary {
    MetricSummary divergent_pairs;
    MetricSummary matching_share;
    int color_divergent_pairs = 0;
    int bye_divergences = 0;
};

// Outcome counts for one slice of the comparisons (a round number or a
// field size class).
struct GroupBreakdown {
    int comparisons = 0;
    int wins_a = 0;
    int wins_b = 0;
    int ties = 0;
    int undecided = 0;
    MetricSummary score_difference;

    double win_rate_a() const;
    double win_rate_b() const;
};

struct AnalyzerOptions {
    // Below this many decided comparisons significance and confidence are
    // undefined.
    int min_significance_samples = 30;
};

struct StatisticalSummary {
    int total_comparisons = 0;
    int wins_a = 0;
    int wins_b = 0;
    int ties = 0;
    // At least one engine failed. Not part of the win rates.
    int undecided = 0;
    EngineSummary engine_a;
    EngineSummary engine_b;
    // Only rounds where both engines produced a pairing.
    MetricSummary score_difference;
    std::optional<double> median_score_difference;
    DivergenceSummary divergence;
    std::map<int, GroupBreakdown> by_round;
    // Keyed by SizeClass().
    std::map<std::string, GroupBreakdown> by_size;
    // In [0, 1]; grows with sample size and with the distance of A's win rate
    // from one half.
    std::optional<double> significance;
    // In [0.5, 0.99]; grows with sample size and with the leading engine's
    // win share.
    std::optional<double> confidence_level;
    int min_significance_samples = 0;

    int decided() const { return wins_a + wins_b + ties; }
    double win_rate_a() const;
    double win_rate_b() const;
    double tie_rate() const;
};

class StatisticalAnalyzer {
public:
    static StatisticalSummary Summarize(const std::vector<ComparisonResult>& results,
                                        const AnalyzerOptions& options = AnalyzerOptions{});
    static MetricSummary SummarizeSamples(const std::vector<double>& samples);
    static std::optional<double> Median(std::vector<double> samples);
    // "small" up to 16 players, "medium" up to 32, "large" beyond.
    static std::string SizeClass(int player_count);

    // Fails with kInsufficientSamples when the summary has fewer than two
    // samples.
    static bool RequireVariance(const MetricSummary& summary, double& variance, EngineError* error);
};

}  // namespace gambit::core::comparison
