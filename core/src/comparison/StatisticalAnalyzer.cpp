#include "gambit/core/comparison/StatisticalAnalyzer.h"

#include <algorithm>
#include <cmath>

namespace gambit::core::comparison {

namespace {

struct EngineAccumulator {
    RunningStats fide;
    RunningStats quality;
    RunningStats overall;
    RunningStats elapsed_ms;
    std::vector<double> fide_samples;
    std::vector<double> quality_samples;
    int failures = 0;
    std::map<std::string, int> violations;

    void Add(const EngineOutcome& outcome) {
        if (!outcome.ok() || !outcome.metrics) {
            failures += 1;
            return;
        }
        const auto& metrics = *outcome.metrics;
        fide.Add(metrics.fide_score);
        quality.Add(metrics.quality_score);
        overall.Add(metrics.overall_score);
        elapsed_ms.Add(metrics.elapsed_ms);
        fide_samples.push_back(metrics.fide_score);
        quality_samples.push_back(metrics.quality_score);
        for (const auto& entry : metrics.violations) {
            violations[entry.first] += entry.second;
        }
    }

    EngineSummary Finish(const std::string& name) const {
        EngineSummary summary;
        summary.name = name;
        summary.fide = MetricSummary::FromStats(fide);
        summary.quality = MetricSummary::FromStats(quality);
        summary.overall = MetricSummary::FromStats(overall);
        summary.elapsed_ms = MetricSummary::FromStats(elapsed_ms);
        summary.median_fide = StatisticalAnalyzer::Median(fide_samples);
        summary.median_quality = StatisticalAnalyzer::Median(quality_samples);
        summary.failures = failures;
        summary.violations = violations;
        return summary;
    }
};

double Rate(int part, int total) {
    return total == 0 ? 0.0 : static_cast<double>(part) / total;
}

void Tally(GroupBreakdown& group, Winner winner) {
    group.comparisons += 1;
    switch (winner) {
        case Winner::kEngineA:
            group.wins_a += 1;
            break;
        case Winner::kEngineB:
            group.wins_b += 1;
            break;
        case Winner::kTie:
            group.ties += 1;
            break;
        case Winner::kNone:
            group.undecided += 1;
            break;
    }
}

}  // namespace

MetricSummary MetricSummary::FromStats(const RunningStats& stats) {
    MetricSummary summary;
    summary.count = static_cast<int>(stats.count());
    if (stats.empty()) {
        return summary;
    }
    summary.mean = stats.mean();
    summary.variance = stats.Variance();
    summary.stddev = stats.StdDev();
    summary.ci95 = stats.ConfidenceHalfWidth95();
    summary.min = stats.min();
    summary.max = stats.max();
    return summary;
}

double GroupBreakdown::win_rate_a() const {
    return Rate(wins_a, comparisons - undecided);
}

double GroupBreakdown::win_rate_b() const {
    return Rate(wins_b, comparisons - undecided);
}

double StatisticalSummary::win_rate_a() const {
    return Rate(wins_a, decided());
}

double StatisticalSummary::win_rate_b() const {
    return Rate(wins_b, decided());
}

double StatisticalSummary::tie_rate() const {
    return Rate(ties, decided());
}

std::optional<double> StatisticalAnalyzer::Median(std::vector<double> samples) {
    if (samples.empty()) {
        return std::nullopt;
    }
    std::sort(samples.begin(), samples.end());
    const size_t mid = samples.size() / 2;
    return samples.size() % 2 == 1 ? samples[mid] : (samples[mid - 1] + samples[mid]) / 2.0;
}

std::string StatisticalAnalyzer::SizeClass(int player_count) {
    if (player_count <= 16) {
        return "small";
    }
    if (player_count <= 32) {
        return "medium";
    }
    return "large";
}

MetricSummary StatisticalAnalyzer::SummarizeSamples(const std::vector<double>& samples) {
    RunningStats stats;
    for (double sample : samples) {
        stats.Add(sample);
    }
    return MetricSummary::FromStats(stats);
}

bool StatisticalAnalyzer::RequireVariance(const MetricSummary& summary, double& variance, EngineError* error) {
    if (!summary.variance) {
        return Fail(error, ErrorKind::kInsufficientSamples,
                    "Variance needs at least 2 samples, have " + std::to_string(summary.count));
    }
    variance = *summary.variance;
    return true;
}

StatisticalSummary StatisticalAnalyzer::Summarize(const std::vector<ComparisonResult>& results,
                                                  const AnalyzerOptions& options) {
    StatisticalSummary summary;
    summary.total_comparisons = static_cast<int>(results.size());
    summary.min_significance_samples = options.min_significance_samples;

    EngineAccumulator engine_a;
    EngineAccumulator engine_b;
    RunningStats score_difference;
    RunningStats divergent_pairs;
    RunningStats matching_share;
    std::vector<double> differences;
    std::map<int, RunningStats> round_differences;
    std::map<std::string, RunningStats> size_differences;

    for (const auto& result : results) {
        engine_a.Add(result.engine_a);
        engine_b.Add(result.engine_b);

        const std::string size_class = SizeClass(result.player_count);
        Tally(summary.by_round[result.round_number], result.winner);
        Tally(summary.by_size[size_class], result.winner);
        switch (result.winner) {
            case Winner::kEngineA:
                summary.wins_a += 1;
                break;
            case Winner::kEngineB:
                summary.wins_b += 1;
                break;
            case Winner::kTie:
                summary.ties += 1;
                break;
            case Winner::kNone:
                summary.undecided += 1;
                break;
        }

        if (!result.decided()) {
            continue;
        }
        const double difference = *result.score_difference;
        score_difference.Add(difference);
        differences.push_back(difference);
        round_differences[result.round_number].Add(difference);
        size_differences[size_class].Add(difference);
        divergent_pairs.Add(static_cast<double>(result.difference.total_differences()));
        matching_share.Add(result.difference.matching_share());
        summary.divergence.color_divergent_pairs += static_cast<int>(result.difference.color_divergent.size());
        summary.divergence.bye_divergences += result.difference.bye_divergent ? 1 : 0;
    }

    const std::string name_a = results.empty() ? "a" : results.front().engine_a.engine_name;
    const std::string name_b = results.empty() ? "b" : results.front().engine_b.engine_name;
    summary.engine_a = engine_a.Finish(name_a);
    summary.engine_b = engine_b.Finish(name_b);
    summary.score_difference = MetricSummary::FromStats(score_difference);
    summary.median_score_difference = Median(std::move(differences));
    summary.divergence.divergent_pairs = MetricSummary::FromStats(divergent_pairs);
    summary.divergence.matching_share = MetricSummary::FromStats(matching_share);
    for (auto& entry : summary.by_round) {
        const auto it = round_differences.find(entry.first);
        if (it != round_differences.end()) {
            entry.second.score_difference = MetricSummary::FromStats(it->second);
        }
    }
    for (auto& entry : summary.by_size) {
        const auto it = size_differences.find(entry.first);
        if (it != size_differences.end()) {
            entry.second.score_difference = MetricSummary::FromStats(it->second);
        }
    }

    const int decided = summary.decided();
    const int minimum = std::max(1, options.min_significance_samples);
    if (decided >= minimum) {
        const double n = static_cast<double>(decided);
        const double deviation = std::fabs(summary.win_rate_a() - 0.5);
        summary.significance = std::min(1.0, deviation * 2.0 * (n / minimum));

        const double leader_share = static_cast<double>(std::max(summary.wins_a, summary.wins_b)) / n;
        const double sample_factor = std::min(1.0, n / (minimum * 3.0));
        summary.confidence_level = std::min(0.99, std::max(0.5, 0.5 + (leader_share - 0.5) * sample_factor));
    }
    return summary;
}

}  // namespace gambit::core::comparison
