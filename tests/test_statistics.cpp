#include "gambit/core/comparison/RunningStats.h"
#include "gambit/core/comparison/StatisticalAnalyzer.h"

#include <catch2/catch.hpp>

#include <cmath>
#include <optional>
#include <vector>

using gambit::core::EngineError;
using gambit::core::ErrorKind;
using gambit::core::comparison::AnalyzerOptions;
using gambit::core::comparison::ComparisonResult;
using gambit::core::comparison::EngineMetrics;
using gambit::core::comparison::RunningStats;
using gambit::core::comparison::StatisticalAnalyzer;
using gambit::core::comparison::Winner;
using gambit::core::tournament::PairingResult;

namespace {

ComparisonResult Outcome(int round, double overall_a, std::optional<double> overall_b, int players = 8) {
    ComparisonResult result;
    result.tournament_id = "t";
    result.round_number = round;
    result.player_count = players;
    result.engine_a.engine_name = "gambit";
    result.engine_a.pairing = PairingResult{};
    EngineMetrics metrics_a;
    metrics_a.overall_score = overall_a;
    metrics_a.quality_score = overall_a;
    metrics_a.fide_score = 1.0;
    metrics_a.violations["score_group"] = 1;
    result.engine_a.metrics = metrics_a;

    result.engine_b.engine_name = "reference";
    if (overall_b) {
        result.engine_b.pairing = PairingResult{};
        EngineMetrics metrics_b;
        metrics_b.overall_score = *overall_b;
        metrics_b.quality_score = *overall_b;
        result.engine_b.metrics = metrics_b;
        result.score_difference = overall_a - *overall_b;
        if (std::fabs(*result.score_difference) < 0.01) {
            result.winner = Winner::kTie;
        } else {
            result.winner = *result.score_difference > 0.0 ? Winner::kEngineA : Winner::kEngineB;
        }
    } else {
        result.engine_b.error = EngineError{ErrorKind::kPairingInfeasible, "no pairing"};
    }
    return result;
}

}  // namespace

TEST_CASE("Sample statistics use the n - 1 denominator", "[statistics]") {
    const auto summary = StatisticalAnalyzer::SummarizeSamples({0.8, 0.9, 1.0});
    REQUIRE(summary.count == 3);
    REQUIRE(summary.mean == Approx(0.9));
    REQUIRE(summary.variance.has_value());
    REQUIRE(*summary.variance == Approx(0.01));
    REQUIRE(*summary.stddev == Approx(0.1));
    REQUIRE(summary.min == Approx(0.8));
    REQUIRE(summary.max == Approx(1.0));
    REQUIRE(*summary.ci95 == Approx(1.96 * 0.1 / std::sqrt(3.0)));
}

TEST_CASE("Variance is undefined below two samples", "[statistics][errors]") {
    const auto single = StatisticalAnalyzer::SummarizeSamples({0.5});
    REQUIRE(single.count == 1);
    REQUIRE(single.mean == 0.5);
    REQUIRE_FALSE(single.variance.has_value());
    REQUIRE_FALSE(single.stddev.has_value());

    double variance = -1.0;
    EngineError error;
    REQUIRE_FALSE(StatisticalAnalyzer::RequireVariance(single, variance, &error));
    REQUIRE(error.kind == ErrorKind::kInsufficientSamples);
    REQUIRE(variance == -1.0);

    const auto pair = StatisticalAnalyzer::SummarizeSamples({0.0, 1.0});
    REQUIRE(StatisticalAnalyzer::RequireVariance(pair, variance, &error));
    REQUIRE(variance == Approx(0.5));

    REQUIRE(StatisticalAnalyzer::SummarizeSamples({}).count == 0);
}

TEST_CASE("Running statistics stay stable and merge", "[statistics]") {
    RunningStats left;
    RunningStats right;
    RunningStats all;
    for (int i = 0; i < 10000; ++i) {
        const double value = (i % 3 == 0) ? 1.0 : 0.5;
        (i < 4000 ? left : right).Add(value);
        all.Add(value);
    }
    left.Merge(right);
    REQUIRE(left.count() == all.count());
    REQUIRE(left.mean() == Approx(all.mean()));
    REQUIRE(*left.Variance() == Approx(*all.Variance()));
    REQUIRE(left.min() == 0.5);
    REQUIRE(left.max() == 1.0);
    REQUIRE(all.sum() == Approx(3334 * 1.0 + 6666 * 0.5));

    RunningStats empty;
    empty.Merge(all);
    REQUIRE(empty.count() == all.count());
}

TEST_CASE("Summaries count wins, ties and failures", "[statistics][summary]") {
    const std::vector<ComparisonResult> results = {
        Outcome(1, 0.9, 0.8),
        Outcome(1, 0.7, 0.8),
        Outcome(2, 0.8, 0.8),
        Outcome(2, 0.6, std::nullopt),
    };
    const auto summary = StatisticalAnalyzer::Summarize(results);

    REQUIRE(summary.total_comparisons == 4);
    REQUIRE(summary.wins_a == 1);
    REQUIRE(summary.wins_b == 1);
    REQUIRE(summary.ties == 1);
    REQUIRE(summary.undecided == 1);
    REQUIRE(summary.decided() == 3);
    REQUIRE(summary.win_rate_a() == Approx(1.0 / 3.0));
    REQUIRE(summary.tie_rate() == Approx(1.0 / 3.0));
    REQUIRE(summary.engine_a.name == "gambit");
    REQUIRE(summary.engine_a.overall.count == 4);
    REQUIRE(summary.engine_a.violations.at("score_group") == 4);
    REQUIRE(summary.engine_b.failures == 1);
    REQUIRE(summary.engine_b.overall.count == 3);

    REQUIRE(summary.score_difference.count == 3);
    REQUIRE(summary.score_difference.mean == Approx(0.0).margin(1e-12));
    REQUIRE(*summary.median_score_difference == Approx(0.0).margin(1e-12));
    REQUIRE(summary.by_round.at(1).comparisons == 2);
    REQUIRE(summary.by_round.at(2).ties == 1);
    REQUIRE(summary.by_round.at(2).undecided == 1);
    REQUIRE(summary.by_round.at(2).win_rate_a() == 0.0);
    REQUIRE(summary.by_round.at(2).score_difference.count == 1);
    REQUIRE_FALSE(summary.by_round.at(2).score_difference.variance.has_value());
}

TEST_CASE("Summaries break results down by field size", "[statistics][summary]") {
    const std::vector<ComparisonResult> results = {
        Outcome(1, 0.9, 0.8, 10),
        Outcome(1, 0.9, 0.8, 16),
        Outcome(1, 0.5, 0.8, 24),
        Outcome(1, 0.5, std::nullopt, 40),
    };
    const auto summary = StatisticalAnalyzer::Summarize(results);

    REQUIRE(StatisticalAnalyzer::SizeClass(16) == "small");
    REQUIRE(StatisticalAnalyzer::SizeClass(17) == "medium");
    REQUIRE(StatisticalAnalyzer::SizeClass(33) == "large");
    REQUIRE(summary.by_size.size() == 3);
    REQUIRE(summary.by_size.at("small").comparisons == 2);
    REQUIRE(summary.by_size.at("small").wins_a == 2);
    REQUIRE(summary.by_size.at("small").win_rate_a() == 1.0);
    REQUIRE(summary.by_size.at("medium").wins_b == 1);
    REQUIRE(summary.by_size.at("large").undecided == 1);
    REQUIRE(summary.by_size.at("large").score_difference.count == 0);
}

TEST_CASE("Engine summaries carry fide and quality medians", "[statistics][summary]") {
    const auto summary = StatisticalAnalyzer::Summarize({
        Outcome(1, 0.9, 0.8),
        Outcome(1, 0.7, 0.6),
        Outcome(2, 0.8, std::nullopt),
        Outcome(2, 0.6, 0.4),
    });
    REQUIRE(*summary.engine_a.median_fide == 1.0);
    REQUIRE(*summary.engine_a.median_quality == Approx(0.75));
    REQUIRE(*summary.engine_b.median_quality == Approx(0.6));
    REQUIRE_FALSE(StatisticalAnalyzer::Median({}).has_value());
    REQUIRE(*StatisticalAnalyzer::Median({3.0, 1.0, 2.0}) == 2.0);
}

TEST_CASE("Significance needs a minimum number of decided comparisons", "[statistics][significance]") {
    const std::vector<ComparisonResult> results = {
        Outcome(1, 0.9, 0.5),
        Outcome(1, 0.9, 0.5),
        Outcome(2, 0.9, 0.5),
        Outcome(2, 0.5, 0.9),
        Outcome(3, 0.9, std::nullopt),
    };

    AnalyzerOptions options;
    options.min_significance_samples = 5;
    const auto short_run = StatisticalAnalyzer::Summarize(results, options);
    REQUIRE(short_run.decided() == 4);
    REQUIRE_FALSE(short_run.significance.has_value());
    REQUIRE_FALSE(short_run.confidence_level.has_value());

    options.min_significance_samples = 4;
    const auto summary = StatisticalAnalyzer::Summarize(results, options);
    REQUIRE(summary.win_rate_a() == Approx(0.75));
    REQUIRE(*summary.significance == Approx(0.5));
    REQUIRE(*summary.confidence_level == Approx(0.5 + 0.25 / 3.0));
    REQUIRE(summary.min_significance_samples == 4);

    REQUIRE_FALSE(StatisticalAnalyzer::Summarize(results).significance.has_value());
}

TEST_CASE("An empty summary has no defined statistics", "[statistics][summary]") {
    const auto summary = StatisticalAnalyzer::Summarize({});
    REQUIRE(summary.total_comparisons == 0);
    REQUIRE(summary.win_rate_a() == 0.0);
    REQUIRE_FALSE(summary.median_score_difference.has_value());
    REQUIRE_FALSE(summary.score_difference.variance.has_value());
}
