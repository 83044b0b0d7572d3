#include "gambit/core/comparison/Reporter.h"

#include "gambit/core/util/AtomicFileWriter.h"

#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <utility>

namespace gambit::core::comparison {

namespace {

nlohmann::json OptionalJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json MetricJson(const MetricSummary& metric) {
    nlohmann::json node;
    node["count"] = metric.count;
    if (metric.count == 0) {
        node["mean"] = nullptr;
        node["min"] = nullptr;
        node["max"] = nullptr;
    } else {
        node["mean"] = metric.mean;
        node["min"] = metric.min;
        node["max"] = metric.max;
    }
    node["variance"] = OptionalJson(metric.variance);
    node["stddev"] = OptionalJson(metric.stddev);
    node["ci95"] = OptionalJson(metric.ci95);
    return node;
}

nlohmann::json EngineJson(const EngineSummary& engine) {
    return {
        {"name", engine.name},
        {"fide_score", MetricJson(engine.fide)},
        {"quality_score", MetricJson(engine.quality)},
        {"overall_score", MetricJson(engine.overall)},
        {"elapsed_ms", MetricJson(engine.elapsed_ms)},
        {"median_fide_score", OptionalJson(engine.median_fide)},
        {"median_quality_score", OptionalJson(engine.median_quality)},
        {"failures", engine.failures},
        {"violations", engine.violations},
    };
}

nlohmann::json GroupJson(const GroupBreakdown& group) {
    return {
        {"comparisons", group.comparisons},
        {"wins_a", group.wins_a},
        {"wins_b", group.wins_b},
        {"ties", group.ties},
        {"undecided", group.undecided},
        {"win_rate_a", group.win_rate_a()},
        {"win_rate_b", group.win_rate_b()},
        {"score_difference", MetricJson(group.score_difference)},
    };
}

std::string Fixed(double value, int digits = 3) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(digits) << value;
    return out.str();
}

std::string OptionalText(const std::optional<double>& value) {
    return value ? Fixed(*value, 4) : "undefined";
}

void WriteMetricLine(std::ostringstream& out, const char* label, const MetricSummary& metric) {
    out << "  " << std::left << std::setw(16) << label;
    if (metric.count == 0) {
        out << "no samples\n";
        return;
    }
    out << "mean " << Fixed(metric.mean) << "  sd " << OptionalText(metric.stddev) << "  min "
        << Fixed(metric.min) << "  max " << Fixed(metric.max) << "  ci95 +/- " << OptionalText(metric.ci95)
        << "  (n=" << metric.count << ")\n";
}

void WriteGroupLine(std::ostringstream& out, const GroupBreakdown& group) {
    out << group.wins_a << " / " << group.wins_b << " / " << group.ties << " (a / b / tie)";
    if (group.undecided > 0) {
        out << ", " << group.undecided << " failed";
    }
    if (group.score_difference.count > 0) {
        out << "  mean diff " << Fixed(group.score_difference.mean);
    }
    out << "\n";
}

void WriteEngine(std::ostringstream& out, const char* slot, const EngineSummary& engine) {
    out << "Engine " << slot << ": " << engine.name << "\n";
    WriteMetricLine(out, "fide", engine.fide);
    out << "  median fide     " << OptionalText(engine.median_fide) << "\n";
    WriteMetricLine(out, "quality", engine.quality);
    out << "  median quality  " << OptionalText(engine.median_quality) << "\n";
    WriteMetricLine(out, "overall", engine.overall);
    WriteMetricLine(out, "elapsed ms", engine.elapsed_ms);
    out << "  failures        " << engine.failures << "\n";
    if (!engine.violations.empty()) {
        out << "  violations     ";
        for (const auto& entry : engine.violations) {
            out << " " << entry.first << "=" << entry.second;
        }
        out << "\n";
    }
}

}  // namespace

nlohmann::json Reporter::BuildJsonReport(const StatisticalSummary& summary,
                                         const std::vector<ComparisonResult>& results,
                                         const ReportMetadata& metadata) {
    nlohmann::json report;
    report["metadata"] = {
        {"title", metadata.title},
        {"generated_at", metadata.generated_at},
        {"tournaments", metadata.tournaments},
        {"seed", metadata.seed},
        {"total_comparisons", summary.total_comparisons},
    };
    report["weights"] = {
        {"fide", metadata.weights.fide},
        {"quality", metadata.weights.quality},
        {"tie_margin", metadata.tie_margin},
    };
    report["results"] = {
        {"wins_a", summary.wins_a},
        {"wins_b", summary.wins_b},
        {"ties", summary.ties},
        {"undecided", summary.undecided},
        {"decided", summary.decided()},
        {"win_rate_a", summary.win_rate_a()},
        {"win_rate_b", summary.win_rate_b()},
        {"tie_rate", summary.tie_rate()},
        {"score_difference", MetricJson(summary.score_difference)},
        {"median_score_difference", OptionalJson(summary.median_score_difference)},
        {"significance", OptionalJson(summary.significance)},
        {"confidence_level", OptionalJson(summary.confidence_level)},
        {"min_significance_samples", summary.min_significance_samples},
    };
    report["engines"] = {
        {"a", EngineJson(summary.engine_a)},
        {"b", EngineJson(summary.engine_b)},
    };
    report["divergence"] = {
        {"divergent_pairs", MetricJson(summary.divergence.divergent_pairs)},
        {"matching_share", MetricJson(summary.divergence.matching_share)},
        {"color_divergent_pairs", summary.divergence.color_divergent_pairs},
        {"bye_divergences", summary.divergence.bye_divergences},
    };

    report["rounds"] = nlohmann::json::array();
    for (const auto& entry : summary.by_round) {
        auto node = GroupJson(entry.second);
        node["round"] = entry.first;
        report["rounds"].push_back(std::move(node));
    }

    report["sizes"] = nlohmann::json::object();
    for (const auto& entry : summary.by_size) {
        report["sizes"][entry.first] = GroupJson(entry.second);
    }

    report["failures"] = nlohmann::json::array();
    for (const auto& result : results) {
        for (const auto* outcome : {&result.engine_a, &result.engine_b}) {
            if (!outcome->error) {
                continue;
            }
            report["failures"].push_back({
                {"tournament_id", result.tournament_id},
                {"round", result.round_number},
                {"engine", outcome->engine_name},
                {"kind", ErrorKindName(outcome->error->kind)},
                {"message", outcome->error->message},
            });
        }
    }
    return report;
}

std::string Reporter::FormatText(const StatisticalSummary& summary, const ReportMetadata& metadata) {
    std::ostringstream out;
    out << metadata.title << "\n";
    out << std::string(metadata.title.size(), '=') << "\n";
    if (!metadata.generated_at.empty()) {
        out << "Generated: " << metadata.generated_at << "\n";
    }
    out << "Tournaments: " << metadata.tournaments << "  seed " << metadata.seed << "\n";
    out << "Comparisons: " << summary.total_comparisons << "\n";
    out << "Weights: fide " << Fixed(metadata.weights.fide, 2) << ", quality " << Fixed(metadata.weights.quality, 2)
        << ", tie margin " << Fixed(metadata.tie_margin, 3) << "\n\n";

    out << "Outcome\n";
    out << "  " << summary.engine_a.name << " wins " << summary.wins_a << " (" << Fixed(summary.win_rate_a() * 100.0, 1)
        << "%)\n";
    out << "  " << summary.engine_b.name << " wins " << summary.wins_b << " (" << Fixed(summary.win_rate_b() * 100.0, 1)
        << "%)\n";
    out << "  ties " << summary.ties << " (" << Fixed(summary.tie_rate() * 100.0, 1) << "%)\n";
    if (summary.undecided > 0) {
        out << "  engine failures " << summary.undecided << " (not counted above)\n";
    }
    WriteMetricLine(out, "score diff", summary.score_difference);
    out << "  median diff     " << OptionalText(summary.median_score_difference) << "\n";
    out << "  significance    " << OptionalText(summary.significance) << "\n";
    out << "  confidence      " << OptionalText(summary.confidence_level) << "  (needs "
        << summary.min_significance_samples << " decided comparisons)\n\n";

    WriteEngine(out, "A", summary.engine_a);
    out << "\n";
    WriteEngine(out, "B", summary.engine_b);
    out << "\n";

    out << "Divergence\n";
    WriteMetricLine(out, "pairs", summary.divergence.divergent_pairs);
    WriteMetricLine(out, "matching", summary.divergence.matching_share);
    out << "  colour diffs    " << summary.divergence.color_divergent_pairs << "\n";
    out << "  bye diffs       " << summary.divergence.bye_divergences << "\n\n";

    out << "By round\n";
    for (const auto& entry : summary.by_round) {
        out << "  round " << std::right << std::setw(3) << entry.first << ": ";
        WriteGroupLine(out, entry.second);
    }

    out << "\nBy field size\n";
    for (const auto& entry : summary.by_size) {
        out << "  " << std::left << std::setw(8) << entry.first << ": ";
        WriteGroupLine(out, entry.second);
    }
    return out.str();
}

bool Reporter::WriteReports(const std::string& json_path,
                            const std::string& text_path,
                            const StatisticalSummary& summary,
                            const std::vector<ComparisonResult>& results,
                            const ReportMetadata& metadata,
                            EngineError* error) {
    std::string write_error;
    if (!json_path.empty()) {
        const auto report = BuildJsonReport(summary, results, metadata);
        if (!util::AtomicFileWriter::Write(json_path, report.dump(2), &write_error)) {
            return Fail(error, ErrorKind::kIoError, write_error);
        }
    }
    if (!text_path.empty()) {
        if (!util::AtomicFileWriter::Write(text_path, FormatText(summary, metadata), &write_error)) {
            return Fail(error, ErrorKind::kIoError, write_error);
        }
    }
    return true;
}

}  // namespace gambit::core::comparison
