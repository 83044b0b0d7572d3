#pragma once

#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <map>
#include <string>
#include <vector>

namespace gambit::core::comparison {

// Weights of the quality blend. They need not sum to one.
struct QualityWeights {
    double psd = 0.35;
    double color = 0.25;
    double bracket = 0.20;
    double rating_gap = 0.10;
    double rematch = 0.10;
};

struct ScoreWeights {
    double fide = 0.7;
    double quality = 0.3;
};

struct QualityMetrics {
    // Average absolute score difference per board (raw, lower is better).
    double psd = 0.0;
    double psd_score = 1.0;
    double color_balance = 1.0;
    double bracket_compliance = 1.0;
    double rating_gap = 1.0;
    double rematch_avoidance = 1.0;
};

struct Violation {
    std::string code;
    bool hard = false;
    std::string detail;
};

struct ComplianceReport {
    std::vector<Violation> violations;
    int soft_checks = 0;
    int soft_passed = 0;

    bool hard_violation() const;
    std::map<std::string, int> CountsByCode() const;
};

struct EngineMetrics {
    double fide_score = 0.0;
    double quality_score = 0.0;
    double overall_score = 0.0;
    QualityMetrics quality;
    std::map<std::string, int> violations;
    double elapsed_ms = 0.0;
};

QualityMetrics MeasureQuality(const tournament::PairingResult& pairing, const registry::PlayerRegistry& registry);
double QualityScore(const QualityMetrics& metrics, const QualityWeights& weights = {});
double QualityScore(const tournament::PairingResult& pairing, const registry::PlayerRegistry& registry);

ComplianceReport EvaluateCompliance(const tournament::PairingResult& pairing,
                                    const registry::PlayerRegistry& registry,
                                    const tournament::TournamentConfig& config);
// 0.0 on any hard violation, otherwise the fraction of soft checks passed.
double FideScore(const ComplianceReport& report);
double FideScore(const tournament::PairingResult& pairing,
                 const registry::PlayerRegistry& registry,
                 const tournament::TournamentConfig& config);

double OverallScore(double fide_score, double quality_score, const ScoreWeights& weights = {});

EngineMetrics Evaluate(const tournament::PairingResult& pairing,
                       const registry::PlayerRegistry& registry,
                       const tournament::TournamentConfig& config,
                       const ScoreWeights& weights);

}  // namespace gambit::core::comparison
