#include "gambit/core/comparison/Metrics.h"

#include "gambit/core/tournament/SwissRules.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <set>

namespace gambit::core::comparison {

namespace {

constexpr double kRatingGapScale = 400.0;
constexpr double kBracketTarget = 0.7;

double Clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

double ColorFit(const model::Player& player, model::Color assigned) {
    const auto preference = player.GetColorPreference();
    if (preference.color == model::Color::kNone) {
        return -0.10;
    }
    return preference.color == assigned ? 0.0 : -0.25;
}

void AddViolation(ComplianceReport& report, const char* code, bool hard, const std::string& detail) {
    report.violations.push_back({code, hard, detail});
}

void SoftCheck(ComplianceReport& report, bool passed, const char* code, const std::string& detail) {
    report.soft_checks += 1;
    if (passed) {
        report.soft_passed += 1;
    } else {
        AddViolation(report, code, false, detail);
    }
}

void CheckColors(ComplianceReport& report, const model::Player& player, model::Color assigned) {
    const auto preference = player.GetColorPreference();
    if (preference.strength == model::PreferenceStrength::kAbsolute ||
        preference.strength == model::PreferenceStrength::kStrong) {
        SoftCheck(report, preference.color == assigned, "color_preference",
                  player.id + " due " + model::ColorName(preference.color));
    }

    std::vector<model::Color> played;
    for (const auto& record : player.history) {
        if (record.color != model::Color::kNone) {
            played.push_back(record.color);
        }
    }
    if (played.size() >= 2) {
        const bool third = played[played.size() - 1] == assigned && played[played.size() - 2] == assigned;
        SoftCheck(report, !third, "color_streak",
                  player.id + " third " + model::ColorName(assigned) + " in a row");
    }
}

}  // namespace

bool ComplianceReport::hard_violation() const {
    return std::any_of(violations.begin(), violations.end(), [](const Violation& v) { return v.hard; });
}

std::map<std::string, int> ComplianceReport::CountsByCode() const {
    std::map<std::string, int> counts;
    for (const auto& violation : violations) {
        counts[violation.code] += 1;
    }
    return counts;
}

QualityMetrics MeasureQuality(const tournament::PairingResult& pairing, const registry::PlayerRegistry& registry) {
    QualityMetrics metrics;
    double psd_total = 0.0;
    double color_total = 0.0;
    double gap_total = 0.0;
    int boards = 0;
    int same_bracket = 0;
    int rated_boards = 0;
    int rematches = 0;

    for (const auto& board : pairing.pairings) {
        const auto* white = registry.Find(board.white_id);
        const auto* black = registry.Find(board.black_id);
        if (!white || !black) {
            continue;
        }
        boards += 1;
        psd_total += std::fabs(white->score - black->score);
        color_total += std::max(0.0, 1.0 + ColorFit(*white, model::Color::kWhite) +
                                         ColorFit(*black, model::Color::kBlack));
        if (white->score == black->score) {
            same_bracket += 1;
        }
        if (white->rating && black->rating) {
            rated_boards += 1;
            gap_total += Clamp01(1.0 - std::abs(*white->rating - *black->rating) / kRatingGapScale);
        }
        if (white->HasPlayed(black->id)) {
            rematches += 1;
        }
    }

    if (boards == 0) {
        return metrics;
    }
    metrics.psd = psd_total / boards;
    metrics.psd_score = Clamp01(1.0 - metrics.psd / 2.0);
    metrics.color_balance = Clamp01(color_total / boards);
    const double bracket_share = static_cast<double>(same_bracket) / boards;
    metrics.bracket_compliance = bracket_share >= kBracketTarget ? 1.0 : bracket_share / kBracketTarget;
    metrics.rating_gap = rated_boards == 0 ? 1.0 : gap_total / rated_boards;
    metrics.rematch_avoidance = 1.0 - static_cast<double>(rematches) / boards;
    return metrics;
}

double QualityScore(const QualityMetrics& metrics, const QualityWeights& weights) {
    const double total = weights.psd + weights.color + weights.bracket + weights.rating_gap + weights.rematch;
    if (total <= 0.0) {
        return 0.0;
    }
    const double blend = metrics.psd_score * weights.psd + metrics.color_balance * weights.color +
                         metrics.bracket_compliance * weights.bracket + metrics.rating_gap * weights.rating_gap +
                         metrics.rematch_avoidance * weights.rematch;
    return Clamp01(blend / total);
}

double QualityScore(const tournament::PairingResult& pairing, const registry::PlayerRegistry& registry) {
    return QualityScore(MeasureQuality(pairing, registry));
}

ComplianceReport EvaluateCompliance(const tournament::PairingResult& pairing,
                                    const registry::PlayerRegistry& registry,
                                    const tournament::TournamentConfig& config) {
    ComplianceReport report;
    std::set<std::string> seen;
    auto claim = [&](const std::string& id) {
        if (!registry.Find(id)) {
            AddViolation(report, "unknown_player", true, id);
            return;
        }
        if (!seen.insert(id).second) {
            AddViolation(report, "duplicate_player", true, id);
        }
    };

    for (const auto& board : pairing.pairings) {
        if (board.white_id == board.black_id) {
            AddViolation(report, "self_pairing", true, board.white_id);
            continue;
        }
        claim(board.white_id);
        claim(board.black_id);

        const auto* white = registry.Find(board.white_id);
        const auto* black = registry.Find(board.black_id);
        if (!white || !black) {
            continue;
        }
        if (!white->active || !black->active) {
            AddViolation(report, "inactive_player", true, white->active ? black->id : white->id);
        }
        if (white->HasPlayed(black->id)) {
            AddViolation(report, "rematch", true, white->id + " - " + black->id);
        }

        CheckColors(report, *white, model::Color::kWhite);
        CheckColors(report, *black, model::Color::kBlack);
        SoftCheck(report, white->score == black->score, "score_group", white->id + " - " + black->id);
        if (white->federation && black->federation) {
            SoftCheck(report, white->federation->federation_code != black->federation->federation_code,
                      "same_federation", white->id + " - " + black->id);
        }
    }

    const auto ranked = tournament::RankPlayers(registry, config);
    if (pairing.bye_player_id) {
        claim(*pairing.bye_player_id);
        if (ranked.size() % 2 == 0) {
            AddViolation(report, "extra_bye", true, *pairing.bye_player_id);
        }
        const auto* bye = registry.Find(*pairing.bye_player_id);
        if (bye && !bye->active) {
            AddViolation(report, "inactive_player", true, bye->id);
        }
        if (bye) {
            const bool eligible_exists = std::any_of(ranked.begin(), ranked.end(), [](const model::Player* p) {
                return !p->has_received_bye();
            });
            if (bye->has_received_bye() && eligible_exists) {
                AddViolation(report, "bye_repeat", true, bye->id);
            } else {
                const auto it = std::find(ranked.begin(), ranked.end(), bye);
                const bool lower_eligible = it != ranked.end() &&
                                            std::any_of(std::next(it), ranked.end(), [](const model::Player* p) {
                                                return !p->has_received_bye();
                                            });
                SoftCheck(report, !lower_eligible, "bye_not_lowest", bye->id);
            }
        }
    }

    for (const auto* player : ranked) {
        if (seen.count(player->id) == 0) {
            AddViolation(report, "unpaired_player", true, player->id);
        }
    }
    return report;
}

double FideScore(const ComplianceReport& report) {
    if (report.hard_violation()) {
        return 0.0;
    }
    if (report.soft_checks == 0) {
        return 1.0;
    }
    return static_cast<double>(report.soft_passed) / report.soft_checks;
}

double FideScore(const tournament::PairingResult& pairing,
                 const registry::PlayerRegistry& registry,
                 const tournament::TournamentConfig& config) {
    return FideScore(EvaluateCompliance(pairing, registry, config));
}

double OverallScore(double fide_score, double quality_score, const ScoreWeights& weights) {
    double fide_weight = weights.fide;
    double quality_weight = weights.quality;
    const double total = fide_weight + quality_weight;
    if (total > 0.0) {
        fide_weight /= total;
        quality_weight /= total;
    } else {
        fide_weight = 0.5;
        quality_weight = 0.5;
    }
    return Clamp01(fide_score * fide_weight + quality_score * quality_weight);
}

EngineMetrics Evaluate(const tournament::PairingResult& pairing,
                       const registry::PlayerRegistry& registry,
                       const tournament::TournamentConfig& config,
                       const ScoreWeights& weights) {
    EngineMetrics metrics;
    const auto report = EvaluateCompliance(pairing, registry, config);
    metrics.fide_score = FideScore(report);
    metrics.violations = report.CountsByCode();
    metrics.quality = MeasureQuality(pairing, registry);
    metrics.quality_score = QualityScore(metrics.quality);
    metrics.overall_score = OverallScore(metrics.fide_score, metrics.quality_score, weights);
    return metrics;
}

}  // namespace gambit::core::comparison
