#include "gambit/core/stats/TiebreakCalculator.h"

#include <algorithm>
#include <numeric>
#include <optional>

namespace gambit::core::stats {

namespace {

using tournament::ByeOpponentPolicy;
using tournament::TiebreakCriterion;

std::optional<double> ByeOpponentScore(const model::Player& player, const tournament::TournamentConfig& config) {
    switch (config.bye_opponent_policy) {
        case ByeOpponentPolicy::kExclude:
            return std::nullopt;
        case ByeOpponentPolicy::kZero:
            return 0.0;
        case ByeOpponentPolicy::kOwnScore:
            return player.score;
        case ByeOpponentPolicy::kFixed:
            return config.bye_opponent_value;
    }
    return std::nullopt;
}

double SonnebornBerger(const model::Player& player,
                       const registry::PlayerRegistry& registry,
                       const tournament::TournamentConfig& config) {
    double total = 0.0;
    for (const auto& record : player.history) {
        double opponent_score = 0.0;
        if (record.is_bye()) {
            const auto virtual_score = ByeOpponentScore(player, config);
            if (!virtual_score) {
                continue;
            }
            opponent_score = *virtual_score;
        } else if (const auto* opponent = registry.Find(*record.opponent_id)) {
            opponent_score = opponent->score;
        }
        if (record.points == 1.0) {
            total += opponent_score;
        } else if (record.points == 0.5) {
            total += 0.5 * opponent_score;
        }
    }
    return total;
}

double Progressive(const model::Player& player) {
    const auto running = player.RunningScores();
    return std::accumulate(running.begin(), running.end(), 0.0);
}

// Sum of the opponents' current scores, or of their progressive scores.
double CumulativeOpponents(const model::Player& player, const registry::PlayerRegistry& registry, bool progressive) {
    double total = 0.0;
    for (const auto& record : player.history) {
        if (record.is_bye()) {
            continue;
        }
        if (const auto* opponent = registry.Find(*record.opponent_id)) {
            total += progressive ? Progressive(*opponent) : opponent->score;
        }
    }
    return total;
}

double AverageRatingOfOpponents(const model::Player& player, const registry::PlayerRegistry& registry) {
    double sum = 0.0;
    int rated = 0;
    for (const auto& record : player.history) {
        if (record.is_bye()) {
            continue;
        }
        const auto* opponent = registry.Find(*record.opponent_id);
        if (opponent && opponent->rating) {
            sum += *opponent->rating;
            ++rated;
        }
    }
    return rated == 0 ? 0.0 : sum / rated;
}

}  // namespace

double TiebreakCalculator::Buchholz(const std::vector<double>& opponent_scores) {
    return std::accumulate(opponent_scores.begin(), opponent_scores.end(), 0.0);
}

double TiebreakCalculator::BuchholzCut1(const std::vector<double>& opponent_scores) {
    if (opponent_scores.size() < 2) {
        return Buchholz(opponent_scores);
    }
    return Buchholz(opponent_scores) - *std::min_element(opponent_scores.begin(), opponent_scores.end());
}

double TiebreakCalculator::MedianBuchholz(const std::vector<double>& opponent_scores,
                                          double game_points,
                                          int games_played) {
    if (opponent_scores.empty()) {
        return 0.0;
    }
    if (opponent_scores.size() == 1) {
        return opponent_scores.front();
    }
    if (games_played == 0) {
        return Buchholz(opponent_scores);
    }

    auto sorted = opponent_scores;
    std::sort(sorted.begin(), sorted.end());
    const double percentage = game_points / static_cast<double>(games_played);
    if (percentage > 0.5) {
        return std::accumulate(sorted.begin() + 1, sorted.end(), 0.0);
    }
    if (percentage < 0.5) {
        return std::accumulate(sorted.begin(), sorted.end() - 1, 0.0);
    }
    if (sorted.size() < 3) {
        return 0.0;
    }
    return std::accumulate(sorted.begin() + 1, sorted.end() - 1, 0.0);
}

std::vector<double> TiebreakCalculator::OpponentScores(const model::Player& player,
                                                       const registry::PlayerRegistry& registry,
                                                       const tournament::TournamentConfig& config) {
    std::vector<double> scores;
    scores.reserve(player.history.size());
    for (const auto& record : player.history) {
        if (record.is_bye()) {
            if (const auto virtual_score = ByeOpponentScore(player, config)) {
                scores.push_back(*virtual_score);
            }
            continue;
        }
        if (const auto* opponent = registry.Find(*record.opponent_id)) {
            scores.push_back(opponent->score);
        }
    }
    return scores;
}

double TiebreakCalculator::Value(const model::Player& player,
                                 TiebreakCriterion criterion,
                                 const registry::PlayerRegistry& registry,
                                 const tournament::TournamentConfig& config) {
    switch (criterion) {
        case TiebreakCriterion::kBuchholz:
            return Buchholz(OpponentScores(player, registry, config));
        case TiebreakCriterion::kBuchholzCut1:
            return BuchholzCut1(OpponentScores(player, registry, config));
        case TiebreakCriterion::kMedianBuchholz: {
            double game_points = 0.0;
            for (const auto& record : player.history) {
                if (!record.is_bye()) {
                    game_points += record.points;
                }
            }
            return MedianBuchholz(OpponentScores(player, registry, config), game_points, player.GamesPlayed());
        }
        case TiebreakCriterion::kSonnebornBerger:
            return SonnebornBerger(player, registry, config);
        case TiebreakCriterion::kProgressive:
            return Progressive(player);
        case TiebreakCriterion::kCumulativeOpponents:
            return CumulativeOpponents(player, registry, false);
        case TiebreakCriterion::kCumulativeOpponentsProgressive:
            return CumulativeOpponents(player, registry, true);
        case TiebreakCriterion::kMostBlacks:
            return static_cast<double>(player.BlackCount());
        case TiebreakCriterion::kWins:
            return static_cast<double>(std::count_if(player.history.begin(), player.history.end(),
                                                     [](const model::RoundRecord& record) {
                                                         return !record.is_bye() && record.points == 1.0;
                                                     }));
        case TiebreakCriterion::kBlackWins:
            return static_cast<double>(std::count_if(player.history.begin(), player.history.end(),
                                                     [](const model::RoundRecord& record) {
                                                         return record.color == model::Color::kBlack &&
                                                                record.points == 1.0;
                                                     }));
        case TiebreakCriterion::kAverageRatingOfOpponents:
            return AverageRatingOfOpponents(player, registry);
    }
    return 0.0;
}

std::map<std::string, std::vector<double>> TiebreakCalculator::Compute(const registry::PlayerRegistry& registry,
                                                                       const tournament::TournamentConfig& config) {
    std::map<std::string, std::vector<double>> values;
    for (const auto& player : registry.players()) {
        auto& row = values[player.id];
        row.reserve(config.tiebreaks.size());
        for (const auto criterion : config.tiebreaks) {
            row.push_back(Value(player, criterion, registry, config));
        }
    }
    return values;
}

}  // namespace gambit::core::stats
