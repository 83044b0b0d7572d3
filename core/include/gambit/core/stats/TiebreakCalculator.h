#pragma once

#include "gambit/core/model/Player.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"

#include <map>
#include <string>
#include <vector>

namespace gambit::core::stats {

class TiebreakCalculator {
public:
    // Values per player id, in the order of config.tiebreaks.
    static std::map<std::string, std::vector<double>> Compute(const registry::PlayerRegistry& registry,
                                                              const tournament::TournamentConfig& config);

    static double Value(const model::Player& player,
                        tournament::TiebreakCriterion criterion,
                        const registry::PlayerRegistry& registry,
                        const tournament::TournamentConfig& config);

    static double Buchholz(const std::vector<double>& opponent_scores);
    static double BuchholzCut1(const std::vector<double>& opponent_scores);
    // USCF modified median: above 50% drop the lowest opponent, below 50% the
    // highest, at exactly 50% both.
    static double MedianBuchholz(const std::vector<double>& opponent_scores, double game_points, int games_played);

    // Current scores of the player's opponents in round order, with byes
    // resolved through the configured bye opponent policy.
    static std::vector<double> OpponentScores(const model::Player& player,
                                              const registry::PlayerRegistry& registry,
                                              const tournament::TournamentConfig& config);
};

}  // namespace gambit::core::stats
