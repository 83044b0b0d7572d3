#pragma once

#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"

#include <optional>
#include <string>
#include <vector>

namespace gambit::core::stats {

struct StandingRow {
    int rank = 0;
    std::string player_id;
    std::string name;
    std::optional<int> rating;
    double score = 0.0;
    std::vector<double> tiebreaks;
    int games = 0;
    int wins = 0;
    int draws = 0;
    int losses = 0;
    int byes = 0;

    double score_percent() const {
        if (games + byes == 0) {
            return 0.0;
        }
        return (score / static_cast<double>(games + byes)) * 100.0;
    }
};

// Ranking by score, then each configured tiebreak, then rating, then player
// id. Every pair of rows is strictly ordered.
class StandingsTable {
public:
    static StandingsTable Build(const registry::PlayerRegistry& registry,
                                const tournament::TournamentConfig& config);

    const std::vector<StandingRow>& rows() const { return rows_; }
    const std::vector<tournament::TiebreakCriterion>& criteria() const { return criteria_; }
    const StandingRow* Find(const std::string& player_id) const;

    static bool Before(const StandingRow& a, const StandingRow& b);

private:
    std::vector<StandingRow> rows_;
    std::vector<tournament::TiebreakCriterion> criteria_;
};

}  // namespace gambit::core::stats
