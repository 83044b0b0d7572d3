#include "gambit/core/stats/StandingsTable.h"

#include "gambit/core/stats/TiebreakCalculator.h"

#include <algorithm>
#include <utility>

namespace gambit::core::stats {

StandingsTable StandingsTable::Build(const registry::PlayerRegistry& registry,
                                     const tournament::TournamentConfig& config) {
    StandingsTable table;
    table.criteria_ = config.tiebreaks;
    auto tiebreaks = TiebreakCalculator::Compute(registry, config);

    table.rows_.reserve(registry.size());
    for (const auto& player : registry.players()) {
        StandingRow row;
        row.player_id = player.id;
        row.name = player.name;
        row.rating = player.rating;
        row.score = player.score;
        row.tiebreaks = std::move(tiebreaks[player.id]);
        for (const auto& record : player.history) {
            if (record.is_bye()) {
                row.byes += 1;
                continue;
            }
            row.games += 1;
            if (record.points == 1.0) {
                row.wins += 1;
            } else if (record.points == 0.5) {
                row.draws += 1;
            } else {
                row.losses += 1;
            }
        }
        table.rows_.push_back(std::move(row));
    }

    std::sort(table.rows_.begin(), table.rows_.end(), &StandingsTable::Before);
    for (size_t i = 0; i < table.rows_.size(); ++i) {
        table.rows_[i].rank = static_cast<int>(i) + 1;
    }
    return table;
}

bool StandingsTable::Before(const StandingRow& a, const StandingRow& b) {
    if (a.score != b.score) {
        return a.score > b.score;
    }
    const size_t count = std::min(a.tiebreaks.size(), b.tiebreaks.size());
    for (size_t i = 0; i < count; ++i) {
        if (a.tiebreaks[i] != b.tiebreaks[i]) {
            return a.tiebreaks[i] > b.tiebreaks[i];
        }
    }
    const int a_rating = a.rating.value_or(0);
    const int b_rating = b.rating.value_or(0);
    if (a_rating != b_rating) {
        return a_rating > b_rating;
    }
    return a.player_id < b.player_id;
}

const StandingRow* StandingsTable::Find(const std::string& player_id) const {
    for (const auto& row : rows_) {
        if (row.player_id == player_id) {
            return &row;
        }
    }
    return nullptr;
}

}  // namespace gambit::core::stats
