#include "gambit/core/tournament/SwissRules.h"

#include <algorithm>
#include <map>
#include <string>

namespace gambit::core::tournament {

namespace {

int ColorPenalty(const model::ColorPreference& preference, model::Color color) {
    if (preference.color == model::Color::kNone || preference.color == color) {
        return 0;
    }
    switch (preference.strength) {
        case model::PreferenceStrength::kAbsolute:
            return 100;
        case model::PreferenceStrength::kStrong:
            return 10;
        case model::PreferenceStrength::kMild:
            return 1;
        case model::PreferenceStrength::kNone:
            break;
    }
    return 0;
}

Pairing Oriented(const model::Player& higher, const model::Player& lower, bool higher_is_white) {
    if (higher_is_white) {
        return {higher.id, lower.id};
    }
    return {lower.id, higher.id};
}

// Walks both colour histories backwards from the latest round and returns
// the colour `higher` should get so that both alternate relative to the most
// recent round in which they had different colours.
model::Color AlternateFromHistory(const model::Player& higher, const model::Player& lower) {
    std::vector<model::Color> higher_colors;
    std::vector<model::Color> lower_colors;
    for (const auto& record : higher.history) {
        if (record.color != model::Color::kNone) {
            higher_colors.push_back(record.color);
        }
    }
    for (const auto& record : lower.history) {
        if (record.color != model::Color::kNone) {
            lower_colors.push_back(record.color);
        }
    }
    auto h = higher_colors.rbegin();
    auto l = lower_colors.rbegin();
    for (; h != higher_colors.rend() && l != lower_colors.rend(); ++h, ++l) {
        if (*h != *l) {
            return model::Opposite(*h);
        }
    }
    return model::Color::kNone;
}

}  // namespace

std::vector<const model::Player*> RankPlayers(const registry::PlayerRegistry& registry,
                                              const TournamentConfig& config) {
    auto ranked = registry.ActivePlayers();
    std::stable_sort(ranked.begin(), ranked.end(), [&](const model::Player* a, const model::Player* b) {
        if (a->score != b->score) {
            return a->score > b->score;
        }
        if (config.rating_seeding && a->rating_or_zero() != b->rating_or_zero()) {
            return a->rating_or_zero() > b->rating_or_zero();
        }
        return registry.SeedOf(a->id) < registry.SeedOf(b->id);
    });
    return ranked;
}

bool ColorsCompatible(const model::Player& a, const model::Player& b) {
    const auto pa = a.GetColorPreference();
    const auto pb = b.GetColorPreference();
    return !(pa.strength == model::PreferenceStrength::kAbsolute &&
             pb.strength == model::PreferenceStrength::kAbsolute && pa.color == pb.color);
}

Pairing ChooseColors(const model::Player& higher,
                     const model::Player& lower,
                     const TournamentConfig& config,
                     int round_number) {
    const auto higher_pref = higher.GetColorPreference();
    const auto lower_pref = lower.GetColorPreference();

    const int option_white = ColorPenalty(higher_pref, model::Color::kWhite) +
                             ColorPenalty(lower_pref, model::Color::kBlack);
    const int option_black = ColorPenalty(higher_pref, model::Color::kBlack) +
                             ColorPenalty(lower_pref, model::Color::kWhite);

    if (option_white < option_black) {
        return Oriented(higher, lower, true);
    }
    if (option_black < option_white) {
        return Oriented(higher, lower, false);
    }

    if (higher_pref.color != model::Color::kNone && lower_pref.color != model::Color::kNone) {
        const auto alternated = AlternateFromHistory(higher, lower);
        if (alternated != model::Color::kNone) {
            return Oriented(higher, lower, alternated == model::Color::kWhite);
        }
    }
    if (higher_pref.color != model::Color::kNone) {
        return Oriented(higher, lower, higher_pref.color == model::Color::kWhite);
    }
    if (lower_pref.color != model::Color::kNone) {
        return Oriented(higher, lower, lower_pref.color == model::Color::kBlack);
    }

    if (config.color_policy == ColorPolicy::kWhiteToHigherRanked) {
        return Oriented(higher, lower, true);
    }
    return Oriented(higher, lower, round_number % 2 == 1);
}

void OrderBoards(std::vector<Pairing>& pairings,
                 const registry::PlayerRegistry& registry,
                 const TournamentConfig& config) {
    const auto ranked = RankPlayers(registry, config);
    std::map<std::string, int> rank_of;
    for (size_t i = 0; i < ranked.size(); ++i) {
        rank_of[ranked[i]->id] = static_cast<int>(i);
    }
    auto score_of = [&](const std::string& id) {
        const auto* player = registry.Find(id);
        return player ? player->score : 0.0;
    };
    auto rank_lookup = [&](const std::string& id) {
        const auto it = rank_of.find(id);
        return it == rank_of.end() ? static_cast<int>(ranked.size()) : it->second;
    };

    std::stable_sort(pairings.begin(), pairings.end(), [&](const Pairing& a, const Pairing& b) {
        const double a_top = std::max(score_of(a.white_id), score_of(a.black_id));
        const double b_top = std::max(score_of(b.white_id), score_of(b.black_id));
        if (a_top != b_top) {
            return a_top > b_top;
        }
        const int a_rank = std::min(rank_lookup(a.white_id), rank_lookup(a.black_id));
        const int b_rank = std::min(rank_lookup(b.white_id), rank_lookup(b.black_id));
        return a_rank < b_rank;
    });
}

void AssignPairingIds(PairingResult& result) {
    result.pairing_ids.clear();
    result.pairing_ids.reserve(result.pairings.size());
    for (const auto& pairing : result.pairings) {
        result.pairing_ids.push_back(PairingIdFor(result.round_number, pairing.white_id, pairing.black_id));
    }
}

}  // namespace gambit::core::tournament
