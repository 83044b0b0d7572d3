#include "gambit/core/tournament/RoundRobinPairingEngine.h"

#include "gambit/core/tournament/SwissRules.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace gambit::core::tournament {

namespace {

std::vector<int> BuildTeamList(int player_count) {
    std::vector<int> teams;
    teams.reserve(static_cast<size_t>(player_count + 1));
    for (int i = 0; i < player_count; ++i) {
        teams.push_back(i);
    }
    if (player_count % 2 == 1) {
        teams.push_back(-1);
    }
    return teams;
}

void RotateTeams(std::vector<int>& teams) {
    if (teams.size() <= 2) {
        return;
    }
    const int fixed = teams.front();
    const int last = teams.back();
    for (size_t i = teams.size() - 1; i > 1; --i) {
        teams[i] = teams[i - 1];
    }
    teams[1] = last;
    teams[0] = fixed;
}

int MeetingCount(const model::Player& player, const std::string& opponent_id) {
    int count = 0;
    for (const auto& record : player.history) {
        if (record.opponent_id && *record.opponent_id == opponent_id) {
            ++count;
        }
    }
    return count;
}

// Pairs players whose scheduled opponent is gone or already met this cycle.
bool PairUnseated(std::vector<const model::Player*> unseated,
                  int cycle,
                  std::vector<std::pair<const model::Player*, const model::Player*>>& pairs) {
    if (unseated.empty()) {
        return true;
    }
    const auto* first = unseated.front();
    for (size_t j = 1; j < unseated.size(); ++j) {
        const auto* partner = unseated[j];
        if (MeetingCount(*first, partner->id) > cycle) {
            continue;
        }
        auto rest = unseated;
        rest.erase(rest.begin() + static_cast<std::ptrdiff_t>(j));
        rest.erase(rest.begin());
        pairs.emplace_back(first, partner);
        if (PairUnseated(std::move(rest), cycle, pairs)) {
            return true;
        }
        pairs.pop_back();
    }
    return false;
}

}  // namespace

bool RoundRobinPairingEngine::PairRound(const registry::PlayerRegistry& registry,
                                        const TournamentConfig& config,
                                        int round_number,
                                        PairingResult& out,
                                        EngineError* error) const {
    out = PairingResult{};
    out.round_number = round_number;
    if (round_number < 1) {
        return Fail(error, ErrorKind::kInvalidArgument, "Round numbers start at 1");
    }
    if (registry.ActivePlayers().size() < 2) {
        return Fail(error, ErrorKind::kPairingInfeasible, "Round robin needs at least two active players");
    }

    // Withdrawn players keep their slot so the rotation never shifts.
    const auto& players = registry.players();
    auto teams = BuildTeamList(static_cast<int>(players.size()));
    const int team_count = static_cast<int>(teams.size());
    const int rounds_per_cycle = team_count - 1;
    const int round_index = (round_number - 1) % rounds_per_cycle;
    const int cycle = (round_number - 1) / rounds_per_cycle;
    const bool reversed_cycle = cycle % 2 == 1;

    for (int r = 0; r < round_index; ++r) {
        RotateTeams(teams);
    }

    std::vector<const model::Player*> unseated;
    for (int i = 0; i < team_count / 2; ++i) {
        const int t1 = teams[static_cast<size_t>(i)];
        const int t2 = teams[static_cast<size_t>(team_count - 1 - i)];
        const model::Player* first = t1 == -1 ? nullptr : &players[static_cast<size_t>(t1)];
        const model::Player* second = t2 == -1 ? nullptr : &players[static_cast<size_t>(t2)];
        const bool first_active = first != nullptr && first->active;
        const bool second_active = second != nullptr && second->active;
        if (!first_active || !second_active || MeetingCount(*first, second->id) > cycle) {
            if (first_active) {
                unseated.push_back(first);
            }
            if (second_active) {
                unseated.push_back(second);
            }
            continue;
        }

        bool swap_colors = (round_index % 2 == 1);
        if (i == 0) {
            swap_colors = !swap_colors;
        }
        if (reversed_cycle) {
            swap_colors = !swap_colors;
        }
        const auto* white = swap_colors ? second : first;
        const auto* black = swap_colors ? first : second;
        out.pairings.push_back({white->id, black->id});
    }

    std::sort(unseated.begin(), unseated.end(), [&registry](const model::Player* a, const model::Player* b) {
        return registry.SeedOf(a->id) < registry.SeedOf(b->id);
    });

    std::vector<const model::Player*> bye_candidates;
    if (unseated.size() % 2 == 1) {
        bye_candidates = unseated;
        std::stable_sort(bye_candidates.begin(), bye_candidates.end(),
                         [&registry](const model::Player* a, const model::Player* b) {
                             if (a->bye_count != b->bye_count) {
                                 return a->bye_count < b->bye_count;
                             }
                             return registry.SeedOf(a->id) > registry.SeedOf(b->id);
                         });
    } else {
        bye_candidates.push_back(nullptr);
    }

    std::vector<std::pair<const model::Player*, const model::Player*>> extra;
    bool seated = false;
    for (const auto* candidate : bye_candidates) {
        std::vector<const model::Player*> rest;
        for (const auto* player : unseated) {
            if (player != candidate) {
                rest.push_back(player);
            }
        }
        extra.clear();
        if (PairUnseated(std::move(rest), cycle, extra)) {
            if (candidate != nullptr) {
                out.bye_player_id = candidate->id;
            }
            seated = true;
            break;
        }
    }
    if (!seated) {
        out = PairingResult{};
        out.round_number = round_number;
        return Fail(error, ErrorKind::kPairingInfeasible,
                    "Round " + std::to_string(round_number) +
                        ": remaining round robin games cannot seat every active player without a rematch");
    }
    for (const auto& pair : extra) {
        out.pairings.push_back(ChooseColors(*pair.first, *pair.second, config, round_number));
    }

    OrderBoards(out.pairings, registry, config);
    AssignPairingIds(out);
    return true;
}

}  // namespace gambit::core::tournament
