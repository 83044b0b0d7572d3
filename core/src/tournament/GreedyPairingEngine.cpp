#include "gambit/core/tournament/GreedyPairingEngine.h"

#include "gambit/core/tournament/SwissRules.h"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <vector>

namespace gambit::core::tournament {

namespace {

struct PlayerEntry {
    const model::Player* player = nullptr;
    int seed = 0;
    double buchholz = 0.0;
};

double BuchholzOf(const model::Player& player, const registry::PlayerRegistry& registry) {
    double buchholz = 0.0;
    for (const auto& record : player.history) {
        if (!record.opponent_id) {
            continue;
        }
        if (const auto* opponent = registry.Find(*record.opponent_id)) {
            buchholz += opponent->score;
        }
    }
    return buchholz;
}

}  // namespace

bool GreedyPairingEngine::PairRound(const registry::PlayerRegistry& registry,
                                    const TournamentConfig& config,
                                    int round_number,
                                    PairingResult& out,
                                    EngineError* error) const {
    out = PairingResult{};
    out.round_number = round_number;
    if (round_number < 1) {
        return Fail(error, ErrorKind::kInvalidArgument, "Round numbers start at 1");
    }

    std::vector<PlayerEntry> players;
    for (const auto* player : registry.ActivePlayers()) {
        players.push_back({player, registry.SeedOf(player->id), BuchholzOf(*player, registry)});
    }
    if (players.empty()) {
        return Fail(error, ErrorKind::kPairingInfeasible, "No active players to pair");
    }

    std::stable_sort(players.begin(), players.end(), [](const auto& a, const auto& b) {
        if (a.player->score != b.player->score) {
            return a.player->score > b.player->score;
        }
        if (a.buchholz != b.buchholz) {
            return a.buchholz > b.buchholz;
        }
        return a.seed < b.seed;
    });

    if (players.size() % 2 == 1) {
        for (auto it = players.rbegin(); it != players.rend(); ++it) {
            if (!it->player->has_received_bye()) {
                out.bye_player_id = it->player->id;
                players.erase(std::next(it).base());
                break;
            }
        }
        if (!out.bye_player_id) {
            return Fail(error, ErrorKind::kPairingInfeasible,
                        "Odd number of players and every player already had a bye");
        }
    }

    std::vector<std::vector<const model::Player*>> groups;
    for (const auto& entry : players) {
        if (groups.empty() || entry.player->score != groups.back().front()->score) {
            groups.emplace_back();
        }
        groups.back().push_back(entry.player);
    }

    std::vector<const model::Player*> carry;
    for (size_t group_index = 0; group_index < groups.size(); ++group_index) {
        std::vector<const model::Player*> list;
        list.reserve(carry.size() + groups[group_index].size());
        list.insert(list.end(), carry.begin(), carry.end());
        list.insert(list.end(), groups[group_index].begin(), groups[group_index].end());
        carry.clear();

        while (list.size() >= 2) {
            const auto* a = list.front();
            list.erase(list.begin());
            int opponent_index = -1;
            for (size_t i = 0; i < list.size(); ++i) {
                if (!a->HasPlayed(list[i]->id)) {
                    opponent_index = static_cast<int>(i);
                    break;
                }
            }
            if (opponent_index < 0) {
                carry.push_back(a);
                continue;
            }

            const auto* b = list[static_cast<size_t>(opponent_index)];
            list.erase(list.begin() + opponent_index);
            out.pairings.push_back(ChooseColors(*a, *b, config, round_number));
        }

        if (!list.empty()) {
            carry.push_back(list.front());
        }
    }

    if (!carry.empty()) {
        std::ostringstream message;
        message << "Greedy pass left " << carry.size() << " player(s) unpaired in round " << round_number;
        return Fail(error, ErrorKind::kPairingInfeasible, message.str());
    }

    OrderBoards(out.pairings, registry, config);
    AssignPairingIds(out);
    return true;
}

}  // namespace gambit::core::tournament
