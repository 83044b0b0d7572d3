#include "gambit/core/tournament/ResultRecorder.h"

#include <map>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace gambit::core::tournament {

namespace {

std::string BoardLabel(const std::string& white_id, const std::string& black_id) {
    return white_id + " - " + black_id;
}

bool CheckNextRound(const model::Player* player,
                    const std::string& player_id,
                    int round_number,
                    EngineError* error) {
    if (!player) {
        return Fail(error, ErrorKind::kUnknownPlayer, "Unknown player: " + player_id);
    }
    if (player->rounds_completed() != round_number - 1) {
        std::ostringstream message;
        message << "Round " << round_number << " is not the next round for " << player_id << " ("
                << player->rounds_completed() << " rounds recorded)";
        return Fail(error, ErrorKind::kInvalidArgument, message.str());
    }
    return true;
}

}  // namespace

bool IsValidScore(double score) {
    return score == 0.0 || score == 0.5 || score == 1.0;
}

bool ResultRecorder::ApplyResults(registry::PlayerRegistry& registry,
                                  const PairingResult& round,
                                  const std::vector<MatchResult>& results,
                                  const TournamentConfig& config,
                                  EngineError* error) const {
    if (round.round_number < 1) {
        return Fail(error, ErrorKind::kInvalidArgument, "Round numbers start at 1");
    }

    std::map<std::pair<std::string, std::string>, size_t> boards;
    std::set<std::string> participants;
    for (size_t i = 0; i < round.pairings.size(); ++i) {
        const auto& pairing = round.pairings[i];
        if (!participants.insert(pairing.white_id).second || !participants.insert(pairing.black_id).second) {
            return Fail(error, ErrorKind::kResultMismatch,
                        "Player appears twice in round " + std::to_string(round.round_number));
        }
        boards.emplace(std::make_pair(pairing.white_id, pairing.black_id), i);
    }
    if (round.bye_player_id && !participants.insert(*round.bye_player_id).second) {
        return Fail(error, ErrorKind::kResultMismatch, "Bye player " + *round.bye_player_id + " is also paired");
    }

    std::vector<const MatchResult*> by_board(round.pairings.size(), nullptr);
    for (const auto& result : results) {
        const auto it = boards.find({result.white_id, result.black_id});
        if (it == boards.end()) {
            if (boards.count({result.black_id, result.white_id}) != 0) {
                return Fail(error, ErrorKind::kResultMismatch,
                            "Colours reversed in result " + BoardLabel(result.white_id, result.black_id));
            }
            return Fail(error, ErrorKind::kResultMismatch,
                        "No board " + BoardLabel(result.white_id, result.black_id) + " in round " +
                            std::to_string(round.round_number));
        }
        if (by_board[it->second] != nullptr) {
            return Fail(error, ErrorKind::kResultMismatch,
                        "Duplicate result for " + BoardLabel(result.white_id, result.black_id));
        }
        if (!IsValidScore(result.white_score)) {
            std::ostringstream message;
            message << "Invalid score " << result.white_score << " for "
                    << BoardLabel(result.white_id, result.black_id);
            return Fail(error, ErrorKind::kInvalidResult, message.str());
        }
        by_board[it->second] = &result;
    }
    for (size_t i = 0; i < by_board.size(); ++i) {
        if (by_board[i] == nullptr) {
            return Fail(error, ErrorKind::kResultMismatch,
                        "Missing result for " + BoardLabel(round.pairings[i].white_id, round.pairings[i].black_id));
        }
    }

    for (const auto& id : participants) {
        if (!CheckNextRound(registry.Find(id), id, round.round_number, error)) {
            return false;
        }
    }

    registry::PlayerRegistry updated = registry.Snapshot();
    for (size_t i = 0; i < round.pairings.size(); ++i) {
        const auto& result = *by_board[i];
        auto* white = updated.FindMutable(result.white_id);
        auto* black = updated.FindMutable(result.black_id);
        white->history.push_back({round.round_number, result.black_id, model::Color::kWhite, result.white_score});
        white->score += result.white_score;
        black->history.push_back({round.round_number, result.white_id, model::Color::kBlack, result.black_score()});
        black->score += result.black_score();
    }
    if (round.bye_player_id) {
        auto* bye = updated.FindMutable(*round.bye_player_id);
        bye->history.push_back({round.round_number, std::nullopt, model::Color::kNone, config.bye_points});
        bye->score += config.bye_points;
        ++bye->bye_count;
    }

    registry = std::move(updated);
    return true;
}

bool ResultRecorder::UndoLastRound(registry::PlayerRegistry& registry,
                                   int round_number,
                                   EngineError* error) const {
    bool found = false;
    for (const auto& player : registry.players()) {
        if (player.history.empty()) {
            continue;
        }
        if (player.history.back().round > round_number) {
            return Fail(error, ErrorKind::kInvalidArgument,
                        "Round " + std::to_string(round_number) + " is not the latest round of " + player.id);
        }
        found = found || player.history.back().round == round_number;
    }
    if (!found) {
        return Fail(error, ErrorKind::kInvalidArgument, "No results recorded for round " + std::to_string(round_number));
    }

    registry::PlayerRegistry updated = registry.Snapshot();
    for (const auto& player : registry.players()) {
        if (player.history.empty() || player.history.back().round != round_number) {
            continue;
        }
        auto* target = updated.FindMutable(player.id);
        if (target->history.back().is_bye()) {
            --target->bye_count;
        }
        target->history.pop_back();
        target->score = target->SumOfRecordedPoints();
    }
    registry = std::move(updated);
    return true;
}

}  // namespace gambit::core::tournament
