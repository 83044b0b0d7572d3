#include "gambit/core/tournament/RoundManager.h"

#include "gambit/core/tournament/GreedyPairingEngine.h"
#include "gambit/core/tournament/RoundRobinPairingEngine.h"
#include "gambit/core/tournament/SwissPairingEngine.h"
#include "gambit/core/tournament/SwissRules.h"

#include <set>
#include <sstream>
#include <utility>

namespace gambit::core::tournament {

std::unique_ptr<IPairingEngine> MakePairingEngine(PairingSystem system, PairingLogFn log_fn) {
    if (system == PairingSystem::kRoundRobin) {
        return std::make_unique<RoundRobinPairingEngine>();
    }
    return std::make_unique<SwissPairingEngine>(std::move(log_fn));
}

std::unique_ptr<IPairingEngine> MakePairingEngine(const std::string& name, PairingLogFn log_fn) {
    if (name == "gambit") {
        return std::make_unique<SwissPairingEngine>(std::move(log_fn));
    }
    if (name == "reference") {
        return std::make_unique<GreedyPairingEngine>();
    }
    if (name == "round_robin") {
        return std::make_unique<RoundRobinPairingEngine>();
    }
    return nullptr;
}

RoundManager::RoundManager(TournamentConfig config, PairingLogFn log_fn)
    : config_(std::move(config)),
      engine_(MakePairingEngine(config_.pairing_system, std::move(log_fn))) {}

RoundManager::RoundManager(TournamentConfig config, std::unique_ptr<IPairingEngine> engine)
    : config_(std::move(config)), engine_(std::move(engine)) {}

bool RoundManager::CheckCanPair(const registry::PlayerRegistry& registry,
                                int round_number,
                                EngineError* error) const {
    if (round_number < 1 || round_number > config_.total_rounds) {
        std::ostringstream message;
        message << "Round " << round_number << " is outside 1.." << config_.total_rounds;
        return Fail(error, ErrorKind::kInvalidArgument, message.str());
    }
    if (round_number != next_round_number()) {
        std::ostringstream message;
        message << "Round " << round_number << " requested but the next round is " << next_round_number();
        return Fail(error, ErrorKind::kInvalidArgument, message.str());
    }
    if (!completed_.empty() && !completed_.back()) {
        return Fail(error, ErrorKind::kInvalidArgument,
                    "Round " + std::to_string(rounds_.size()) + " still has no results");
    }
    if (registry.CompletedRounds() != round_number - 1) {
        return Fail(error, ErrorKind::kInvalidArgument,
                    "Player histories do not end at round " + std::to_string(round_number - 1));
    }
    return true;
}

bool RoundManager::PairRound(const registry::PlayerRegistry& registry,
                             int round_number,
                             PairingResult& out,
                             EngineError* error) {
    if (!CheckCanPair(registry, round_number, error)) {
        return false;
    }

    PairingResult result;
    if (!engine_->PairRound(registry, config_, round_number, result, error)) {
        return false;
    }
    rounds_.push_back(result);
    completed_.push_back(false);
    out = std::move(result);
    return true;
}

bool RoundManager::PairNextRound(const registry::PlayerRegistry& registry,
                                 PairingResult& out,
                                 EngineError* error) {
    return PairRound(registry, next_round_number(), out, error);
}

bool RoundManager::SetManualPairings(const registry::PlayerRegistry& registry,
                                     PairingResult pairing,
                                     EngineError* error) {
    const int round_number = next_round_number();
    if (!CheckCanPair(registry, round_number, error)) {
        return false;
    }

    const std::string prefix = "Round " + std::to_string(round_number) + ": ";
    std::set<std::string> seated;
    auto seat = [&](const std::string& id) {
        const auto* player = registry.Find(id);
        if (!player) {
            return Fail(error, ErrorKind::kUnknownPlayer, prefix + "unknown player " + id);
        }
        if (!player->active) {
            return Fail(error, ErrorKind::kInvalidArgument, prefix + id + " has withdrawn");
        }
        if (!seated.insert(id).second) {
            return Fail(error, ErrorKind::kInvalidArgument, prefix + id + " appears more than once");
        }
        return true;
    };

    for (const auto& board : pairing.pairings) {
        if (board.white_id == board.black_id) {
            return Fail(error, ErrorKind::kInvalidArgument, prefix + board.white_id + " is paired with itself");
        }
        if (!seat(board.white_id) || !seat(board.black_id)) {
            return false;
        }
        if (registry.HavePlayed(board.white_id, board.black_id)) {
            return Fail(error, ErrorKind::kInvalidArgument,
                        prefix + board.white_id + " and " + board.black_id + " have already played");
        }
    }
    if (pairing.bye_player_id && !seat(*pairing.bye_player_id)) {
        return false;
    }
    for (const auto* player : registry.ActivePlayers()) {
        if (seated.count(player->id) == 0) {
            return Fail(error, ErrorKind::kInvalidArgument, prefix + player->id + " is not paired");
        }
    }

    pairing.round_number = round_number;
    AssignPairingIds(pairing);
    rounds_.push_back(std::move(pairing));
    completed_.push_back(false);
    return true;
}

bool RoundManager::UndoLastRound(EngineError* error) {
    if (rounds_.empty()) {
        return Fail(error, ErrorKind::kInvalidArgument, "No round to undo");
    }
    if (completed_.back()) {
        return Fail(error, ErrorKind::kInvalidArgument,
                    "Round " + std::to_string(rounds_.size()) + " already has results");
    }
    rounds_.pop_back();
    completed_.pop_back();
    return true;
}

bool RoundManager::MarkRoundCompleted(int round_number, EngineError* error) {
    if (round_number < 1 || round_number > static_cast<int>(rounds_.size())) {
        return Fail(error, ErrorKind::kInvalidArgument, "Unknown round " + std::to_string(round_number));
    }
    completed_[static_cast<size_t>(round_number - 1)] = true;
    return true;
}

bool RoundManager::ReopenLastRound(EngineError* error) {
    if (rounds_.empty() || !completed_.back()) {
        return Fail(error, ErrorKind::kInvalidArgument, "No completed round to reopen");
    }
    completed_.back() = false;
    return true;
}

const PairingResult* RoundManager::LastRound() const {
    return rounds_.empty() ? nullptr : &rounds_.back();
}

bool RoundManager::IsRoundCompleted(int round_number) const {
    if (round_number < 1 || round_number > static_cast<int>(completed_.size())) {
        return false;
    }
    return completed_[static_cast<size_t>(round_number - 1)];
}

}  // namespace gambit::core::tournament
