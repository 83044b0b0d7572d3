#include "gambit/core/api/TournamentSession.h"

#include <algorithm>
#include <sstream>
#include <utility>

namespace gambit::core::api {

TournamentSession::TournamentSession(tournament::TournamentConfig config)
    : TournamentSession(std::move(config), model::FederationRegistry{}) {}

TournamentSession::TournamentSession(tournament::TournamentConfig config, model::FederationRegistry federations)
    : config_(std::move(config)),
      federations_(std::move(federations)),
      manager_(config_, [this](const std::string& line) { AppendLogLine(line); }) {}

bool TournamentSession::AddPlayer(model::Player player, EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!manager_.rounds().empty()) {
        return Fail(error, ErrorKind::kInvalidArgument, "Registration is closed once round 1 is paired");
    }
    const std::string id = player.id;
    const bool added = player.federation ? registry_.AddPlayer(std::move(player), federations_, error)
                                         : registry_.AddPlayer(std::move(player), error);
    if (added) {
        AppendLogLine("[gambit] Registered " + id);
    }
    return added;
}

bool TournamentSession::WithdrawPlayer(const std::string& player_id, EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!registry_.SetActive(player_id, false, error)) {
        return false;
    }
    AppendLogLine("[gambit] Withdrew " + player_id);
    return true;
}

bool TournamentSession::PairNextRound(tournament::PairingResult& out, EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    EngineError pairing_error;
    if (!manager_.PairNextRound(registry_, out, &pairing_error)) {
        AppendLogLine("[gambit] Pairing failed: " + Describe(pairing_error));
        return Fail(error, pairing_error.kind, pairing_error.message);
    }
    return true;
}

bool TournamentSession::SetManualPairings(tournament::PairingResult pairing, EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!manager_.SetManualPairings(registry_, std::move(pairing), error)) {
        return false;
    }
    AppendLogLine("[gambit] Round " + std::to_string(manager_.LastRound()->round_number) + ": manual pairings set");
    return true;
}

bool TournamentSession::RecordResults(const std::vector<tournament::MatchResult>& results, EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto* round = manager_.LastRound();
    if (!round || manager_.IsRoundCompleted(round->round_number)) {
        return Fail(error, ErrorKind::kInvalidArgument, "No open round to record results for");
    }
    if (!recorder_.ApplyResults(registry_, *round, results, config_, error)) {
        return false;
    }
    if (!manager_.MarkRoundCompleted(round->round_number, error)) {
        return false;
    }
    std::ostringstream line;
    line << "[gambit] Round " << round->round_number << ": recorded " << results.size() << " results";
    AppendLogLine(line.str());
    return true;
}

bool TournamentSession::UndoLastPairing(EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!manager_.UndoLastRound(error)) {
        return false;
    }
    AppendLogLine("[gambit] Discarded pairing of round " + std::to_string(manager_.next_round_number()));
    return true;
}

bool TournamentSession::UndoLastResults(EngineError* error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto* round = manager_.LastRound();
    if (!round || !manager_.IsRoundCompleted(round->round_number)) {
        return Fail(error, ErrorKind::kInvalidArgument, "No recorded round to undo");
    }
    const int round_number = round->round_number;
    if (!recorder_.UndoLastRound(registry_, round_number, error)) {
        return false;
    }
    if (!manager_.ReopenLastRound(error)) {
        return false;
    }
    AppendLogLine("[gambit] Withdrew results of round " + std::to_string(round_number));
    return true;
}

stats::StandingsTable TournamentSession::Standings() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats::StandingsTable::Build(registry_, config_);
}

registry::PlayerRegistry TournamentSession::RegistrySnapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.Snapshot();
}

std::vector<tournament::PairingResult> TournamentSession::Rounds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return manager_.rounds();
}

int TournamentSession::CompletedRounds() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return registry_.CompletedRounds();
}

std::string TournamentSession::GetLastLogLines(int n) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    const int start = std::max(0, static_cast<int>(log_lines_.size()) - n);
    std::ostringstream output;
    for (size_t i = static_cast<size_t>(start); i < log_lines_.size(); ++i) {
        output << log_lines_[i];
        if (i + 1 < log_lines_.size()) {
            output << '\n';
        }
    }
    return output.str();
}

void TournamentSession::AppendLogLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (log_lines_.size() >= max_log_lines_) {
        log_lines_.pop_front();
    }
    log_lines_.push_back(line);
}

}  // namespace gambit::core::api
