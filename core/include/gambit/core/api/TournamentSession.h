#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/model/Federation.h"
#include "gambit/core/model/Player.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/stats/StandingsTable.h"
#include "gambit/core/tournament/ResultRecorder.h"
#include "gambit/core/tournament/RoundManager.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace gambit::core::api {

// One live tournament: registration, round generation, result entry and
// standings. All public calls are serialized on an internal mutex.
class TournamentSession {
public:
    explicit TournamentSession(tournament::TournamentConfig config);
    TournamentSession(tournament::TournamentConfig config, model::FederationRegistry federations);

    // Registration closes once the first round has been paired.
    bool AddPlayer(model::Player player, EngineError* error);
    bool WithdrawPlayer(const std::string& player_id, EngineError* error);

    bool PairNextRound(tournament::PairingResult& out, EngineError* error);
    bool SetManualPairings(tournament::PairingResult pairing, EngineError* error);
    bool RecordResults(const std::vector<tournament::MatchResult>& results, EngineError* error);
    bool UndoLastPairing(EngineError* error);
    bool UndoLastResults(EngineError* error);

    stats::StandingsTable Standings() const;
    registry::PlayerRegistry RegistrySnapshot() const;
    std::vector<tournament::PairingResult> Rounds() const;
    int CompletedRounds() const;
    const tournament::TournamentConfig& config() const { return config_; }

    std::string GetLastLogLines(int n) const;

private:
    void AppendLogLine(const std::string& line);

    const tournament::TournamentConfig config_;
    model::FederationRegistry federations_;

    mutable std::mutex state_mutex_;
    registry::PlayerRegistry registry_;
    tournament::RoundManager manager_;
    tournament::ResultRecorder recorder_;

    mutable std::mutex log_mutex_;
    std::deque<std::string> log_lines_;
    size_t max_log_lines_ = 2000;
};

}  // namespace gambit::core::api
