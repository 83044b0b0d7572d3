#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/PairingEngine.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gambit::core::tournament {

using PairingLogFn = std::function<void(const std::string&)>;

// Engine for the configured pairing system.
std::unique_ptr<IPairingEngine> MakePairingEngine(PairingSystem system, PairingLogFn log_fn = {});

// Engine by name: "gambit" (Swiss search), "reference" (greedy Swiss) or
// "round_robin". Returns nullptr for an unknown name.
std::unique_ptr<IPairingEngine> MakePairingEngine(const std::string& name, PairingLogFn log_fn = {});

// Generates rounds in sequence and keeps the round log. A round stays open
// until its results are recorded; only the last open round can be undone.
class RoundManager {
public:
    explicit RoundManager(TournamentConfig config, PairingLogFn log_fn = {});
    RoundManager(TournamentConfig config, std::unique_ptr<IPairingEngine> engine);

    bool PairRound(const registry::PlayerRegistry& registry,
                   int round_number,
                   PairingResult& out,
                   EngineError* error);
    bool PairNextRound(const registry::PlayerRegistry& registry, PairingResult& out, EngineError* error);
    // Records an arbiter's pairing of the next round in place of the engine's.
    // Every active player must appear once, on a board or as the bye, and no
    // board may repeat an earlier game.
    bool SetManualPairings(const registry::PlayerRegistry& registry, PairingResult pairing, EngineError* error);

    bool UndoLastRound(EngineError* error);
    bool MarkRoundCompleted(int round_number, EngineError* error);
    // Turns the last completed round back into an open one after its results
    // were withdrawn.
    bool ReopenLastRound(EngineError* error);

    const std::vector<PairingResult>& rounds() const { return rounds_; }
    const PairingResult* LastRound() const;
    bool IsRoundCompleted(int round_number) const;
    int next_round_number() const { return static_cast<int>(rounds_.size()) + 1; }

    const TournamentConfig& config() const { return config_; }
    const IPairingEngine& engine() const { return *engine_; }

private:
    bool CheckCanPair(const registry::PlayerRegistry& registry, int round_number, EngineError* error) const;

    TournamentConfig config_;
    std::unique_ptr<IPairingEngine> engine_;
    std::vector<PairingResult> rounds_;
    std::vector<bool> completed_;
};

}  // namespace gambit::core::tournament
