#pragma once

#include "gambit/core/tournament/PairingEngine.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace gambit::core::tournament {

// Score-group Swiss pairing with downfloats and backtracking across groups.
class SwissPairingEngine final : public IPairingEngine {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit SwissPairingEngine(LogFn log_fn = {});

    std::string name() const override { return "gambit"; }

    bool PairRound(const registry::PlayerRegistry& registry,
                   const TournamentConfig& config,
                   int round_number,
                   PairingResult& out,
                   EngineError* error) const override;

private:
    bool PairParticipants(const std::vector<const model::Player*>& ranked,
                          const std::vector<int>& participants,
                          const TournamentConfig& config,
                          bool strict_colors,
                          std::vector<std::pair<int, int>>& pairs,
                          bool& budget_exhausted) const;

    LogFn log_fn_;
};

}  // namespace gambit::core::tournament
