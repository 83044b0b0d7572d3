#pragma once

#include "gambit/core/tournament/PairingEngine.h"

#include <string>

namespace gambit::core::tournament {

// Single pass top-down Swiss: players sorted by score and Buchholz, each one
// takes the first opponent it has not met, unpairable players are carried
// into the next score group. Used as the reference engine in comparisons.
class GreedyPairingEngine final : public IPairingEngine {
public:
    std::string name() const override { return "reference"; }

    bool PairRound(const registry::PlayerRegistry& registry,
                   const TournamentConfig& config,
                   int round_number,
                   PairingResult& out,
                   EngineError* error) const override;
};

}  // namespace gambit::core::tournament
