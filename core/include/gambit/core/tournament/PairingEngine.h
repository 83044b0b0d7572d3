#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <string>

namespace gambit::core::tournament {

class IPairingEngine {
public:
    virtual ~IPairingEngine() = default;

    virtual std::string name() const = 0;

    // Pairs `round_number` (1-based) from a read-only registry. Returns false
    // with kPairingInfeasible when no rule-compliant pairing exists.
    virtual bool PairRound(const registry::PlayerRegistry& registry,
                           const TournamentConfig& config,
                           int round_number,
                           PairingResult& out,
                           EngineError* error) const = 0;
};

}  // namespace gambit::core::tournament
