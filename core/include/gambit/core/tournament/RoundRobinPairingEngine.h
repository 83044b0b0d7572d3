#pragma once

#include "gambit/core/tournament/PairingEngine.h"

#include <string>

namespace gambit::core::tournament {

// Berger circle schedule over every registered player in registration order.
// An odd field gets a dummy slot. Players whose scheduled opponent is the
// dummy, withdrawn, or already met this cycle are paired among themselves
// without rematches; one of them may take the bye. Rounds past the first
// cycle repeat the schedule with colours reversed.
class RoundRobinPairingEngine final : public IPairingEngine {
public:
    std::string name() const override { return "round_robin"; }

    bool PairRound(const registry::PlayerRegistry& registry,
                   const TournamentConfig& config,
                   int round_number,
                   PairingResult& out,
                   EngineError* error) const override;
};

}  // namespace gambit::core::tournament
