#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <vector>

namespace gambit::core::tournament {

// The only writer of player history. A round is applied all-or-nothing: the
// update is built on a copy of the registry and swapped in once every result
// has been validated.
class ResultRecorder {
public:
    bool ApplyResults(registry::PlayerRegistry& registry,
                      const PairingResult& round,
                      const std::vector<MatchResult>& results,
                      const TournamentConfig& config,
                      EngineError* error) const;

    // Removes `round_number` from every player whose history ends with it.
    bool UndoLastRound(registry::PlayerRegistry& registry, int round_number, EngineError* error) const;
};

bool IsValidScore(double score);

}  // namespace gambit::core::tournament
