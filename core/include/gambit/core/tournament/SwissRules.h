#pragma once

#include "gambit/core/model/Player.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <vector>

namespace gambit::core::tournament {

// Active players ordered by score, then rating (when rating seeding is on),
// then registration order.
std::vector<const model::Player*> RankPlayers(const registry::PlayerRegistry& registry,
                                              const TournamentConfig& config);

// False when both players are due the same colour absolutely.
bool ColorsCompatible(const model::Player& a, const model::Player& b);

// `higher` must be the better ranked of the two.
Pairing ChooseColors(const model::Player& higher,
                     const model::Player& lower,
                     const TournamentConfig& config,
                     int round_number);

// Sorts boards by the higher score on the board, then by the better seed.
void OrderBoards(std::vector<Pairing>& pairings,
                 const registry::PlayerRegistry& registry,
                 const TournamentConfig& config);

void AssignPairingIds(PairingResult& result);

}  // namespace gambit::core::tournament
