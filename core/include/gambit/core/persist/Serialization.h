#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/model/Player.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <nlohmann/json.hpp>

namespace gambit::core::persist {

// JSON records handed to an external persistence layer. Readers fill the
// target only when the whole node parsed; malformed nodes are kInvalidConfig.

nlohmann::json ToJson(const model::RoundRecord& record);
nlohmann::json ToJson(const model::Player& player);
nlohmann::json ToJson(const tournament::MatchResult& result);
nlohmann::json ToJson(const tournament::PairingResult& result);
nlohmann::json ToJson(const tournament::TournamentConfig& config);
nlohmann::json ToJson(const registry::PlayerRegistry& registry);

bool FromJson(const nlohmann::json& node, model::RoundRecord& record, EngineError* error);
bool FromJson(const nlohmann::json& node, model::Player& player, EngineError* error);
bool FromJson(const nlohmann::json& node, tournament::MatchResult& result, EngineError* error);
bool FromJson(const nlohmann::json& node, tournament::PairingResult& result, EngineError* error);
bool FromJson(const nlohmann::json& node, tournament::TournamentConfig& config, EngineError* error);
bool FromJson(const nlohmann::json& node, registry::PlayerRegistry& registry, EngineError* error);

}  // namespace gambit::core::persist
