#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/model/Federation.h"
#include "gambit/core/model/Player.h"

#include <map>
#include <string>
#include <vector>

namespace gambit::core::tournament {
class ResultRecorder;
}

namespace gambit::core::registry {

// Players in registration order plus their accumulated tournament state.
// Copying a registry produces an independent snapshot; pairing engines only
// ever see a const reference. Player history is written exclusively by
// tournament::ResultRecorder.
class PlayerRegistry {
public:
    PlayerRegistry() = default;

    bool AddPlayer(model::Player player, EngineError* error);
    // Also validates the player's federation profile against `federations`.
    bool AddPlayer(model::Player player, const model::FederationRegistry& federations, EngineError* error);
    bool SetActive(const std::string& player_id, bool active, EngineError* error);

    const model::Player* Find(const std::string& player_id) const;
    const std::vector<model::Player>& players() const { return players_; }
    std::vector<const model::Player*> ActivePlayers() const;
    size_t size() const { return players_.size(); }
    bool empty() const { return players_.empty(); }

    // Registration order, used as the last seeding key.
    int SeedOf(const std::string& player_id) const;
    int CompletedRounds() const;
    bool HavePlayed(const std::string& a, const std::string& b) const;

    PlayerRegistry Snapshot() const { return *this; }

private:
    friend class gambit::core::tournament::ResultRecorder;

    model::Player* FindMutable(const std::string& player_id);

    std::vector<model::Player> players_;
    std::map<std::string, size_t> index_;
};

}  // namespace gambit::core::registry
