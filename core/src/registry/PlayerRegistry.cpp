#include "gambit/core/registry/PlayerRegistry.h"

#include <algorithm>
#include <utility>

namespace gambit::core::registry {

bool PlayerRegistry::AddPlayer(model::Player player, EngineError* error) {
    if (player.id.empty()) {
        return Fail(error, ErrorKind::kInvalidArgument, "Player id must not be empty");
    }
    if (index_.count(player.id) != 0) {
        return Fail(error, ErrorKind::kDuplicatePlayer, "Player '" + player.id + "' already registered");
    }
    if (!player.history.empty() && player.SumOfRecordedPoints() != player.score) {
        return Fail(error, ErrorKind::kInvalidArgument, "Score of '" + player.id + "' does not match its history");
    }
    index_.emplace(player.id, players_.size());
    players_.push_back(std::move(player));
    return true;
}

bool PlayerRegistry::AddPlayer(model::Player player,
                               const model::FederationRegistry& federations,
                               EngineError* error) {
    if (player.federation.has_value()) {
        model::Federation federation;
        if (!federations.Lookup(player.federation->federation_code, federation, error)) {
            return false;
        }
        player.federation->federation_code = federation.code;
        if (!player.rating.has_value()) {
            if (player.federation->standard_rating) {
                player.rating = player.federation->standard_rating;
            } else if (player.federation->rapid_rating) {
                player.rating = player.federation->rapid_rating;
            }
        }
    }
    return AddPlayer(std::move(player), error);
}

bool PlayerRegistry::SetActive(const std::string& player_id, bool active, EngineError* error) {
    auto* player = FindMutable(player_id);
    if (!player) {
        return Fail(error, ErrorKind::kUnknownPlayer, "Unknown player: " + player_id);
    }
    player->active = active;
    return true;
}

const model::Player* PlayerRegistry::Find(const std::string& player_id) const {
    const auto it = index_.find(player_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &players_[it->second];
}

model::Player* PlayerRegistry::FindMutable(const std::string& player_id) {
    const auto it = index_.find(player_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &players_[it->second];
}

std::vector<const model::Player*> PlayerRegistry::ActivePlayers() const {
    std::vector<const model::Player*> active;
    active.reserve(players_.size());
    for (const auto& player : players_) {
        if (player.active) {
            active.push_back(&player);
        }
    }
    return active;
}

int PlayerRegistry::SeedOf(const std::string& player_id) const {
    const auto it = index_.find(player_id);
    return it == index_.end() ? -1 : static_cast<int>(it->second);
}

int PlayerRegistry::CompletedRounds() const {
    int rounds = 0;
    for (const auto& player : players_) {
        rounds = std::max(rounds, player.rounds_completed());
    }
    return rounds;
}

bool PlayerRegistry::HavePlayed(const std::string& a, const std::string& b) const {
    const auto* player = Find(a);
    return player != nullptr && player->HasPlayed(b);
}

}  // namespace gambit::core::registry
