#include "gambit/core/persist/Serialization.h"

#include <exception>
#include <string>
#include <utility>

namespace gambit::core::persist {

namespace {

model::Color ParseColor(const std::string& value) {
    if (value == "white") {
        return model::Color::kWhite;
    }
    if (value == "black") {
        return model::Color::kBlack;
    }
    return model::Color::kNone;
}

bool ParseFailure(EngineError* error, const char* what, const std::exception& ex) {
    return Fail(error, ErrorKind::kInvalidConfig, std::string("Malformed ") + what + ": " + ex.what());
}

}  // namespace

nlohmann::json ToJson(const model::RoundRecord& record) {
    nlohmann::json node;
    node["round"] = record.round;
    node["opponent_id"] = record.opponent_id ? nlohmann::json(*record.opponent_id) : nlohmann::json(nullptr);
    node["color"] = model::ColorName(record.color);
    node["points"] = record.points;
    return node;
}

nlohmann::json ToJson(const model::Player& player) {
    nlohmann::json node;
    node["id"] = player.id;
    node["name"] = player.name;
    node["rating"] = player.rating ? nlohmann::json(*player.rating) : nlohmann::json(nullptr);
    node["active"] = player.active;
    node["score"] = player.score;
    node["bye_count"] = player.bye_count;
    node["history"] = nlohmann::json::array();
    for (const auto& record : player.history) {
        node["history"].push_back(ToJson(record));
    }
    if (player.federation) {
        const auto& profile = *player.federation;
        auto optional_int = [](const std::optional<int>& value) {
            return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        };
        node["federation"] = {
            {"code", profile.federation_code},
            {"fide_id", profile.fide_id ? nlohmann::json(*profile.fide_id) : nlohmann::json(nullptr)},
            {"title", profile.title},
            {"standard_rating", optional_int(profile.standard_rating)},
            {"rapid_rating", optional_int(profile.rapid_rating)},
            {"blitz_rating", optional_int(profile.blitz_rating)},
        };
    }
    return node;
}

nlohmann::json ToJson(const tournament::MatchResult& result) {
    return {
        {"white_id", result.white_id},
        {"black_id", result.black_id},
        {"white_score", result.white_score},
        {"black_score", result.black_score()},
    };
}

nlohmann::json ToJson(const tournament::PairingResult& result) {
    nlohmann::json node;
    node["round_number"] = result.round_number;
    node["pairings"] = nlohmann::json::array();
    for (const auto& pairing : result.pairings) {
        node["pairings"].push_back({
            {"white_id", pairing.white_id},
            {"black_id", pairing.black_id},
        });
    }
    node["bye_player_id"] = result.bye_player_id ? nlohmann::json(*result.bye_player_id) : nlohmann::json(nullptr);
    node["pairing_ids"] = result.pairing_ids;
    return node;
}

nlohmann::json ToJson(const tournament::TournamentConfig& config) {
    nlohmann::json node;
    node["name"] = config.name;
    node["total_rounds"] = config.total_rounds;
    node["pairing_system"] = tournament::PairingSystemName(config.pairing_system);
    node["tiebreaks"] = nlohmann::json::array();
    for (const auto criterion : config.tiebreaks) {
        node["tiebreaks"].push_back(tournament::TiebreakName(criterion));
    }
    node["color_policy"] = tournament::ColorPolicyName(config.color_policy);
    node["rating_seeding"] = config.rating_seeding;
    node["bye_points"] = config.bye_points;
    node["bye_opponent_policy"] = tournament::ByeOpponentPolicyName(config.bye_opponent_policy);
    node["bye_opponent_value"] = config.bye_opponent_value;
    node["max_search_steps"] = config.max_search_steps;
    return node;
}

nlohmann::json ToJson(const registry::PlayerRegistry& registry) {
    nlohmann::json players = nlohmann::json::array();
    for (const auto& player : registry.players()) {
        players.push_back(ToJson(player));
    }
    return players;
}

bool FromJson(const nlohmann::json& node, model::RoundRecord& record, EngineError* error) {
    try {
        model::RoundRecord parsed;
        parsed.round = node.at("round").get<int>();
        if (node.contains("opponent_id") && !node.at("opponent_id").is_null()) {
            parsed.opponent_id = node.at("opponent_id").get<std::string>();
        }
        parsed.color = ParseColor(node.value("color", "none"));
        parsed.points = node.value("points", 0.0);
        record = std::move(parsed);
    } catch (const std::exception& ex) {
        return ParseFailure(error, "round record", ex);
    }
    return true;
}

bool FromJson(const nlohmann::json& node, model::Player& player, EngineError* error) {
    model::Player parsed;
    try {
        parsed.id = node.at("id").get<std::string>();
        parsed.name = node.value("name", "");
        if (node.contains("rating") && !node.at("rating").is_null()) {
            parsed.rating = node.at("rating").get<int>();
        }
        parsed.active = node.value("active", true);
        parsed.score = node.value("score", 0.0);
        parsed.bye_count = node.value("bye_count", 0);
        if (node.contains("federation") && node.at("federation").is_object()) {
            const auto& fed = node.at("federation");
            model::FederationProfile profile;
            profile.federation_code = fed.value("code", "");
            profile.title = fed.value("title", "");
            auto read_int = [&fed](const char* key) -> std::optional<int> {
                if (!fed.contains(key) || fed.at(key).is_null()) {
                    return std::nullopt;
                }
                return fed.at(key).get<int>();
            };
            if (fed.contains("fide_id") && !fed.at("fide_id").is_null()) {
                profile.fide_id = fed.at("fide_id").get<long long>();
            }
            profile.standard_rating = read_int("standard_rating");
            profile.rapid_rating = read_int("rapid_rating");
            profile.blitz_rating = read_int("blitz_rating");
            parsed.federation = std::move(profile);
        }
    } catch (const std::exception& ex) {
        return ParseFailure(error, "player", ex);
    }

    if (node.contains("history")) {
        for (const auto& entry : node.at("history")) {
            model::RoundRecord record;
            if (!FromJson(entry, record, error)) {
                return false;
            }
            parsed.history.push_back(std::move(record));
        }
    }
    player = std::move(parsed);
    return true;
}

bool FromJson(const nlohmann::json& node, tournament::MatchResult& result, EngineError* error) {
    try {
        tournament::MatchResult parsed;
        parsed.white_id = node.at("white_id").get<std::string>();
        parsed.black_id = node.at("black_id").get<std::string>();
        parsed.white_score = node.at("white_score").get<double>();
        result = std::move(parsed);
    } catch (const std::exception& ex) {
        return ParseFailure(error, "match result", ex);
    }
    return true;
}

bool FromJson(const nlohmann::json& node, tournament::PairingResult& result, EngineError* error) {
    try {
        tournament::PairingResult parsed;
        parsed.round_number = node.at("round_number").get<int>();
        for (const auto& entry : node.value("pairings", nlohmann::json::array())) {
            parsed.pairings.push_back({entry.at("white_id").get<std::string>(), entry.at("black_id").get<std::string>()});
        }
        if (node.contains("bye_player_id") && !node.at("bye_player_id").is_null()) {
            parsed.bye_player_id = node.at("bye_player_id").get<std::string>();
        }
        if (node.contains("pairing_ids")) {
            parsed.pairing_ids = node.at("pairing_ids").get<std::vector<std::string>>();
        }
        result = std::move(parsed);
    } catch (const std::exception& ex) {
        return ParseFailure(error, "pairing result", ex);
    }
    return true;
}

bool FromJson(const nlohmann::json& node, tournament::TournamentConfig& config, EngineError* error) {
    tournament::TournamentConfig parsed;
    try {
        parsed.name = node.value("name", parsed.name);
        parsed.total_rounds = node.value("total_rounds", parsed.total_rounds);
        parsed.rating_seeding = node.value("rating_seeding", parsed.rating_seeding);
        parsed.bye_points = node.value("bye_points", parsed.bye_points);
        parsed.bye_opponent_value = node.value("bye_opponent_value", parsed.bye_opponent_value);
        parsed.max_search_steps = node.value("max_search_steps", parsed.max_search_steps);

        if (node.contains("pairing_system")) {
            const auto name = node.at("pairing_system").get<std::string>();
            const auto system = tournament::ParsePairingSystem(name);
            if (!system) {
                return Fail(error, ErrorKind::kInvalidConfig, "Unknown pairing system: " + name);
            }
            parsed.pairing_system = *system;
        }
        if (node.contains("tiebreaks")) {
            parsed.tiebreaks.clear();
            for (const auto& entry : node.at("tiebreaks")) {
                const auto name = entry.get<std::string>();
                const auto criterion = tournament::ParseTiebreak(name);
                if (!criterion) {
                    return Fail(error, ErrorKind::kInvalidConfig, "Unknown tiebreak: " + name);
                }
                parsed.tiebreaks.push_back(*criterion);
            }
        }
        if (node.contains("color_policy")) {
            const auto name = node.at("color_policy").get<std::string>();
            const auto policy = tournament::ParseColorPolicy(name);
            if (!policy) {
                return Fail(error, ErrorKind::kInvalidConfig, "Unknown colour policy: " + name);
            }
            parsed.color_policy = *policy;
        }
        if (node.contains("bye_opponent_policy")) {
            const auto name = node.at("bye_opponent_policy").get<std::string>();
            const auto policy = tournament::ParseByeOpponentPolicy(name);
            if (!policy) {
                return Fail(error, ErrorKind::kInvalidConfig, "Unknown bye opponent policy: " + name);
            }
            parsed.bye_opponent_policy = *policy;
        }
    } catch (const std::exception& ex) {
        return ParseFailure(error, "tournament config", ex);
    }

    if (parsed.total_rounds < 1) {
        return Fail(error, ErrorKind::kInvalidConfig, "total_rounds must be at least 1");
    }
    config = std::move(parsed);
    return true;
}

bool FromJson(const nlohmann::json& node, registry::PlayerRegistry& registry, EngineError* error) {
    if (!node.is_array()) {
        return Fail(error, ErrorKind::kInvalidConfig, "Player list must be a JSON array");
    }
    registry::PlayerRegistry parsed;
    for (const auto& entry : node) {
        model::Player player;
        if (!FromJson(entry, player, error)) {
            return false;
        }
        if (!parsed.AddPlayer(std::move(player), error)) {
            return false;
        }
    }
    registry = std::move(parsed);
    return true;
}

}  // namespace gambit::core::persist
