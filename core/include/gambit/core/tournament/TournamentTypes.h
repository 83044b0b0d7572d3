#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gambit::core::tournament {

struct Pairing {
    std::string white_id;
    std::string black_id;

    bool Involves(const std::string& player_id) const {
        return white_id == player_id || black_id == player_id;
    }
};

inline bool operator==(const Pairing& a, const Pairing& b) {
    return a.white_id == b.white_id && a.black_id == b.black_id;
}

// One round's pairings in board order. The same record is what the round
// manager keeps as the round log.
struct PairingResult {
    int round_number = 0;
    std::vector<Pairing> pairings;
    std::optional<std::string> bye_player_id;
    std::vector<std::string> pairing_ids;

    size_t player_count() const { return pairings.size() * 2 + (bye_player_id ? 1 : 0); }
};

using RoundData = PairingResult;

struct MatchResult {
    std::string white_id;
    std::string black_id;
    double white_score = 0.0;

    double black_score() const { return 1.0 - white_score; }
};

inline bool operator==(const MatchResult& a, const MatchResult& b) {
    return a.white_id == b.white_id && a.black_id == b.black_id && a.white_score == b.white_score;
}

std::string PairingIdFor(int round_number, const std::string& a, const std::string& b);

}  // namespace gambit::core::tournament
