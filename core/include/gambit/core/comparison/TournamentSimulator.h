#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/comparison/ComparisonEngine.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/PairingEngine.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace gambit::core::comparison {

struct SimulationOptions {
    int tournaments = 10;
    int min_players = 8;
    int max_players = 24;
    int rounds = 5;
    std::uint32_t seed = 42;
    int threads = 1;
    double draw_rate = 0.3;
    int min_rating = 1200;
    int max_rating = 2600;
};

struct SimulatedTournament {
    std::string tournament_id;
    int player_count = 0;
    std::vector<ComparisonResult> rounds;
    // Set when neither engine could pair a round or its results were rejected.
    std::optional<EngineError> stopped_by;
};

// Plays seeded random tournaments. Every round both engines pair the same
// state; the primary engine's pairing (or the reference engine's when the
// primary failed) is played out and recorded.
class TournamentSimulator {
public:
    using LogFn = std::function<void(const std::string&)>;

    TournamentSimulator(SimulationOptions options,
                        tournament::TournamentConfig config,
                        ComparisonOptions comparison,
                        LogFn log_fn = {});

    // Results are ordered by tournament index regardless of `threads`.
    std::vector<SimulatedTournament> Run(const tournament::IPairingEngine& primary,
                                         const tournament::IPairingEngine& reference) const;

    SimulatedTournament RunOne(int index,
                               const tournament::IPairingEngine& primary,
                               const tournament::IPairingEngine& reference) const;

    static bool GenerateField(int player_count,
                              int min_rating,
                              int max_rating,
                              std::mt19937& rng,
                              registry::PlayerRegistry& field,
                              EngineError* error);
    // Elo expectation for the first player.
    static double ExpectedScore(int rating, int opponent_rating);
    static double PlayGame(int white_rating, int black_rating, double draw_rate, std::mt19937& rng);

private:
    void RunWorker(const tournament::IPairingEngine& primary,
                   const tournament::IPairingEngine& reference,
                   std::atomic<int>& next_index,
                   std::vector<SimulatedTournament>& results) const;
    void Log(const std::string& line) const;

    SimulationOptions options_;
    tournament::TournamentConfig config_;
    ComparisonOptions comparison_;
    LogFn log_fn_;
    mutable std::mutex log_mutex_;
};

std::vector<ComparisonResult> CollectRounds(const std::vector<SimulatedTournament>& tournaments);

}  // namespace gambit::core::comparison
