#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/comparison/Metrics.h"
#include "gambit/core/registry/PlayerRegistry.h"
#include "gambit/core/tournament/PairingEngine.h"
#include "gambit/core/tournament/TournamentConfig.h"
#include "gambit/core/tournament/TournamentTypes.h"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gambit::core::comparison {

// Unordered pair of player ids, lower id first.
using PlayerPair = std::pair<std::string, std::string>;

PlayerPair MakePlayerPair(const std::string& a, const std::string& b);

struct PairingDifference {
    int matching_pairs = 0;
    std::vector<PlayerPair> only_a;
    std::vector<PlayerPair> only_b;
    // Pairs both engines produced with opposite colours.
    std::vector<PlayerPair> color_divergent;
    bool bye_divergent = false;

    int total_differences() const { return static_cast<int>(only_a.size() + only_b.size()); }
    double matching_share() const;
};

struct EngineOutcome {
    std::string engine_name;
    std::optional<tournament::PairingResult> pairing;
    std::optional<EngineError> error;
    std::optional<EngineMetrics> metrics;

    bool ok() const { return pairing.has_value(); }
};

enum class Winner {
    // At least one engine failed; the round is reported as a failure only.
    kNone,
    kEngineA,
    kEngineB,
    kTie,
};

const char* WinnerName(Winner winner);

struct ComparisonResult {
    std::string tournament_id;
    int round_number = 0;
    // Active players in the compared state.
    int player_count = 0;
    EngineOutcome engine_a;
    EngineOutcome engine_b;
    PairingDifference difference;
    Winner winner = Winner::kNone;
    // Overall score of A minus overall score of B; empty unless both engines
    // produced a pairing.
    std::optional<double> score_difference;

    bool decided() const { return score_difference.has_value(); }
};

struct ComparisonOptions {
    bool parallel = false;
    ScoreWeights weights;
    // Overall scores closer than this are a tie.
    double tie_margin = 0.01;
};

class ComparisonEngine {
public:
    using LogFn = std::function<void(const std::string&)>;

    explicit ComparisonEngine(ComparisonOptions options = {}, LogFn log_fn = {});

    // Each engine pairs its own copy of `state`; `state` itself is never
    // modified.
    ComparisonResult Compare(const std::string& tournament_id,
                             const registry::PlayerRegistry& state,
                             const tournament::TournamentConfig& config,
                             int round_number,
                             const tournament::IPairingEngine& engine_a,
                             const tournament::IPairingEngine& engine_b) const;

    static PairingDifference Diff(const tournament::PairingResult& a, const tournament::PairingResult& b);

    const ComparisonOptions& options() const { return options_; }

private:
    EngineOutcome RunEngine(const tournament::IPairingEngine& engine,
                            const registry::PlayerRegistry& state,
                            const tournament::TournamentConfig& config,
                            int round_number) const;

    ComparisonOptions options_;
    LogFn log_fn_;
};

}  // namespace gambit::core::comparison
