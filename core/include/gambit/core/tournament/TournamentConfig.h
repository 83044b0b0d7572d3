#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gambit::core::tournament {

enum class PairingSystem {
    kDutchSwiss,
    kRoundRobin,
};

enum class TiebreakCriterion {
    kBuchholz,
    kBuchholzCut1,
    kMedianBuchholz,
    kSonnebornBerger,
    kProgressive,
    kCumulativeOpponents,
    kCumulativeOpponentsProgressive,
    kMostBlacks,
    kWins,
    kBlackWins,
    kAverageRatingOfOpponents,
};

// Decides the colours of a pair when neither player has a preference.
enum class ColorPolicy {
    kWhiteToHigherRanked,
    kAlternateByRound,
};

// Score credited to the missing opponent of a bye when computing opponent
// based tiebreaks.
enum class ByeOpponentPolicy {
    kExclude,
    kZero,
    kOwnScore,
    kFixed,
};

struct TournamentConfig {
    std::string name = "Untitled Tournament";
    int total_rounds = 5;
    PairingSystem pairing_system = PairingSystem::kDutchSwiss;
    std::vector<TiebreakCriterion> tiebreaks;
    ColorPolicy color_policy = ColorPolicy::kAlternateByRound;
    bool rating_seeding = true;
    double bye_points = 1.0;
    ByeOpponentPolicy bye_opponent_policy = ByeOpponentPolicy::kExclude;
    double bye_opponent_value = 0.0;
    int max_search_steps = 200000;

    TournamentConfig();
};

std::vector<TiebreakCriterion> DefaultUscfTiebreaks();
std::vector<TiebreakCriterion> DefaultFideTiebreaks();

const char* PairingSystemName(PairingSystem system);
const char* TiebreakName(TiebreakCriterion criterion);
const char* TiebreakLabel(TiebreakCriterion criterion);
const char* ColorPolicyName(ColorPolicy policy);
const char* ByeOpponentPolicyName(ByeOpponentPolicy policy);

std::optional<PairingSystem> ParsePairingSystem(const std::string& value);
std::optional<TiebreakCriterion> ParseTiebreak(const std::string& value);
std::optional<ColorPolicy> ParseColorPolicy(const std::string& value);
std::optional<ByeOpponentPolicy> ParseByeOpponentPolicy(const std::string& value);

}  // namespace gambit::core::tournament
