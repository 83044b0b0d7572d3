#include "gambit/core/tournament/TournamentConfig.h"

#include <array>
#include <initializer_list>
#include <utility>

namespace gambit::core::tournament {

namespace {

constexpr std::array<std::pair<TiebreakCriterion, const char*>, 11> kTiebreakNames = {{
    {TiebreakCriterion::kBuchholz, "buchholz"},
    {TiebreakCriterion::kBuchholzCut1, "buchholz_cut1"},
    {TiebreakCriterion::kMedianBuchholz, "median"},
    {TiebreakCriterion::kSonnebornBerger, "sb"},
    {TiebreakCriterion::kProgressive, "progressive"},
    {TiebreakCriterion::kCumulativeOpponents, "cumulative_opp"},
    {TiebreakCriterion::kCumulativeOpponentsProgressive, "cumulative_opp_progressive"},
    {TiebreakCriterion::kMostBlacks, "most_blacks"},
    {TiebreakCriterion::kWins, "wins"},
    {TiebreakCriterion::kBlackWins, "black_wins"},
    {TiebreakCriterion::kAverageRatingOfOpponents, "aro"},
}};

}  // namespace

TournamentConfig::TournamentConfig() : tiebreaks(DefaultUscfTiebreaks()) {}

std::vector<TiebreakCriterion> DefaultUscfTiebreaks() {
    return {
        TiebreakCriterion::kMedianBuchholz,
        TiebreakCriterion::kBuchholz,
        TiebreakCriterion::kProgressive,
        TiebreakCriterion::kCumulativeOpponents,
        TiebreakCriterion::kSonnebornBerger,
        TiebreakCriterion::kMostBlacks,
    };
}

std::vector<TiebreakCriterion> DefaultFideTiebreaks() {
    return {
        TiebreakCriterion::kBuchholzCut1,
        TiebreakCriterion::kBuchholz,
        TiebreakCriterion::kProgressive,
        TiebreakCriterion::kSonnebornBerger,
        TiebreakCriterion::kWins,
        TiebreakCriterion::kBlackWins,
    };
}

const char* PairingSystemName(PairingSystem system) {
    return system == PairingSystem::kRoundRobin ? "round_robin" : "dutch_swiss";
}

const char* TiebreakName(TiebreakCriterion criterion) {
    for (const auto& entry : kTiebreakNames) {
        if (entry.first == criterion) {
            return entry.second;
        }
    }
    return "unknown";
}

const char* TiebreakLabel(TiebreakCriterion criterion) {
    switch (criterion) {
        case TiebreakCriterion::kBuchholz:
            return "Buchholz";
        case TiebreakCriterion::kBuchholzCut1:
            return "Buchholz Cut-1";
        case TiebreakCriterion::kMedianBuchholz:
            return "Median";
        case TiebreakCriterion::kSonnebornBerger:
            return "Sonneborn-Berger";
        case TiebreakCriterion::kProgressive:
            return "Progressive";
        case TiebreakCriterion::kCumulativeOpponents:
            return "Cumulative Opp";
        case TiebreakCriterion::kCumulativeOpponentsProgressive:
            return "Cumulative Opp (Progressive)";
        case TiebreakCriterion::kMostBlacks:
            return "Most Blacks";
        case TiebreakCriterion::kWins:
            return "Number of Wins";
        case TiebreakCriterion::kBlackWins:
            return "Wins with Black";
        case TiebreakCriterion::kAverageRatingOfOpponents:
            return "Avg Rating of Opp";
    }
    return "Unknown";
}

const char* ColorPolicyName(ColorPolicy policy) {
    return policy == ColorPolicy::kWhiteToHigherRanked ? "white_to_higher_ranked" : "alternate_by_round";
}

const char* ByeOpponentPolicyName(ByeOpponentPolicy policy) {
    switch (policy) {
        case ByeOpponentPolicy::kExclude:
            return "exclude";
        case ByeOpponentPolicy::kZero:
            return "zero";
        case ByeOpponentPolicy::kOwnScore:
            return "own_score";
        case ByeOpponentPolicy::kFixed:
            return "fixed";
    }
    return "exclude";
}

std::optional<PairingSystem> ParsePairingSystem(const std::string& value) {
    if (value == "dutch_swiss" || value == "swiss") {
        return PairingSystem::kDutchSwiss;
    }
    if (value == "round_robin") {
        return PairingSystem::kRoundRobin;
    }
    return std::nullopt;
}

std::optional<TiebreakCriterion> ParseTiebreak(const std::string& value) {
    // Accept the USCF names for the criteria FIDE calls differently.
    if (value == "solkoff") {
        return TiebreakCriterion::kBuchholz;
    }
    if (value == "cumulative") {
        return TiebreakCriterion::kProgressive;
    }
    if (value == "black_games") {
        return TiebreakCriterion::kMostBlacks;
    }
    for (const auto& entry : kTiebreakNames) {
        if (value == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

std::optional<ColorPolicy> ParseColorPolicy(const std::string& value) {
    if (value == "white_to_higher_ranked") {
        return ColorPolicy::kWhiteToHigherRanked;
    }
    if (value == "alternate_by_round") {
        return ColorPolicy::kAlternateByRound;
    }
    return std::nullopt;
}

std::optional<ByeOpponentPolicy> ParseByeOpponentPolicy(const std::string& value) {
    for (auto policy : {ByeOpponentPolicy::kExclude, ByeOpponentPolicy::kZero, ByeOpponentPolicy::kOwnScore,
                        ByeOpponentPolicy::kFixed}) {
        if (value == ByeOpponentPolicyName(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

}  // namespace gambit::core::tournament
