#pragma once

#include <optional>
#include <string>
#include <vector>

namespace gambit::core::model {

enum class Color {
    kNone,
    kWhite,
    kBlack,
};

enum class PreferenceStrength {
    kNone,
    kMild,
    kStrong,
    kAbsolute,
};

struct ColorPreference {
    Color color = Color::kNone;
    PreferenceStrength strength = PreferenceStrength::kNone;
};

Color Opposite(Color color);
const char* ColorName(Color color);

// One completed round from a single player's point of view. A bye has no
// opponent and no colour.
struct RoundRecord {
    int round = 0;
    std::optional<std::string> opponent_id;
    Color color = Color::kNone;
    double points = 0.0;

    bool is_bye() const { return !opponent_id.has_value(); }
};

struct FederationProfile {
    std::string federation_code;
    std::optional<long long> fide_id;
    std::string title;
    std::optional<int> standard_rating;
    std::optional<int> rapid_rating;
    std::optional<int> blitz_rating;
};

struct Player {
    std::string id;
    std::string name;
    std::optional<int> rating;
    bool active = true;
    double score = 0.0;
    int bye_count = 0;
    std::vector<RoundRecord> history;
    std::optional<FederationProfile> federation;

    int rounds_completed() const { return static_cast<int>(history.size()); }
    bool has_received_bye() const { return bye_count > 0; }
    int rating_or_zero() const { return rating.value_or(0); }

    int WhiteCount() const;
    int BlackCount() const;
    int GamesPlayed() const;
    // Whites minus blacks over played games.
    int ColorDifference() const;
    Color LastColor() const;
    ColorPreference GetColorPreference() const;
    bool HasPlayed(const std::string& opponent_id) const;
    std::vector<double> RunningScores() const;
    double SumOfRecordedPoints() const;
};

}  // namespace gambit::core::model
