#include "gambit/core/model/Player.h"

#include <algorithm>

namespace gambit::core::model {

Color Opposite(Color color) {
    if (color == Color::kWhite) {
        return Color::kBlack;
    }
    if (color == Color::kBlack) {
        return Color::kWhite;
    }
    return Color::kNone;
}

const char* ColorName(Color color) {
    switch (color) {
        case Color::kWhite:
            return "white";
        case Color::kBlack:
            return "black";
        case Color::kNone:
            break;
    }
    return "none";
}

int Player::WhiteCount() const {
    return static_cast<int>(std::count_if(history.begin(), history.end(), [](const RoundRecord& record) {
        return record.color == Color::kWhite;
    }));
}

int Player::BlackCount() const {
    return static_cast<int>(std::count_if(history.begin(), history.end(), [](const RoundRecord& record) {
        return record.color == Color::kBlack;
    }));
}

int Player::GamesPlayed() const {
    return static_cast<int>(std::count_if(history.begin(), history.end(), [](const RoundRecord& record) {
        return !record.is_bye();
    }));
}

int Player::ColorDifference() const {
    return WhiteCount() - BlackCount();
}

Color Player::LastColor() const {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->color != Color::kNone) {
            return it->color;
        }
    }
    return Color::kNone;
}

ColorPreference Player::GetColorPreference() const {
    std::vector<Color> played;
    played.reserve(history.size());
    for (const auto& record : history) {
        if (record.color != Color::kNone) {
            played.push_back(record.color);
        }
    }
    if (played.empty()) {
        return {};
    }

    const int difference = ColorDifference();
    if (difference >= 2) {
        return {Color::kBlack, PreferenceStrength::kAbsolute};
    }
    if (difference <= -2) {
        return {Color::kWhite, PreferenceStrength::kAbsolute};
    }

    const size_t count = played.size();
    if (count >= 2 && played[count - 1] == played[count - 2]) {
        return {Opposite(played[count - 1]), PreferenceStrength::kAbsolute};
    }
    if (difference == 1) {
        return {Color::kBlack, PreferenceStrength::kStrong};
    }
    if (difference == -1) {
        return {Color::kWhite, PreferenceStrength::kStrong};
    }
    return {Opposite(played.back()), PreferenceStrength::kMild};
}

bool Player::HasPlayed(const std::string& opponent_id) const {
    return std::any_of(history.begin(), history.end(), [&](const RoundRecord& record) {
        return record.opponent_id.has_value() && *record.opponent_id == opponent_id;
    });
}

std::vector<double> Player::RunningScores() const {
    std::vector<double> running;
    running.reserve(history.size());
    double total = 0.0;
    for (const auto& record : history) {
        total += record.points;
        running.push_back(total);
    }
    return running;
}

double Player::SumOfRecordedPoints() const {
    double total = 0.0;
    for (const auto& record : history) {
        total += record.points;
    }
    return total;
}

}  // namespace gambit::core::model
