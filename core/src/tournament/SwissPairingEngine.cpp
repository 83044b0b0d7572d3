#include "gambit/core/tournament/SwissPairingEngine.h"

#include "gambit/core/tournament/SwissRules.h"

#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace gambit::core::tournament {

namespace {

// Depth-first search over score brackets. A bracket is the players carried
// down from above (floaters) plus the residents of one score group. Residents
// are paired top half against bottom half first, leftovers are offered to the
// floaters, and whatever is still unpaired floats into the next bracket.
class BracketSearch {
public:
    BracketSearch(const std::vector<const model::Player*>& ranked,
                  const std::vector<int>& participants,
                  bool strict_colors,
                  int max_steps)
        : max_steps_(max_steps) {
        const size_t count = ranked.size();
        blocked_.assign(count, std::vector<char>(count, 0));
        for (size_t i = 0; i < count; ++i) {
            blocked_[i][i] = 1;
            for (size_t j = i + 1; j < count; ++j) {
                const bool rematch = ranked[i]->HasPlayed(ranked[j]->id);
                const bool color_clash = strict_colors && !ColorsCompatible(*ranked[i], *ranked[j]);
                blocked_[i][j] = blocked_[j][i] = (rematch || color_clash) ? 1 : 0;
            }
        }

        for (int index : participants) {
            const double score = ranked[static_cast<size_t>(index)]->score;
            if (groups_.empty() || ranked[static_cast<size_t>(groups_.back().front())]->score != score) {
                groups_.emplace_back();
            }
            groups_.back().push_back(index);
        }
    }

    bool Run(std::vector<std::pair<int, int>>& pairs) {
        pairs_.clear();
        if (!SolveBracket(0, {})) {
            return false;
        }
        pairs = pairs_;
        return true;
    }

    bool budget_exhausted() const { return exhausted_; }

private:
    enum State : char {
        kFree = 0,
        kPaired = 1,
        kLeft = 2,
    };

    struct Frame {
        size_t group = 0;
        bool last = false;
        std::vector<int> floaters;
        std::vector<char> floater_state;
        std::vector<char> resident_state;
        size_t left_residents = 0;
    };

    bool Tick() {
        if (++steps_ > max_steps_) {
            exhausted_ = true;
        }
        return !exhausted_;
    }

    bool Allowed(int a, int b) const {
        return blocked_[static_cast<size_t>(a)][static_cast<size_t>(b)] == 0;
    }

    void PushPair(int a, int b) {
        pairs_.emplace_back(std::min(a, b), std::max(a, b));
    }

    bool SolveBracket(size_t group, std::vector<int> floaters) {
        if (exhausted_) {
            return false;
        }
        if (group == groups_.size()) {
            return floaters.empty();
        }
        auto key = std::make_pair(group, floaters);
        if (failed_.count(key) != 0) {
            return false;
        }

        Frame frame;
        frame.group = group;
        frame.last = group + 1 == groups_.size();
        frame.floaters = std::move(floaters);
        frame.floater_state.assign(frame.floaters.size(), kFree);
        frame.resident_state.assign(groups_[group].size(), kFree);

        const bool solved = PairResidents(frame, 0);
        if (!solved && !exhausted_) {
            failed_.insert(std::move(key));
        }
        return solved;
    }

    bool PairResidents(Frame& frame, size_t next) {
        if (!Tick()) {
            return false;
        }
        const auto& residents = groups_[frame.group];
        size_t k = next;
        while (k < residents.size() && frame.resident_state[k] != kFree) {
            ++k;
        }
        if (k == residents.size()) {
            return PairFloaters(frame, 0);
        }

        const int player = residents[k];
        const size_t half = residents.size() / 2;
        std::vector<size_t> candidates;
        candidates.reserve(residents.size());
        if (k < half) {
            for (size_t j = half; j < residents.size(); ++j) {
                candidates.push_back(j);
            }
            for (size_t j = k + 1; j < half; ++j) {
                candidates.push_back(j);
            }
        } else {
            for (size_t j = k + 1; j < residents.size(); ++j) {
                candidates.push_back(j);
            }
        }

        frame.resident_state[k] = kPaired;
        for (size_t j : candidates) {
            if (frame.resident_state[j] != kFree || !Allowed(player, residents[j])) {
                continue;
            }
            frame.resident_state[j] = kPaired;
            PushPair(player, residents[j]);
            if (PairResidents(frame, k + 1)) {
                return true;
            }
            pairs_.pop_back();
            frame.resident_state[j] = kFree;
            if (exhausted_) {
                frame.resident_state[k] = kFree;
                return false;
            }
        }

        // In the last bracket every leftover resident needs a floater partner.
        if (!frame.last || frame.left_residents < frame.floaters.size()) {
            frame.resident_state[k] = kLeft;
            ++frame.left_residents;
            if (PairResidents(frame, k + 1)) {
                return true;
            }
            --frame.left_residents;
        }
        frame.resident_state[k] = kFree;
        return false;
    }

    bool PairFloaters(Frame& frame, size_t next) {
        if (!Tick()) {
            return false;
        }
        size_t fi = next;
        while (fi < frame.floaters.size() && frame.floater_state[fi] != kFree) {
            ++fi;
        }
        if (fi == frame.floaters.size()) {
            return Descend(frame);
        }

        const auto& residents = groups_[frame.group];
        const int floater = frame.floaters[fi];
        frame.floater_state[fi] = kPaired;

        for (size_t k = 0; k < residents.size(); ++k) {
            if (frame.resident_state[k] != kLeft || !Allowed(floater, residents[k])) {
                continue;
            }
            frame.resident_state[k] = kPaired;
            PushPair(floater, residents[k]);
            if (PairFloaters(frame, fi + 1)) {
                return true;
            }
            pairs_.pop_back();
            frame.resident_state[k] = kLeft;
            if (exhausted_) {
                frame.floater_state[fi] = kFree;
                return false;
            }
        }

        for (size_t j = fi + 1; j < frame.floaters.size(); ++j) {
            if (frame.floater_state[j] != kFree || !Allowed(floater, frame.floaters[j])) {
                continue;
            }
            frame.floater_state[j] = kPaired;
            PushPair(floater, frame.floaters[j]);
            if (PairFloaters(frame, fi + 1)) {
                return true;
            }
            pairs_.pop_back();
            frame.floater_state[j] = kFree;
            if (exhausted_) {
                frame.floater_state[fi] = kFree;
                return false;
            }
        }

        if (!frame.last) {
            frame.floater_state[fi] = kLeft;
            if (PairFloaters(frame, fi + 1)) {
                return true;
            }
        }
        frame.floater_state[fi] = kFree;
        return false;
    }

    bool Descend(Frame& frame) {
        std::vector<int> carried;
        const auto& residents = groups_[frame.group];
        for (size_t k = 0; k < residents.size(); ++k) {
            if (frame.resident_state[k] == kLeft) {
                carried.push_back(residents[k]);
            }
        }
        for (size_t f = 0; f < frame.floaters.size(); ++f) {
            if (frame.floater_state[f] == kLeft) {
                carried.push_back(frame.floaters[f]);
            }
        }
        if (frame.last) {
            return carried.empty();
        }
        std::sort(carried.begin(), carried.end());

        const size_t mark = pairs_.size();
        if (SolveBracket(frame.group + 1, std::move(carried))) {
            return true;
        }
        pairs_.resize(mark);
        return false;
    }

    std::vector<std::vector<int>> groups_;
    std::vector<std::vector<char>> blocked_;
    std::set<std::pair<size_t, std::vector<int>>> failed_;
    std::vector<std::pair<int, int>> pairs_;
    int max_steps_ = 0;
    int steps_ = 0;
    bool exhausted_ = false;
};

}  // namespace

SwissPairingEngine::SwissPairingEngine(LogFn log_fn) : log_fn_(std::move(log_fn)) {}

bool SwissPairingEngine::PairParticipants(const std::vector<const model::Player*>& ranked,
                                          const std::vector<int>& participants,
                                          const TournamentConfig& config,
                                          bool strict_colors,
                                          std::vector<std::pair<int, int>>& pairs,
                                          bool& budget_exhausted) const {
    BracketSearch search(ranked, participants, strict_colors, std::max(1, config.max_search_steps));
    const bool solved = search.Run(pairs);
    budget_exhausted = search.budget_exhausted();
    return solved;
}

bool SwissPairingEngine::PairRound(const registry::PlayerRegistry& registry,
                                   const TournamentConfig& config,
                                   int round_number,
                                   PairingResult& out,
                                   EngineError* error) const {
    out = PairingResult{};
    out.round_number = round_number;
    if (round_number < 1) {
        return Fail(error, ErrorKind::kInvalidArgument, "Round numbers start at 1");
    }

    const auto ranked = RankPlayers(registry, config);
    if (ranked.empty()) {
        return Fail(error, ErrorKind::kPairingInfeasible, "No active players to pair");
    }

    std::vector<int> bye_candidates;
    if (ranked.size() % 2 == 1) {
        for (int i = static_cast<int>(ranked.size()) - 1; i >= 0; --i) {
            if (!ranked[static_cast<size_t>(i)]->has_received_bye()) {
                bye_candidates.push_back(i);
            }
        }
        if (bye_candidates.empty()) {
            return Fail(error, ErrorKind::kPairingInfeasible,
                        "Odd number of players and every player already had a bye");
        }
    } else {
        bye_candidates.push_back(-1);
    }

    std::vector<std::pair<int, int>> pairs;
    int bye_index = -1;
    bool found = false;
    bool exhausted = false;
    for (bool strict_colors : {true, false}) {
        for (int candidate : bye_candidates) {
            std::vector<int> participants;
            participants.reserve(ranked.size());
            for (int i = 0; i < static_cast<int>(ranked.size()); ++i) {
                if (i != candidate) {
                    participants.push_back(i);
                }
            }
            bool budget_hit = false;
            if (PairParticipants(ranked, participants, config, strict_colors, pairs, budget_hit)) {
                bye_index = candidate;
                found = true;
                break;
            }
            exhausted = exhausted || budget_hit;
        }
        if (found) {
            break;
        }
        if (strict_colors && log_fn_) {
            log_fn_("[gambit] Round " + std::to_string(round_number) +
                    ": no pairing honours every absolute colour, relaxing colour constraint");
        }
    }

    if (!found) {
        std::ostringstream message;
        message << "No rule-compliant pairing exists for round " << round_number;
        if (exhausted) {
            message << " within " << config.max_search_steps << " search steps";
        }
        return Fail(error, ErrorKind::kPairingInfeasible, message.str());
    }

    for (const auto& pair : pairs) {
        const auto& higher = *ranked[static_cast<size_t>(pair.first)];
        const auto& lower = *ranked[static_cast<size_t>(pair.second)];
        out.pairings.push_back(ChooseColors(higher, lower, config, round_number));
    }
    OrderBoards(out.pairings, registry, config);
    if (bye_index >= 0) {
        out.bye_player_id = ranked[static_cast<size_t>(bye_index)]->id;
    }
    AssignPairingIds(out);

    if (log_fn_) {
        std::ostringstream line;
        line << "[gambit] Round " << round_number << ": " << out.pairings.size() << " boards";
        if (out.bye_player_id) {
            line << ", bye " << *out.bye_player_id;
        }
        log_fn_(line.str());
    }
    return true;
}

}  // namespace gambit::core::tournament
