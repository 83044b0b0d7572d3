#include "gambit/core/comparison/ComparisonEngine.h"

#include <chrono>
#include <cmath>
#include <map>
#include <sstream>
#include <thread>

namespace gambit::core::comparison {

namespace {

std::map<PlayerPair, const tournament::Pairing*> IndexPairs(const tournament::PairingResult& result) {
    std::map<PlayerPair, const tournament::Pairing*> index;
    for (const auto& board : result.pairings) {
        index.emplace(MakePlayerPair(board.white_id, board.black_id), &board);
    }
    return index;
}

}  // namespace

PlayerPair MakePlayerPair(const std::string& a, const std::string& b) {
    return a < b ? PlayerPair{a, b} : PlayerPair{b, a};
}

double PairingDifference::matching_share() const {
    const int total = matching_pairs + total_differences();
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(matching_pairs) / total;
}

const char* WinnerName(Winner winner) {
    switch (winner) {
        case Winner::kEngineA:
            return "a";
        case Winner::kEngineB:
            return "b";
        case Winner::kTie:
            return "tie";
        case Winner::kNone:
            break;
    }
    return "none";
}

ComparisonEngine::ComparisonEngine(ComparisonOptions options, LogFn log_fn)
    : options_(options), log_fn_(std::move(log_fn)) {}

PairingDifference ComparisonEngine::Diff(const tournament::PairingResult& a, const tournament::PairingResult& b) {
    PairingDifference difference;
    const auto pairs_a = IndexPairs(a);
    const auto pairs_b = IndexPairs(b);

    for (const auto& entry : pairs_a) {
        const auto it = pairs_b.find(entry.first);
        if (it == pairs_b.end()) {
            difference.only_a.push_back(entry.first);
            continue;
        }
        difference.matching_pairs += 1;
        if (entry.second->white_id != it->second->white_id) {
            difference.color_divergent.push_back(entry.first);
        }
    }
    for (const auto& entry : pairs_b) {
        if (pairs_a.count(entry.first) == 0) {
            difference.only_b.push_back(entry.first);
        }
    }
    difference.bye_divergent = a.bye_player_id != b.bye_player_id;
    return difference;
}

EngineOutcome ComparisonEngine::RunEngine(const tournament::IPairingEngine& engine,
                                          const registry::PlayerRegistry& state,
                                          const tournament::TournamentConfig& config,
                                          int round_number) const {
    EngineOutcome outcome;
    outcome.engine_name = engine.name();
    const registry::PlayerRegistry copy = state.Snapshot();

    tournament::PairingResult pairing;
    EngineError error;
    const auto start = std::chrono::steady_clock::now();
    const bool ok = engine.PairRound(copy, config, round_number, pairing, &error);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    if (!ok) {
        outcome.error = error;
        return outcome;
    }

    auto metrics = Evaluate(pairing, copy, config, options_.weights);
    metrics.elapsed_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    outcome.metrics = metrics;
    outcome.pairing = std::move(pairing);
    return outcome;
}

ComparisonResult ComparisonEngine::Compare(const std::string& tournament_id,
                                           const registry::PlayerRegistry& state,
                                           const tournament::TournamentConfig& config,
                                           int round_number,
                                           const tournament::IPairingEngine& engine_a,
                                           const tournament::IPairingEngine& engine_b) const {
    ComparisonResult result;
    result.tournament_id = tournament_id;
    result.round_number = round_number;
    result.player_count = static_cast<int>(state.ActivePlayers().size());

    if (options_.parallel) {
        std::thread worker([&]() { result.engine_a = RunEngine(engine_a, state, config, round_number); });
        result.engine_b = RunEngine(engine_b, state, config, round_number);
        worker.join();
    } else {
        result.engine_a = RunEngine(engine_a, state, config, round_number);
        result.engine_b = RunEngine(engine_b, state, config, round_number);
    }

    const bool a_ok = result.engine_a.ok();
    const bool b_ok = result.engine_b.ok();
    if (a_ok && b_ok) {
        result.difference = Diff(*result.engine_a.pairing, *result.engine_b.pairing);
        const double difference =
            result.engine_a.metrics->overall_score - result.engine_b.metrics->overall_score;
        result.score_difference = difference;
        if (std::fabs(difference) < options_.tie_margin) {
            result.winner = Winner::kTie;
        } else {
            result.winner = difference > 0.0 ? Winner::kEngineA : Winner::kEngineB;
        }
    }

    if (log_fn_) {
        std::ostringstream line;
        line << "[compare] " << tournament_id << " round " << round_number << ": "
             << result.engine_a.engine_name << (a_ok ? "" : " (failed)") << " vs "
             << result.engine_b.engine_name << (b_ok ? "" : " (failed)") << ", winner "
             << WinnerName(result.winner);
        if (a_ok && b_ok) {
            line << ", " << result.difference.total_differences() << " divergent pairs";
        }
        log_fn_(line.str());
    }
    return result;
}

}  // namespace gambit::core::comparison
