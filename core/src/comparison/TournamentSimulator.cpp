#include "gambit/core/comparison/TournamentSimulator.h"

#include "gambit/core/tournament/ResultRecorder.h"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>
#include <utility>

namespace gambit::core::comparison {

namespace {

std::string TournamentId(int index) {
    std::ostringstream out;
    out << "sim_" << (index + 1);
    return out.str();
}

}  // namespace

TournamentSimulator::TournamentSimulator(SimulationOptions options,
                                         tournament::TournamentConfig config,
                                         ComparisonOptions comparison,
                                         LogFn log_fn)
    : options_(options),
      config_(std::move(config)),
      comparison_(comparison),
      log_fn_(std::move(log_fn)) {
    config_.total_rounds = options_.rounds;
}

bool TournamentSimulator::GenerateField(int player_count,
                                        int min_rating,
                                        int max_rating,
                                        std::mt19937& rng,
                                        registry::PlayerRegistry& field,
                                        EngineError* error) {
    std::uniform_int_distribution<int> rating_dist(min_rating, max_rating);
    field = registry::PlayerRegistry{};
    for (int i = 0; i < player_count; ++i) {
        model::Player player;
        std::ostringstream id;
        id << "p" << (i + 1);
        player.id = id.str();
        player.name = "Player " + std::to_string(i + 1);
        player.rating = rating_dist(rng);
        if (!field.AddPlayer(std::move(player), error)) {
            return false;
        }
    }
    return true;
}

double TournamentSimulator::ExpectedScore(int rating, int opponent_rating) {
    return 1.0 / (1.0 + std::pow(10.0, static_cast<double>(opponent_rating - rating) / 400.0));
}

double TournamentSimulator::PlayGame(int white_rating, int black_rating, double draw_rate, std::mt19937& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    if (unit(rng) < draw_rate) {
        return 0.5;
    }
    const double expected = ExpectedScore(white_rating, black_rating);
    double win_share = expected;
    if (draw_rate < 1.0) {
        win_share = std::max(0.0, std::min(1.0, (expected - draw_rate / 2.0) / (1.0 - draw_rate)));
    }
    return unit(rng) < win_share ? 1.0 : 0.0;
}

SimulatedTournament TournamentSimulator::RunOne(int index,
                                                const tournament::IPairingEngine& primary,
                                                const tournament::IPairingEngine& reference) const {
    std::seed_seq seed{options_.seed, static_cast<std::uint32_t>(index)};
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> size_dist(options_.min_players, options_.max_players);

    SimulatedTournament outcome;
    outcome.tournament_id = TournamentId(index);
    outcome.player_count = size_dist(rng);
    registry::PlayerRegistry state;
    EngineError field_error;
    if (!GenerateField(outcome.player_count, options_.min_rating, options_.max_rating, rng, state, &field_error)) {
        outcome.stopped_by = field_error;
        return outcome;
    }

    const ComparisonEngine comparator(comparison_);
    const tournament::ResultRecorder recorder;
    for (int round = 1; round <= options_.rounds; ++round) {
        auto result = comparator.Compare(outcome.tournament_id, state, config_, round, primary, reference);
        std::optional<tournament::PairingResult> played = result.engine_a.pairing;
        if (!played) {
            played = result.engine_b.pairing;
        }
        outcome.rounds.push_back(std::move(result));
        if (!played) {
            outcome.stopped_by = outcome.rounds.back().engine_a.error;
            break;
        }

        std::vector<tournament::MatchResult> results;
        results.reserve(played->pairings.size());
        for (const auto& board : played->pairings) {
            const int white_rating = state.Find(board.white_id)->rating_or_zero();
            const int black_rating = state.Find(board.black_id)->rating_or_zero();
            results.push_back({board.white_id, board.black_id,
                               PlayGame(white_rating, black_rating, options_.draw_rate, rng)});
        }
        EngineError error;
        if (!recorder.ApplyResults(state, *played, results, config_, &error)) {
            outcome.stopped_by = error;
            break;
        }
    }

    std::ostringstream line;
    line << "[sim] " << outcome.tournament_id << ": " << outcome.player_count << " players, "
         << outcome.rounds.size() << " rounds compared";
    if (outcome.stopped_by) {
        line << ", stopped: " << Describe(*outcome.stopped_by);
    }
    Log(line.str());
    return outcome;
}

std::vector<SimulatedTournament> TournamentSimulator::Run(const tournament::IPairingEngine& primary,
                                                          const tournament::IPairingEngine& reference) const {
    std::vector<SimulatedTournament> results(static_cast<size_t>(std::max(0, options_.tournaments)));
    if (results.empty()) {
        return results;
    }

    const int worker_count = std::max(1, std::min(options_.threads, options_.tournaments));
    std::atomic<int> next_index{0};
    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(worker_count));
    for (int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() { RunWorker(primary, reference, next_index, results); });
    }
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    return results;
}

void TournamentSimulator::RunWorker(const tournament::IPairingEngine& primary,
                                    const tournament::IPairingEngine& reference,
                                    std::atomic<int>& next_index,
                                    std::vector<SimulatedTournament>& results) const {
    while (true) {
        const int index = next_index.fetch_add(1);
        if (index >= static_cast<int>(results.size())) {
            return;
        }
        results[static_cast<size_t>(index)] = RunOne(index, primary, reference);
    }
}

void TournamentSimulator::Log(const std::string& line) const {
    if (!log_fn_) {
        return;
    }
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_fn_(line);
}

std::vector<ComparisonResult> CollectRounds(const std::vector<SimulatedTournament>& tournaments) {
    std::vector<ComparisonResult> rounds;
    for (const auto& tournament : tournaments) {
        rounds.insert(rounds.end(), tournament.rounds.begin(), tournament.rounds.end());
    }
    return rounds;
}

}  // namespace gambit::core::comparison
