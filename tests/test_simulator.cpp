#include "gambit/core/comparison/Reporter.h"
#include "gambit/core/comparison/StatisticalAnalyzer.h"
#include "gambit/core/comparison/TournamentSimulator.h"
#include "gambit/core/tournament/GreedyPairingEngine.h"
#include "gambit/core/tournament/SwissPairingEngine.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>

using gambit::core::EngineError;
using gambit::core::ErrorKind;
using gambit::core::comparison::CollectRounds;
using gambit::core::comparison::ComparisonOptions;
using gambit::core::comparison::ReportMetadata;
using gambit::core::comparison::Reporter;
using gambit::core::comparison::SimulationOptions;
using gambit::core::comparison::StatisticalAnalyzer;
using gambit::core::comparison::TournamentSimulator;
using gambit::core::registry::PlayerRegistry;
using gambit::core::tournament::GreedyPairingEngine;
using gambit::core::tournament::SwissPairingEngine;
using gambit::core::tournament::TournamentConfig;

namespace {

SimulationOptions SmallRun(int threads) {
    SimulationOptions options;
    options.tournaments = 4;
    options.min_players = 6;
    options.max_players = 9;
    options.rounds = 3;
    options.seed = 1234;
    options.threads = threads;
    return options;
}

}  // namespace

TEST_CASE("Generated fields are seeded and within the rating range", "[simulator]") {
    std::mt19937 rng(7);
    PlayerRegistry field;
    EngineError error;
    REQUIRE(TournamentSimulator::GenerateField(6, 1400, 1600, rng, field, &error));
    REQUIRE(field.size() == 6);
    REQUIRE(field.players().front().id == "p1");
    for (const auto& player : field.players()) {
        REQUIRE(player.rating.has_value());
        REQUIRE(*player.rating >= 1400);
        REQUIRE(*player.rating <= 1600);
    }

    std::mt19937 same_seed(7);
    PlayerRegistry again;
    REQUIRE(TournamentSimulator::GenerateField(6, 1400, 1600, same_seed, again, &error));
    REQUIRE(again.players().back().rating == field.players().back().rating);
}

TEST_CASE("Game outcomes follow the Elo expectation", "[simulator]") {
    REQUIRE(TournamentSimulator::ExpectedScore(1500, 1500) == Approx(0.5));
    REQUIRE(TournamentSimulator::ExpectedScore(1900, 1500) == Approx(1.0 / (1.0 + 0.1)));
    REQUIRE(TournamentSimulator::ExpectedScore(1500, 1900) == Approx(1.0 - 1.0 / 1.1));

    std::mt19937 rng(99);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(TournamentSimulator::PlayGame(1500, 2500, 1.0, rng) == 0.5);
        const double score = TournamentSimulator::PlayGame(1500, 2500, 0.0, rng);
        REQUIRE((score == 0.0 || score == 1.0));
    }
}

TEST_CASE("Simulation results do not depend on the thread count", "[simulator][threads]") {
    const SwissPairingEngine swiss;
    const GreedyPairingEngine greedy;
    const TournamentConfig config;

    std::mutex log_mutex;
    std::vector<std::string> log;
    auto log_fn = [&](const std::string& line) {
        std::lock_guard<std::mutex> lock(log_mutex);
        log.push_back(line);
    };

    const TournamentSimulator single(SmallRun(1), config, ComparisonOptions{}, log_fn);
    const TournamentSimulator pooled(SmallRun(3), config, ComparisonOptions{}, log_fn);
    const auto first = single.Run(swiss, greedy);
    const auto second = pooled.Run(swiss, greedy);

    REQUIRE(first.size() == 4);
    REQUIRE(second.size() == 4);
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].tournament_id == "sim_" + std::to_string(i + 1));
        REQUIRE(first[i].tournament_id == second[i].tournament_id);
        REQUIRE(first[i].player_count == second[i].player_count);
        REQUIRE(first[i].player_count >= 6);
        REQUIRE(first[i].player_count <= 9);
        REQUIRE_FALSE(first[i].stopped_by.has_value());
        REQUIRE(first[i].rounds.size() == 3);
        for (size_t r = 0; r < first[i].rounds.size(); ++r) {
            const auto& a = first[i].rounds[r];
            const auto& b = second[i].rounds[r];
            REQUIRE(a.round_number == static_cast<int>(r) + 1);
            REQUIRE(a.engine_a.ok() == b.engine_a.ok());
            if (a.engine_a.ok()) {
                REQUIRE(a.engine_a.pairing->pairings == b.engine_a.pairing->pairings);
            }
            REQUIRE(a.winner == b.winner);
            REQUIRE(a.player_count == first[i].player_count);
        }
    }
    REQUIRE(CollectRounds(first).size() == 12);
    REQUIRE(log.size() == 8);
}

TEST_CASE("Reports mark undefined statistics explicitly", "[reporter]") {
    const SwissPairingEngine swiss;
    const GreedyPairingEngine greedy;
    SimulationOptions options = SmallRun(1);
    options.tournaments = 1;
    options.rounds = 1;
    const TournamentSimulator simulator(options, TournamentConfig{}, ComparisonOptions{});
    const auto rounds = CollectRounds(simulator.Run(swiss, greedy));
    REQUIRE(rounds.size() == 1);
    const auto summary = StatisticalAnalyzer::Summarize(rounds);

    ReportMetadata metadata;
    metadata.tournaments = 1;
    metadata.seed = options.seed;

    const auto report = Reporter::BuildJsonReport(summary, rounds, metadata);
    REQUIRE(report.at("metadata").at("total_comparisons") == 1);
    REQUIRE(report.at("results").at("score_difference").at("variance").is_null());
    REQUIRE(report.at("engines").at("a").at("name") == "gambit");
    REQUIRE(report.at("engines").at("b").at("name") == "reference");
    REQUIRE(report.at("rounds").size() == 1);
    REQUIRE(report.at("rounds")[0].at("round") == 1);
    REQUIRE(report.at("results").at("significance").is_null());
    REQUIRE(report.at("results").at("confidence_level").is_null());
    REQUIRE(report.at("results").at("min_significance_samples") == 30);
    REQUIRE(report.at("sizes").at("small").at("comparisons") == 1);
    REQUIRE(report.at("engines").at("a").at("median_fide_score").is_number());

    const auto text = Reporter::FormatText(summary, metadata);
    REQUIRE(text.find("undefined") != std::string::npos);
    REQUIRE(text.find("Engine A: gambit") != std::string::npos);
    REQUIRE(text.find("median quality") != std::string::npos);
    REQUIRE(text.find("By field size") != std::string::npos);
}

TEST_CASE("Reports are written to disk or fail with an IO error", "[reporter][io]") {
    const auto dir = std::filesystem::temp_directory_path() / "gambit_tests_reports";
    std::filesystem::remove_all(dir);
    const auto summary = StatisticalAnalyzer::Summarize({});
    const ReportMetadata metadata{};
    EngineError error;

    const auto json_path = (dir / "out" / "report.json").string();
    const auto text_path = (dir / "out" / "report.txt").string();
    REQUIRE(Reporter::WriteReports(json_path, text_path, summary, {}, metadata, &error));
    REQUIRE(std::filesystem::exists(json_path));
    REQUIRE(std::filesystem::exists(text_path));

    const auto blocker = dir / "blocker";
    {
        std::ofstream file(blocker);
        file << "x";
    }
    REQUIRE_FALSE(Reporter::WriteReports((blocker / "report.json").string(), "", summary, {}, metadata, &error));
    REQUIRE(error.kind == ErrorKind::kIoError);
    std::filesystem::remove_all(dir);
}
