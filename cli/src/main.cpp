#include "gambit/core/api/RunnerConfig.h"
#include "gambit/core/comparison/ComparisonEngine.h"
#include "gambit/core/comparison/Reporter.h"
#include "gambit/core/comparison/StatisticalAnalyzer.h"
#include "gambit/core/comparison/TournamentSimulator.h"
#include "gambit/core/tournament/RoundManager.h"

#include <cstdint>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace {

using gambit::core::api::RunnerConfig;

constexpr const char* kUsage = "Usage: gambitcli [--parallel] [--threads N] [--seed N] <config.json>\n"
                               "       gambitcli --init <config.json>";

std::string FormatUtcTimestamp(std::time_t timestamp) {
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &timestamp);
#else
    gmtime_r(&timestamp, &utc);
#endif
    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

bool ParseInt(const std::string& text, int& value) {
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

int main(int argc, char** argv) {
    bool parallel = false;
    bool init = false;
    int threads = 0;
    int seed = -1;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--parallel") {
            parallel = true;
        } else if (arg == "--init") {
            init = true;
        } else if ((arg == "--threads" || arg == "--seed") && i + 1 < argc) {
            int value = 0;
            if (!ParseInt(argv[++i], value) || value < (arg == "--threads" ? 1 : 0)) {
                std::cerr << "[gambitcli] Invalid value for " << arg << ": " << argv[i] << '\n';
                return 1;
            }
            (arg == "--threads" ? threads : seed) = value;
        } else if (config_path.empty()) {
            config_path = arg;
        }
    }

    if (config_path.empty()) {
        std::cerr << kUsage << '\n';
        return 1;
    }

    gambit::core::EngineError error;
    if (init) {
        if (!RunnerConfig::SaveToFile(config_path, RunnerConfig{}, &error)) {
            std::cerr << "[gambitcli] " << gambit::core::Describe(error) << '\n';
            return 1;
        }
        std::cout << "[gambitcli] Wrote default config to " << config_path << '\n';
        return 0;
    }

    std::cout << "[gambitcli] Runner config: " << config_path << '\n';
    RunnerConfig runner_config;
    if (!RunnerConfig::LoadFromFile(config_path, runner_config, &error)) {
        std::cerr << "[gambitcli] " << gambit::core::Describe(error) << '\n';
        return 1;
    }
    if (parallel) {
        runner_config.comparison.parallel = true;
    }
    if (threads > 0) {
        runner_config.simulation.threads = threads;
    }
    if (seed >= 0) {
        runner_config.simulation.seed = static_cast<std::uint32_t>(seed);
    }

    std::mutex log_mutex;
    auto log = [&log_mutex](const std::string& line) {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::cout << line << '\n';
    };

    const auto engine_a = gambit::core::tournament::MakePairingEngine(runner_config.comparison.engine_a);
    const auto engine_b = gambit::core::tournament::MakePairingEngine(runner_config.comparison.engine_b);
    if (!engine_a || !engine_b) {
        std::cerr << "[gambitcli] Unknown pairing engine in config." << '\n';
        return 1;
    }

    gambit::core::comparison::ComparisonOptions comparison;
    comparison.parallel = runner_config.comparison.parallel;
    comparison.weights.fide = runner_config.comparison.fide_weight;
    comparison.weights.quality = runner_config.comparison.quality_weight;
    comparison.tie_margin = runner_config.comparison.tie_margin;

    const auto& sim = runner_config.simulation;
    gambit::core::comparison::SimulationOptions options;
    options.tournaments = sim.tournaments;
    options.min_players = sim.min_players;
    options.max_players = sim.max_players;
    options.rounds = sim.rounds;
    options.seed = sim.seed;
    options.threads = sim.threads;
    options.draw_rate = sim.draw_rate;
    options.min_rating = sim.min_rating;
    options.max_rating = sim.max_rating;

    std::cout << "[gambitcli] Comparing " << engine_a->name() << " against " << engine_b->name() << " over "
              << options.tournaments << " tournaments (" << options.threads << " threads)" << '\n';

    const gambit::core::comparison::TournamentSimulator simulator(options, runner_config.tournament, comparison, log);
    const auto tournaments = simulator.Run(*engine_a, *engine_b);
    const auto rounds = gambit::core::comparison::CollectRounds(tournaments);
    gambit::core::comparison::AnalyzerOptions analysis;
    analysis.min_significance_samples = runner_config.comparison.min_significance_samples;
    const auto summary = gambit::core::comparison::StatisticalAnalyzer::Summarize(rounds, analysis);

    int stopped = 0;
    for (const auto& tournament : tournaments) {
        if (tournament.stopped_by) {
            ++stopped;
        }
    }
    if (stopped > 0) {
        std::cerr << "[gambitcli] " << stopped << " tournament(s) stopped early." << '\n';
    }

    gambit::core::comparison::ReportMetadata metadata;
    metadata.generated_at = FormatUtcTimestamp(std::time(nullptr));
    metadata.tournaments = options.tournaments;
    metadata.seed = options.seed;
    metadata.weights = comparison.weights;
    metadata.tie_margin = comparison.tie_margin;

    if (!gambit::core::comparison::Reporter::WriteReports(runner_config.output.report_json,
                                                           runner_config.output.report_text,
                                                           summary,
                                                           rounds,
                                                           metadata,
                                                           &error)) {
        std::cerr << "[gambitcli] " << gambit::core::Describe(error) << '\n';
        return 1;
    }

    std::cout << gambit::core::comparison::Reporter::FormatText(summary, metadata);
    std::cout << "[gambitcli] Reports written to " << runner_config.output.report_json << " and "
              << runner_config.output.report_text << '\n';
    return 0;
}
