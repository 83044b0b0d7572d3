#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/tournament/TournamentConfig.h"

#include <cstdint>
#include <string>

namespace gambit::core::api {

struct ComparisonConfig {
    std::string engine_a = "gambit";
    std::string engine_b = "reference";
    double fide_weight = 0.7;
    double quality_weight = 0.3;
    double tie_margin = 0.01;
    bool parallel = false;
    int min_significance_samples = 30;
};

struct SimulationConfig {
    int tournaments = 10;
    int min_players = 8;
    int max_players = 24;
    int rounds = 5;
    std::uint32_t seed = 42;
    int threads = 1;
    double draw_rate = 0.3;
    int min_rating = 1200;
    int max_rating = 2600;
};

struct OutputConfig {
    std::string report_json = "out/comparison.json";
    std::string report_text = "out/comparison.txt";
};

struct RunnerConfig {
    tournament::TournamentConfig tournament;
    ComparisonConfig comparison;
    SimulationConfig simulation;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, RunnerConfig& config, EngineError* error);
    static bool LoadFromString(const std::string& text, RunnerConfig& config, EngineError* error);
    static bool SaveToFile(const std::string& path, const RunnerConfig& config, EngineError* error);
    static std::string ToJsonString(const RunnerConfig& config);
};

}  // namespace gambit::core::api
