#include "gambit/core/api/RunnerConfig.h"

#include "gambit/core/persist/Serialization.h"
#include "gambit/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace gambit::core::api {

namespace {

bool IsKnownEngine(const std::string& name) {
    return name == "gambit" || name == "reference" || name == "round_robin";
}

bool Validate(const RunnerConfig& config, EngineError* error) {
    const auto& sim = config.simulation;
    if (!IsKnownEngine(config.comparison.engine_a) || !IsKnownEngine(config.comparison.engine_b)) {
        return Fail(error, ErrorKind::kInvalidConfig,
                    "Unknown pairing engine: " +
                        (IsKnownEngine(config.comparison.engine_a) ? config.comparison.engine_b
                                                                   : config.comparison.engine_a));
    }
    if (config.comparison.fide_weight < 0.0 || config.comparison.quality_weight < 0.0 ||
        config.comparison.fide_weight + config.comparison.quality_weight <= 0.0) {
        return Fail(error, ErrorKind::kInvalidConfig, "Score weights must be non-negative and not both zero");
    }
    if (config.comparison.min_significance_samples < 1) {
        return Fail(error, ErrorKind::kInvalidConfig, "comparison.min_significance_samples must be positive");
    }
    if (sim.tournaments < 1 || sim.rounds < 1 || sim.threads < 1) {
        return Fail(error, ErrorKind::kInvalidConfig, "simulation.tournaments, rounds and threads must be positive");
    }
    if (sim.min_players < 2 || sim.max_players < sim.min_players) {
        return Fail(error, ErrorKind::kInvalidConfig, "simulation player range is invalid");
    }
    if (sim.min_rating > sim.max_rating) {
        return Fail(error, ErrorKind::kInvalidConfig, "simulation rating range is invalid");
    }
    if (sim.draw_rate < 0.0 || sim.draw_rate > 1.0) {
        return Fail(error, ErrorKind::kInvalidConfig, "simulation.draw_rate must be within [0, 1]");
    }
    return true;
}

nlohmann::json BuildJson(const RunnerConfig& config) {
    nlohmann::json root;
    root["tournament"] = persist::ToJson(config.tournament);
    root["comparison"] = {
        {"engine_a", config.comparison.engine_a},
        {"engine_b", config.comparison.engine_b},
        {"fide_weight", config.comparison.fide_weight},
        {"quality_weight", config.comparison.quality_weight},
        {"tie_margin", config.comparison.tie_margin},
        {"parallel", config.comparison.parallel},
        {"min_significance_samples", config.comparison.min_significance_samples},
    };
    root["simulation"] = {
        {"tournaments", config.simulation.tournaments},
        {"min_players", config.simulation.min_players},
        {"max_players", config.simulation.max_players},
        {"rounds", config.simulation.rounds},
        {"seed", config.simulation.seed},
        {"threads", config.simulation.threads},
        {"draw_rate", config.simulation.draw_rate},
        {"min_rating", config.simulation.min_rating},
        {"max_rating", config.simulation.max_rating},
    };
    root["output"] = {
        {"report_json", config.output.report_json},
        {"report_text", config.output.report_text},
    };
    return root;
}

bool ParseRoot(const nlohmann::json& root, RunnerConfig& config, EngineError* error) {
    RunnerConfig parsed;
    if (root.contains("tournament")) {
        if (!persist::FromJson(root.at("tournament"), parsed.tournament, error)) {
            return false;
        }
    }

    try {
        if (root.contains("comparison")) {
            const auto& node = root.at("comparison");
            parsed.comparison.engine_a = node.value("engine_a", parsed.comparison.engine_a);
            parsed.comparison.engine_b = node.value("engine_b", parsed.comparison.engine_b);
            parsed.comparison.fide_weight = node.value("fide_weight", parsed.comparison.fide_weight);
            parsed.comparison.quality_weight = node.value("quality_weight", parsed.comparison.quality_weight);
            parsed.comparison.tie_margin = node.value("tie_margin", parsed.comparison.tie_margin);
            parsed.comparison.parallel = node.value("parallel", parsed.comparison.parallel);
            parsed.comparison.min_significance_samples =
                node.value("min_significance_samples", parsed.comparison.min_significance_samples);
        }

        if (root.contains("simulation")) {
            const auto& node = root.at("simulation");
            parsed.simulation.tournaments = node.value("tournaments", parsed.simulation.tournaments);
            parsed.simulation.min_players = node.value("min_players", parsed.simulation.min_players);
            parsed.simulation.max_players = node.value("max_players", parsed.simulation.max_players);
            parsed.simulation.rounds = node.value("rounds", parsed.simulation.rounds);
            parsed.simulation.seed = node.value("seed", parsed.simulation.seed);
            parsed.simulation.threads = node.value("threads", parsed.simulation.threads);
            parsed.simulation.draw_rate = node.value("draw_rate", parsed.simulation.draw_rate);
            parsed.simulation.min_rating = node.value("min_rating", parsed.simulation.min_rating);
            parsed.simulation.max_rating = node.value("max_rating", parsed.simulation.max_rating);
        }

        if (root.contains("output")) {
            const auto& node = root.at("output");
            parsed.output.report_json = node.value("report_json", parsed.output.report_json);
            parsed.output.report_text = node.value("report_text", parsed.output.report_text);
        }
    } catch (const std::exception& ex) {
        return Fail(error, ErrorKind::kInvalidConfig, std::string("Malformed config: ") + ex.what());
    }

    if (!Validate(parsed, error)) {
        return false;
    }
    config = std::move(parsed);
    return true;
}

}  // namespace

bool RunnerConfig::LoadFromFile(const std::string& path, RunnerConfig& config, EngineError* error) {
    std::ifstream input(path);
    if (!input) {
        return Fail(error, ErrorKind::kInvalidConfig, "Failed to open config: " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return LoadFromString(buffer.str(), config, error);
}

bool RunnerConfig::LoadFromString(const std::string& text, RunnerConfig& config, EngineError* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        return Fail(error, ErrorKind::kInvalidConfig, std::string("Failed to parse JSON: ") + ex.what());
    }
    if (!root.is_object()) {
        return Fail(error, ErrorKind::kInvalidConfig, "Config root must be a JSON object");
    }
    return ParseRoot(root, config, error);
}

bool RunnerConfig::SaveToFile(const std::string& path, const RunnerConfig& config, EngineError* error) {
    std::string write_error;
    if (!util::AtomicFileWriter::Write(path, BuildJson(config).dump(2), &write_error)) {
        return Fail(error, ErrorKind::kIoError, "Failed to write config: " + write_error);
    }
    return true;
}

std::string RunnerConfig::ToJsonString(const RunnerConfig& config) {
    return BuildJson(config).dump(2);
}

}  // namespace gambit::core::api
