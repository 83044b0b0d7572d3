#pragma once

#include "gambit/core/Error.h"
#include "gambit/core/comparison/ComparisonEngine.h"
#include "gambit/core/comparison/StatisticalAnalyzer.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace gambit::core::comparison {

struct ReportMetadata {
    std::string title = "Pairing engine comparison";
    std::string generated_at;
    int tournaments = 0;
    std::uint32_t seed = 0;
    ScoreWeights weights;
    double tie_margin = 0.01;
};

class Reporter {
public:
    static nlohmann::json BuildJsonReport(const StatisticalSummary& summary,
                                          const std::vector<ComparisonResult>& results,
                                          const ReportMetadata& metadata);
    static std::string FormatText(const StatisticalSummary& summary, const ReportMetadata& metadata);

    // Writes whichever paths are non-empty, each atomically.
    static bool WriteReports(const std::string& json_path,
                             const std::string& text_path,
                             const StatisticalSummary& summary,
                             const std::vector<ComparisonResult>& results,
                             const ReportMetadata& metadata,
                             EngineError* error);
};

}  // namespace gambit::core::comparison
