// odx/analysis/report_json.hpp - JSON serialization of analysis results
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>

#include "odx/analysis/gap_analyzer.hpp"
#include "odx/analysis/receive_pattern.hpp"

namespace odx
{

[[nodiscard]] nlohmann::json to_json(const AnalysisResult & result);

[[nodiscard]] nlohmann::json to_json(const GapAnalysisReport & report);

[[nodiscard]] nlohmann::json to_json(
  const OrchestrationModel & model, const ReceivePatternAnalysis & analysis);

/**
 * Write `report` as indented JSON.
 *
 * @throws OdxError IoError when the file cannot be written
 */
void save_report_json(const GapAnalysisReport & report, const std::filesystem::path & path);

}  // namespace odx
