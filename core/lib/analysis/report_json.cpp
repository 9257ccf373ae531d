// odx/analysis/report_json.cpp - JSON serialization of analysis results
//
#include "odx/analysis/report_json.hpp"

#include <fstream>
#include <string>

#include "odx/basic/error.hpp"

namespace odx
{
namespace
{

using nlohmann::json;

json j_table(const FrequencyTable & table)
{
  json j = json::object();
  for (const auto & [key, n] : table.entries()) {
    j[key] = n;
  }
  return j;
}

}  // namespace

json to_json(const AnalysisResult & r)
{
  json j{
    {"fileName", r.file_name},
    {"fileSizeBytes", r.file_size_bytes},
    {"parsedSuccessfully", r.parsed}};
  if (!r.parsed) {
    j["parseError"] = r.parse_error;
    return j;
  }

  j["shapeTypes"] = r.shape_types;
  j["shapeTypeCounts"] = j_table(r.shape_type_counts);
  j["unsupportedShapes"] = r.unsupported_shapes;
  j["partiallySupportedShapes"] = r.partially_supported_shapes;
  j["warnings"] = r.warnings;

  j["features"] = json{
    {"correlationSets", r.has_correlation_sets},
    {"dynamicPorts", r.has_dynamic_ports},
    {"transactions", r.has_transactions},
    {"exceptionHandling", r.has_exception_handling},
    {"businessRules", r.has_business_rules},
    {"compensation", r.has_compensation},
    {"loops", r.has_loops},
    {"parallel", r.has_parallel},
    {"listen", r.has_listen},
    {"delay", r.has_delay},
    {"callOrchestration", r.has_call_orchestration},
    {"transform", r.has_transform},
    {"solicitResponse", r.has_solicit_response},
    {"convoy", r.has_convoy}};

  j["patterns"] = json{
    {"aggregator", r.has_aggregator},
    {"contentBasedRouting", r.has_content_based_routing},
    {"scatterGather", r.has_scatter_gather},
    {"messageBroker", r.has_message_broker}};

  j["portCount"] = r.port_count;
  j["messageCount"] = r.message_count;
  j["correlationSetCount"] = r.correlation_set_count;
  return j;
}

json to_json(const GapAnalysisReport & report)
{
  json examples = json::object();
  for (const auto & [type, files] : report.unsupported_shape_examples) {
    examples[type] = files;
  }

  json details = json::array();
  for (const auto & f : report.file_details) {
    details.push_back(to_json(f));
  }

  return json{
    {"directory", report.directory},
    {"totalFilesAnalyzed", report.total_files},
    {"successfullyParsed", report.parsed_files},
    {"failedToParse", report.failed_files},
    {"cancelled", report.cancelled},
    {"shapeTypeFrequency", j_table(report.shape_type_frequency)},
    {"unsupportedShapeFrequency", j_table(report.unsupported_shape_frequency)},
    {"unsupportedShapeExamples", std::move(examples)},
    {"filesWithCorrelation", report.files_with_correlation},
    {"filesWithDynamicPorts", report.files_with_dynamic_ports},
    {"filesWithTransactions", report.files_with_transactions},
    {"filesWithBusinessRules", report.files_with_business_rules},
    {"filesWithCompensation", report.files_with_compensation},
    {"filesWithConvoy", report.files_with_convoy},
    {"filesWithAggregator", report.files_with_aggregator},
    {"filesWithContentBasedRouting", report.files_with_content_based_routing},
    {"filesWithScatterGather", report.files_with_scatter_gather},
    {"filesWithMessageBroker", report.files_with_message_broker},
    {"recommendedFeatures", report.recommendations},
    {"fileDetails", std::move(details)}};
}

json to_json(const OrchestrationModel & model, const ReceivePatternAnalysis & analysis)
{
  auto name_of = [&](ShapeId id) { return model.shape(id).name; };

  json secondary = json::array();
  for (ShapeId id : analysis.secondary_receives) {
    secondary.push_back(name_of(id));
  }

  json j{
    {"orchestration", model.full_name()},
    {"pattern", std::string(to_string(analysis.pattern))},
    {"valid", analysis.is_valid()},
    {"totalReceiveCount", analysis.total_receive_count()},
    {"secondaryReceives", std::move(secondary)},
    {"requiresSessionSupport", analysis.requires_session_support},
    {"requiresRequestTrigger", analysis.requires_request_trigger},
    {"requiresTimeoutHandling", analysis.requires_timeout_handling},
    {"migrationWarnings", analysis.migration_warnings}};
  j["primaryReceive"] =
    analysis.primary_receive ? json(name_of(*analysis.primary_receive)) : json(nullptr);
  if (!analysis.migration_error.empty()) {
    j["migrationError"] = analysis.migration_error;
  }
  return j;
}

void save_report_json(const GapAnalysisReport & report, const std::filesystem::path & path)
{
  std::ofstream out(path);
  if (!out) {
    throw OdxError(ErrorKind::IoError, "Cannot write report: " + path.string());
  }
  out << to_json(report).dump(2) << "\n";
  if (!out) {
    throw OdxError(ErrorKind::IoError, "Failed writing report: " + path.string());
  }
}

}  // namespace odx
