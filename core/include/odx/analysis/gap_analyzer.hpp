// odx/analysis/gap_analyzer.hpp - Pattern and gap analysis of orchestrations
//
// Classifies the migration risk of finished shape trees: which shape types
// occur, which of them have no counterpart in the target engine, which
// integration features and design patterns a file relies on. Results are
// collected per file and aggregated per directory.
//
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "odx/basic/diagnostic.hpp"
#include "odx/model/orchestration.hpp"

namespace odx
{

// ============================================================================
// FrequencyTable
// ============================================================================

/**
 * Counter keyed by string that remembers first-seen order.
 *
 * Sorting by frequency is stable, so ties keep first-seen order.
 */
class FrequencyTable
{
public:
  using Entry = std::pair<std::string, int>;

  void add(const std::string & key, int n = 1);

  [[nodiscard]] int count(std::string_view key) const;
  [[nodiscard]] bool contains(std::string_view key) const;
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

  /// Entries in first-seen order
  [[nodiscard]] const std::vector<Entry> & entries() const noexcept { return entries_; }

  /// Entries by descending count
  [[nodiscard]] std::vector<Entry> by_frequency() const;

private:
  std::vector<Entry> entries_;
};

// ============================================================================
// Shape support
// ============================================================================

/// True when the target engine can express the shape type (case-insensitive)
[[nodiscard]] bool is_supported_shape(std::string_view shape_type);

/// True for supported types that still need manual review (case-insensitive)
[[nodiscard]] bool is_partially_supported_shape(std::string_view shape_type);

// ============================================================================
// AnalysisResult
// ============================================================================

/// Analysis of one orchestration file
struct AnalysisResult
{
  std::string file_name;
  uintmax_t file_size_bytes = 0;
  bool parsed = false;
  std::string parse_error;

  std::vector<std::string> shape_types;  // distinct, first-seen order
  FrequencyTable shape_type_counts;
  std::vector<std::string> unsupported_shapes;
  std::vector<std::string> partially_supported_shapes;
  std::vector<std::string> warnings;

  // Features
  bool has_correlation_sets = false;
  bool has_dynamic_ports = false;
  bool has_transactions = false;
  bool has_exception_handling = false;
  bool has_business_rules = false;
  bool has_compensation = false;
  bool has_loops = false;
  bool has_parallel = false;
  bool has_listen = false;
  bool has_delay = false;
  bool has_call_orchestration = false;
  bool has_transform = false;
  bool has_solicit_response = false;
  bool has_convoy = false;

  int port_count = 0;
  int message_count = 0;
  int correlation_set_count = 0;

  // Design patterns
  bool has_aggregator = false;
  bool has_content_based_routing = false;
  bool has_scatter_gather = false;
  bool has_message_broker = false;
};

// ============================================================================
// GapAnalysisReport
// ============================================================================

/// Aggregated analysis of a set of files
struct GapAnalysisReport
{
  std::string directory;
  int total_files = 0;
  int parsed_files = 0;
  int failed_files = 0;
  bool cancelled = false;

  FrequencyTable shape_type_frequency;
  FrequencyTable unsupported_shape_frequency;
  /// Up to k_max_examples file names per unsupported type
  std::vector<std::pair<std::string, std::vector<std::string>>> unsupported_shape_examples;

  std::vector<std::string> files_with_correlation;
  std::vector<std::string> files_with_dynamic_ports;
  std::vector<std::string> files_with_transactions;
  std::vector<std::string> files_with_business_rules;
  std::vector<std::string> files_with_compensation;
  std::vector<std::string> files_with_convoy;
  std::vector<std::string> files_with_aggregator;
  std::vector<std::string> files_with_content_based_routing;
  std::vector<std::string> files_with_scatter_gather;
  std::vector<std::string> files_with_message_broker;

  std::vector<std::string> recommendations;
  std::vector<AnalysisResult> file_details;

  static constexpr size_t k_max_examples = 3;

  [[nodiscard]] const std::vector<std::string> * examples_for(std::string_view shape_type) const;

  /// Percentage of parsed files, 0 when nothing was analyzed
  [[nodiscard]] double success_rate() const;
};

// ============================================================================
// Entry points
// ============================================================================

struct DirectoryScanOptions
{
  std::vector<std::string> extensions{".odx"};
  bool recursive = false;
  /// Checked between files; the scan stops early when it becomes true
  const std::atomic<bool> * cancel = nullptr;

  /// Called once with the number of matching files, before any is analyzed
  std::function<void(size_t)> on_files_found;
  /// Called after each file is analyzed, before it joins the report
  std::function<void(const AnalysisResult &)> on_file;
};

/**
 * Analyze a loaded model.
 *
 * Fills every field of `result` except file name, size and parse status.
 */
void analyze_model(const OrchestrationModel & model, AnalysisResult & result);

/**
 * Load and analyze one file.
 *
 * Never throws for file-level problems: a failure yields `parsed == false`
 * and the error message.
 */
[[nodiscard]] AnalysisResult analyze_file(
  const std::filesystem::path & path, DiagnosticBag * diags = nullptr);

/// Add a per-file result to the aggregate counters of `report`
void accumulate(GapAnalysisReport & report, AnalysisResult result);

/// Rebuild `report.recommendations` from the aggregate counters
void generate_recommendations(GapAnalysisReport & report);

/**
 * Sorted list of files below `dir` matching the configured extensions.
 *
 * @throws OdxError IoError when `dir` is not a readable directory
 */
[[nodiscard]] std::vector<std::filesystem::path> list_orchestration_files(
  const std::filesystem::path & dir, const DirectoryScanOptions & options);

/**
 * Analyze every matching file of a directory.
 *
 * @throws OdxError IoError when `dir` is not a readable directory
 */
[[nodiscard]] GapAnalysisReport analyze_directory(
  const std::filesystem::path & dir, const DirectoryScanOptions & options = {},
  DiagnosticBag * diags = nullptr);

}  // namespace odx
