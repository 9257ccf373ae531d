// odx/analysis/report_printer.cpp - Console rendering of gap analysis reports
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "odx/analysis/report_printer.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace odx
{

namespace
{

constexpr size_t k_rule_width = 80;
constexpr size_t k_simple_limit = 5;
constexpr size_t k_complex_limit = 10;

}  // namespace

ReportPrinter::ReportPrinter(std::ostream & os, bool use_color, size_t top_shapes)
: os_(os), use_color_(use_color), top_shapes_(top_shapes)
{
}

template <typename Style>
void ReportPrinter::style(Style s)
{
  if (use_color_) {
    os_ << s;
  }
}

void ReportPrinter::rule(char c) { fmt::print(os_, "{}\n", std::string(k_rule_width, c)); }

void ReportPrinter::heading(const char * title, char c)
{
  fmt::print(os_, "\n");
  rule(c);
  fmt::print(os_, "{}\n", title);
  rule(c);
}

// ============================================================================
// Full report
// ============================================================================

void ReportPrinter::print(const GapAnalysisReport & report)
{
  print_summary(report);
  print_patterns(report);
  print_top_shapes(report);
  print_unsupported(report);
  print_recommendations(report);
  print_complexity(report);
  fmt::print(os_, "\n");
  rule('=');
}

void ReportPrinter::print_summary(const GapAnalysisReport & report)
{
  heading("ANALYSIS SUMMARY", '=');
  fmt::print(os_, "Total files analyzed: {}\n", report.total_files);
  fmt::print(os_, "Successfully parsed: {}\n", report.parsed_files);
  fmt::print(os_, "Failed to parse: {}\n", report.failed_files);
  fmt::print(os_, "Parse success rate: {:.1f}%\n", report.success_rate());
  if (report.cancelled) {
    style(rang::fg::yellow);
    os_ << "Analysis cancelled before all files were processed";
    style(rang::style::reset);
    os_ << "\n";
  }
}

void ReportPrinter::print_patterns(const GapAnalysisReport & report)
{
  heading("PATTERN DETECTION", '-');
  fmt::print(os_, "Correlation Sets: {} files\n", report.files_with_correlation.size());
  fmt::print(os_, "Dynamic Ports: {} files\n", report.files_with_dynamic_ports.size());
  fmt::print(os_, "Transactions: {} files\n", report.files_with_transactions.size());
  fmt::print(os_, "Business Rules: {} files\n", report.files_with_business_rules.size());
  fmt::print(os_, "Compensation: {} files\n", report.files_with_compensation.size());
  fmt::print(os_, "Convoy Pattern: {} files\n", report.files_with_convoy.size());

  heading("DESIGN PATTERNS", '-');
  fmt::print(os_, "Aggregator: {} files\n", report.files_with_aggregator.size());
  fmt::print(
    os_, "Content-Based Routing: {} files\n", report.files_with_content_based_routing.size());
  fmt::print(os_, "Scatter-Gather: {} files\n", report.files_with_scatter_gather.size());
  fmt::print(os_, "Message Broker: {} files\n", report.files_with_message_broker.size());
}

void ReportPrinter::print_top_shapes(const GapAnalysisReport & report)
{
  heading(fmt::format("TOP {} SHAPE TYPES BY FREQUENCY", top_shapes_).c_str(), '-');

  const auto sorted = report.shape_type_frequency.by_frequency();
  const size_t n = std::min(top_shapes_, sorted.size());
  for (size_t i = 0; i < n; ++i) {
    const auto & [type, count] = sorted[i];
    const bool supported = is_supported_shape(type);
    style(supported ? rang::fg::green : rang::fg::red);
    os_ << (supported ? "✓" : "✗");
    style(rang::style::reset);
    fmt::print(
      os_, " {:<30} {:>5} occurrences{}\n", type, count,
      is_partially_supported_shape(type) ? " (partial)" : "");
  }
}

void ReportPrinter::print_unsupported(const GapAnalysisReport & report)
{
  if (report.unsupported_shape_frequency.empty()) {
    return;
  }
  fmt::print(os_, "\n");
  rule('-');
  style(rang::fg::yellow);
  os_ << "UNSUPPORTED SHAPES";
  style(rang::style::reset);
  os_ << "\n";
  rule('-');

  for (const auto & [type, count] : report.unsupported_shape_frequency.by_frequency()) {
    std::string examples;
    if (const auto * list = report.examples_for(type)) {
      examples = fmt::format("{}", fmt::join(*list, ", "));
    }
    fmt::print(os_, "✗ {:<30} {:>5} occurrences\n", type, count);
    fmt::print(os_, "  Examples: {}\n", examples);
  }
}

void ReportPrinter::print_recommendations(const GapAnalysisReport & report)
{
  if (report.recommendations.empty()) {
    return;
  }
  fmt::print(os_, "\n");
  rule('=');
  style(rang::fg::cyan);
  os_ << "RECOMMENDED FEATURES & ENHANCEMENTS";
  style(rang::style::reset);
  os_ << "\n";
  rule('=');

  for (const auto & feature : report.recommendations) {
    fmt::print(os_, "\n* {}\n", feature);
  }
}

void ReportPrinter::print_complexity(const GapAnalysisReport & report)
{
  heading("DETAILED FILE ANALYSIS", '=');

  std::vector<const AnalysisResult *> complex;
  size_t simple = 0;
  size_t medium = 0;
  for (const auto & f : report.file_details) {
    if (!f.parsed) {
      continue;
    }
    const size_t types = f.shape_types.size();
    if (types < k_simple_limit) {
      ++simple;
    } else if (types < k_complex_limit) {
      ++medium;
    } else {
      complex.push_back(&f);
    }
  }

  fmt::print(os_, "\nSimple orchestrations (< 5 shape types): {}\n", simple);
  fmt::print(os_, "Medium orchestrations (5-9 shape types): {}\n", medium);
  fmt::print(os_, "Complex orchestrations (10+ shape types): {}\n", complex.size());

  if (complex.empty()) {
    return;
  }

  std::stable_sort(complex.begin(), complex.end(), [](const auto * a, const auto * b) {
    return a->shape_types.size() > b->shape_types.size();
  });

  fmt::print(os_, "\nMost Complex Orchestrations:\n");
  const size_t n = std::min(k_most_complex, complex.size());
  for (size_t i = 0; i < n; ++i) {
    const auto & f = *complex[i];
    fmt::print(
      os_, "  * {} ({} shape types, {}KB)\n", f.file_name, f.shape_types.size(),
      f.file_size_bytes / 1024);
    if (!f.unsupported_shapes.empty()) {
      style(rang::fg::yellow);
      fmt::print(os_, "    Unsupported: {}", fmt::join(f.unsupported_shapes, ", "));
      style(rang::style::reset);
      os_ << "\n";
    }
  }
}

// ============================================================================
// Progress and receive patterns
// ============================================================================

void ReportPrinter::print_progress(const AnalysisResult & result)
{
  fmt::print(os_, "Analyzing {}... ", result.file_name);
  if (result.parsed) {
    style(rang::fg::green);
    fmt::print(os_, "✓ ({} shape types)", result.shape_types.size());
  } else {
    style(rang::fg::red);
    fmt::print(os_, "✗ {}", result.parse_error);
  }
  style(rang::style::reset);
  os_ << "\n";
}

void ReportPrinter::print_receive_pattern(
  const OrchestrationModel & model, const ReceivePatternAnalysis & analysis)
{
  fmt::print(os_, "Orchestration: {}\n", model.full_name());
  os_ << "Pattern: ";
  style(rang::style::bold);
  os_ << to_string(analysis.pattern);
  style(rang::style::reset);
  os_ << "\n";
  fmt::print(os_, "Receives: {}\n", analysis.total_receive_count());

  auto describe = [&](ShapeId id) {
    const Shape & s = model.shape(id);
    const auto * r = s.as<ReceivePayload>();
    return fmt::format("{} (port '{}')", s.name, r ? r->port_name : std::string());
  };
  if (analysis.primary_receive) {
    fmt::print(os_, "  Primary: {}\n", describe(*analysis.primary_receive));
  }
  for (ShapeId id : analysis.secondary_receives) {
    fmt::print(os_, "  Secondary: {}\n", describe(id));
  }

  if (analysis.requires_request_trigger) fmt::print(os_, "Requires request trigger\n");
  if (analysis.requires_session_support) fmt::print(os_, "Requires session support\n");
  if (analysis.requires_timeout_handling) fmt::print(os_, "Requires timeout handling\n");

  for (const auto & w : analysis.migration_warnings) {
    style(rang::fg::yellow);
    os_ << "warning: ";
    style(rang::style::reset);
    os_ << w << "\n";
  }
  if (!analysis.migration_error.empty()) {
    style(rang::fg::red);
    os_ << "error: ";
    style(rang::style::reset);
    os_ << analysis.migration_error << "\n";
  }
}

}  // namespace odx
