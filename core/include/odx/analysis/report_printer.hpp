// odx/analysis/report_printer.hpp - Console rendering of gap analysis reports
//
#pragma once

#include <cstddef>
#include <iosfwd>

#include "odx/analysis/gap_analyzer.hpp"
#include "odx/analysis/receive_pattern.hpp"

namespace odx
{

/**
 * Prints analysis results to a terminal.
 *
 * Colors are written only when `use_color` is set; the printer never changes
 * rang's process-wide control mode.
 *
 * Sections, in order: analysis summary, pattern detection, design patterns,
 * top-N shape types by frequency, unsupported shapes with example files,
 * recommendations, and the complexity breakdown with the ten most complex
 * files.
 */
class ReportPrinter
{
public:
  static constexpr size_t k_default_top_shapes = 20;
  static constexpr size_t k_most_complex = 10;

  explicit ReportPrinter(
    std::ostream & os, bool use_color = true, size_t top_shapes = k_default_top_shapes);

  /// Print the full report
  void print(const GapAnalysisReport & report);

  /// One progress line for a file: "Analyzing X... ✓ (N shape types)"
  void print_progress(const AnalysisResult & result);

  /// Receive-pattern summary for one model
  void print_receive_pattern(
    const OrchestrationModel & model, const ReceivePatternAnalysis & analysis);

private:
  void print_summary(const GapAnalysisReport & report);
  void print_patterns(const GapAnalysisReport & report);
  void print_top_shapes(const GapAnalysisReport & report);
  void print_unsupported(const GapAnalysisReport & report);
  void print_recommendations(const GapAnalysisReport & report);
  void print_complexity(const GapAnalysisReport & report);

  void rule(char c);
  void heading(const char * title, char c);

  /// Write a rang color or style, only when colors are enabled
  template <typename Style>
  void style(Style s);

  std::ostream & os_;
  bool use_color_;
  size_t top_shapes_;
};

}  // namespace odx
