// odx/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "odx/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace odx
{

namespace
{

// Returns the 1-based line `line` of `text`, or an empty view when out of range.
std::string_view get_line(std::string_view text, uint32_t line)
{
  if (line == 0) {
    return {};
  }
  size_t pos = 0;
  for (uint32_t current = 1; current < line; ++current) {
    const size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      return {};
    }
    pos = nl + 1;
  }
  const size_t end = text.find('\n', pos);
  return text.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view xml_text)
{
  const std::string filename = diag.source.empty() ? "<unknown>" : diag.source;
  const uint32_t line = diag.primary_line();

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line ===
  if (line > 0) {
    fmt::print(os_, "{} {}:{}\n", gutter_arrow(), filename, line);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, xml_text);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view xml_text)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_line() < b.primary_line();
    });

  for (const auto & d : sorted_diags) {
    print(d, xml_text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string severity_str;
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
    case Severity::Info:
      severity_str = "info";
      break;
  }

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
    }
    os_ << severity_str;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, std::string_view xml_text)
{
  const std::string_view line = get_line(xml_text, label.line);
  if (line.empty()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  // Tabs become 4 spaces, trailing CR dropped
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  size_t indent = 0;
  bool leading = true;
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
      if (leading) indent += 4;
    } else if (c == ' ') {
      cleaned_line += c;
      if (leading) indent += 1;
    } else if (c != '\r') {
      cleaned_line += c;
      leading = false;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", label.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", label.line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  // Marker under the first non-blank character of the element line
  fmt::print(os_, "      {} {}", gutter_pipe_only(), std::string(indent, ' '));

  const char marker_char = (label.style == LabelStyle::Primary) ? '^' : '-';
  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", marker_char);
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace odx
