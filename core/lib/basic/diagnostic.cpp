// odx/basic/diagnostic.cpp - Diagnostic implementation
#include "odx/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace odx
{

namespace
{

Diagnostic make_diagnostic(
  Severity severity, uint32_t line, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{line, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

uint32_t Diagnostic::primary_line() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return 0;
  }
  return l->line;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_source(std::string source)
{
  diagnostic_.source = std::move(source);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(uint32_t line, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{line, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(uint32_t line, std::string msg)
{
  return with_label(line, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  uint32_t line, std::string message, std::string label_message)
{
  return {*this, make_diagnostic(Severity::Error, line, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  uint32_t line, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(Severity::Warning, line, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_info(
  uint32_t line, std::string message, std::string label_message)
{
  return {*this, make_diagnostic(Severity::Info, line, std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

}  // namespace odx
