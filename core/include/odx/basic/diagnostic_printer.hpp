// odx/basic/diagnostic_printer.hpp
//
// Prints diagnostics with the offending line of the embedded XML document
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "odx/basic/diagnostic.hpp"

namespace odx
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[L002]: skipped service-level variable declaration
 *     --> Orders.odx:42
 *      |
 *   42 | <om:Element Type="VariableDeclaration" OID="...">
 *      | ^ missing variable name
 *      |
 *      = help: give the variable a Name property
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * @param xml_text The XML document the label lines refer to. May be empty,
   *                 in which case only the location is printed.
   */
  void print(const Diagnostic & diag, std::string_view xml_text = {});

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by line.
   */
  void print_all(const DiagnosticBag & diags, std::string_view xml_text = {});

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, std::string_view xml_text);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace odx
