// ripple/basic/diagnostic_printer.hpp
//
// Prints diagnostics with YAML source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "ripple/basic/diagnostic.hpp"
#include "ripple/basic/source_manager.hpp"

namespace ripple
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0102]: 'expectedImpact.Billing' must be a number
 *     --> change.yaml:7:12
 *      |
 *    7 |   Billing: high
 *      |            ^^^^ expected a score in [0, 1]
 *      |
 *      = help: use a value such as 0.5
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
   * Source context is resolved via SourceRegistry and the diagnostic labels.
   * Diagnostics without a location are printed as a header plus notes.
   */
  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /**
   * Print all diagnostics from a DiagnosticBag, in the order they were reported.
   */
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceDocument & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace ripple
