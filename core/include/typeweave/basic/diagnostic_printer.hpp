// typeweave/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their subjects in a rustc-like layout.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "typeweave/basic/diagnostic.hpp"

namespace typeweave
{

/**
 * Prints diagnostics in rustc-like format.
 *
 * Produces output like:
 *   error[TW0102]: cyclic operator precedence: A -> B -> A
 *     --> A
 *      |
 *      = note: B: depends on A
 *      = help: remove one of the depends-on edges
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
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, errors first.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace typeweave
