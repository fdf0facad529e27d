// scopelink/basic/diagnostic_printer.hpp
//
// Prints diagnostics in a compact Rust-like format:
//
//   error[missingReference]: cannot resolve 'Animl'
//     --> app.json
//      |
//      = note: in app.Dog
//      = help: check the imports of the enclosing package
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "scopelink/basic/diagnostic.hpp"

namespace scopelink
{

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

  void print(const Diagnostic & diag);

  /// Print all diagnostics, errors first, keeping report order otherwise.
  void print_all(const DiagnosticBag & diags);

  /// One-line summary such as "2 errors, 1 warning"
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace scopelink
