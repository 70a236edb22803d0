// ivl/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "ivl/basic/diagnostic.hpp"
#include "ivl/basic/source_manager.hpp"

namespace ivl
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error: undeclared identifier: y
 *     --> loop.bpl:5:12
 *      |
 *    5 |   x := y + 1;
 *      |        ^ not found in this scope
 *      |
 *      = help: declare 'y' as a local or global variable
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print all diagnostics sorted by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

  /// One-line summary ("2 errors, 1 warning").
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceManager & source);
  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_note(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace ivl
