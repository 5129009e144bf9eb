// xmas/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information and caret
// markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "xmas/basic/diagnostic.hpp"
#include "xmas/basic/source_manager.hpp"

namespace xmas
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0001]: Expected ')' after arguments
 *     --> day01.xmas:3:14
 *      |
 *    3 | total = add(1, 2
 *      |                 ^
 *      |
 *      = help: ...
 *
 * Diagnostics without a valid range print only the header line (and the help
 * or note lines, if any).
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to emit terminal colours through rang
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & source);

  void print_source_line(
    const SourceManager & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace xmas
