// crusty/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "crusty/basic/diagnostic.hpp"
#include "crusty/basic/source_manager.hpp"

namespace crusty
{

[[nodiscard]] const char * to_string(Severity severity) noexcept;

/**
 * Prints diagnostics of one compilation unit in Rust-style format.
 *
 * Produces output like:
 *   error[E0101]: undefined type 'Foo'
 *     --> src/main.crst:5:12
 *      |
 *    5 | Foo x = make();
 *      | ^^^ not declared in this unit
 *      |
 *      = help: declare it with typedef, struct or enum
 */
class DiagnosticPrinter
{
public:
  DiagnosticPrinter(std::ostream & os, const SourceManager & source, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Print every diagnostic, ordered by primary location.
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label);
  void print_source_line(
    uint32_t line_index, uint32_t start_col, uint32_t end_col, LabelStyle style,
    std::string_view label_message);
  void print_fixit(const FixIt & fixit);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  const SourceManager & source_;
  bool use_color_;
};

}  // namespace crusty
