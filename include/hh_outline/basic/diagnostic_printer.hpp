// hh_outline/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "hh_outline/basic/diagnostic.hpp"
#include "hh_outline/basic/source_manager.hpp"

namespace hh_outline
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[P1001]: expected ';' after property declaration
 *     --> src/Foo.php:5:12
 *      |
 *    5 |   public int $x
 *      |                ^ expected `;`
 *      |
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print all diagnostics ordered by their primary location.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceFile & source);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceFile & source);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace hh_outline
