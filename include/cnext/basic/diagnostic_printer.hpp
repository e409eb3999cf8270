// cnext/basic/diagnostic_printer.hpp
//
// Human-readable diagnostic output with source excerpts.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "cnext/basic/diagnostic.hpp"
#include "cnext/basic/source_manager.hpp"

namespace cnext
{

/**
 * Prints diagnostics in a compiler-style format:
 *
 *   error[E0381]: use of possibly uninitialized variable 'x'
 *     --> src/main.cnx:5:12
 *      |
 *    5 |     u32 y <- x + 1;
 *      |              ^ 'x' declared here without a value
 *      |
 *      = help: initialize 'x' at its declaration
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Prints every diagnostic ordered by file, then offset (stable).
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// One-line summary such as "2 errors, 1 warning".
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceRegistry & sources);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_fixit(const FixIt & fixit, const SourceRegistry & sources);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

/// Display path for a file: relative to the working directory when possible.
[[nodiscard]] std::string display_path(const fs::path & path);

}  // namespace cnext
