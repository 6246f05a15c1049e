// qk_graph/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

#include "qk_graph/basic/diagnostic.hpp"
#include "qk_graph/basic/source_manager.hpp"

namespace qk_graph
{

/**
 * Renders diagnostics for a terminal, with the offending line underlined:
 *
 *   error[parse-error]: Syntax error at 5:23
 *        --> src/hooks/useTodos.ts:5:23
 *         |
 *       5 | const key = ['todos', ;
 *         |                       ^
 *         = note: file excluded from analysis
 *
 * Paths under the working directory are printed relative to it.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print run-level entries first, then the rest ordered by file and offset
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// Print a one-line progress message (`  > message`)
  void print_status(std::string_view message);

private:
  void print_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, const SourceRegistry & sources);
  void print_snippet(const SourceFile & file, const FullSourceRange & range);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string relative_to_cwd(const std::filesystem::path & path) const;
  [[nodiscard]] std::string gutter(std::string_view mark) const;

  std::ostream & os_;
  bool use_color_;
  std::filesystem::path cwd_;
};

}  // namespace qk_graph
