// qk_graph/basic/diagnostic.hpp - Problems found while scanning, parsing and analyzing
//
// Diagnostics are the only user-visible failure channel of an analysis run.
// Parse failures and configuration problems land here; unresolved references
// never do (they degrade to dynamic key segments instead).
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "qk_graph/basic/source_manager.hpp"

namespace qk_graph
{

enum class Severity : uint8_t {
  Error,
  Warning,
  Note,  // Verbose progress, never affects the exit status
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "parse-error"
  std::string message;

  /// Offending source text; invalid for file- or run-level problems
  SourceRange range;
  /// File the problem concerns when no range is available
  std::string path;

  std::vector<std::string> notes;
  std::optional<std::string> help;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Chained setters for a diagnostic under construction.
 *
 * The diagnostic is appended to its bag when the builder goes out of scope,
 * so `bag.report_error(...).with_code("x");` records a complete entry.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_path(std::string path);
  DiagnosticBuilder & with_note(std::string note);
  DiagnosticBuilder & with_help(std::string help);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBuilder report(Severity severity, SourceRange range, std::string message);
  DiagnosticBuilder report_error(SourceRange range, std::string message)
  {
    return report(Severity::Error, range, std::move(message));
  }
  DiagnosticBuilder report_warning(SourceRange range, std::string message)
  {
    return report(Severity::Warning, range, std::move(message));
  }
  DiagnosticBuilder report_note(std::string message)
  {
    return report(Severity::Note, SourceRange{}, std::move(message));
  }

  void add(Diagnostic diag) { diagnostics_.push_back(std::move(diag)); }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }
  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) > 0; }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace qk_graph
