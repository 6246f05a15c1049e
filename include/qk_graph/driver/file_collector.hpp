// qk_graph/driver/file_collector.hpp - Source file discovery
//
// Walks one analysis root and returns the files an analysis run should
// parse. Selection follows the scan section of qkg.yaml: include globs,
// exclude globs, the root's .gitignore files and a size ceiling.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "qk_graph/project/project_config.hpp"

namespace qk_graph
{

// ============================================================================
// Glob matching
// ============================================================================

/**
 * Split a comma separated pattern list, keeping commas inside `{...}`.
 *
 * @code
 *   parse_glob_patterns("*.ts, src/{a,b}") // {"*.ts", "src/{a,b}"}
 * @endcode
 */
[[nodiscard]] std::vector<std::string> parse_glob_patterns(std::string_view input);

/// Expand every `{a,b}` group (nested groups included) into plain patterns
[[nodiscard]] std::vector<std::string> expand_braces(std::string_view pattern);

/**
 * Match a '/'-separated relative path against a brace-free glob.
 *
 * `**` as a whole segment matches any number of segments, `*` and `?` stay
 * within one segment, `[...]` is a character class (`!` or `^` negates).
 * Unless `dot` is set, wildcards never match a segment starting with '.'.
 */
[[nodiscard]] bool glob_match(std::string_view pattern, std::string_view path, bool dot = false);

/**
 * A set of globs with braces pre-expanded.
 */
class GlobSet
{
public:
  GlobSet() = default;
  explicit GlobSet(const std::vector<std::string> & patterns, bool dot = false);

  void add(std::string_view pattern);

  /// True if any pattern matches `path`
  [[nodiscard]] bool matches(std::string_view path) const;

  /// True if every path below directory `dir` is matched (`x/**` patterns)
  [[nodiscard]] bool covers_directory(std::string_view dir) const;

  [[nodiscard]] bool empty() const noexcept { return patterns_.empty(); }
  [[nodiscard]] const std::vector<std::string> & patterns() const noexcept { return patterns_; }

private:
  std::vector<std::string> patterns_;
  bool dot_ = false;
};

// ============================================================================
// .gitignore
// ============================================================================

/**
 * Turn one .gitignore line into globs relative to the root.
 *
 * Comments, blank lines and negations yield nothing. A leading '/' anchors
 * the rule to `base_dir`; a rule without any other '/' matches at any depth
 * below `base_dir`. Every rule also covers the contents of a matched
 * directory.
 *
 * @param base_dir Directory of the .gitignore relative to the root ("" for the root)
 */
[[nodiscard]] std::vector<std::string> gitignore_line_to_globs(
  std::string_view line, std::string_view base_dir);

/// Globs of every .gitignore under `root` (directories matched by `exclude` are skipped)
[[nodiscard]] std::vector<std::string> read_gitignore_patterns(
  const std::filesystem::path & root, const GlobSet & exclude);

// ============================================================================
// Collection
// ============================================================================

struct SkippedFile
{
  std::filesystem::path path;
  std::string reason;
};

struct CollectResult
{
  /// Absolute, lexically normal paths, sorted
  std::vector<std::filesystem::path> files;

  /// Matched files left out of the analysis (size limit, unreadable)
  std::vector<SkippedFile> skipped;

  /// Filesystem problems encountered while walking
  std::vector<std::string> errors;
};

/**
 * Collect the files below `root` selected by `scan`.
 *
 * Symbolic links are not followed. Filesystem errors never throw; they are
 * reported in CollectResult::errors and the walk continues.
 */
[[nodiscard]] CollectResult collect_files(
  const std::filesystem::path & root, const ScanConfig & scan);

}  // namespace qk_graph
