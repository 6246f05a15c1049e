// qk_graph/sema/resolution/module_resolver.hpp - Module specifier resolution
//
// Maps an import specifier written in one file to another file of the
// analysed set: relative and absolute specifiers through the extension /
// index-file search order, bare specifiers through tsconfig/jsconfig
// `paths` aliases.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "qk_graph/sema/resolution/symbol_table.hpp"

namespace qk_graph
{

/// Extensions tried for extension-less specifiers, in order
inline constexpr std::string_view k_resolve_extensions[] = {".ts",  ".tsx", ".js",  ".jsx",
                                                            ".mts", ".cts", ".mjs", ".cjs"};

// ============================================================================
// Path alias configuration
// ============================================================================

/// `compilerOptions.baseUrl` / `compilerOptions.paths` after `extends` merging
struct PathAliasConfig
{
  std::optional<std::string> baseUrl;                      ///< Absolute
  std::map<std::string, std::vector<std::string>> paths;  ///< pattern -> absolute targets
};

struct PathAliasEntry
{
  std::string pattern;
  std::vector<std::string> targets;
};

/**
 * Parse tsconfig-style JSON (comments and trailing commas allowed).
 *
 * @return The top-level object, or nullopt if the text is not an object
 */
[[nodiscard]] std::optional<nlohmann::json> parse_jsonc_object(std::string_view text);

/// Remove commas that directly precede `}` or `]` (outside strings)
[[nodiscard]] std::string strip_trailing_commas(std::string_view text);

/**
 * Match a specifier against an alias pattern with at most one `*`.
 *
 * @return The captured text ("" for exact patterns), or nullopt on mismatch
 */
[[nodiscard]] std::optional<std::string> alias_capture(
  std::string_view pattern, std::string_view source);

/// Number of leading path segments shared by two '/'-separated paths
[[nodiscard]] size_t common_path_prefix_length(std::string_view left, std::string_view right);

// ============================================================================
// ModuleResolver
// ============================================================================

/**
 * Resolves import specifiers against the files of one SymbolIndex.
 *
 * Only files present in the index qualify as targets. Config lookups and
 * resolutions are cached per instance; one instance serves one analysis run.
 */
class ModuleResolver
{
public:
  ModuleResolver(const SymbolIndex & index, std::vector<std::string> workspace_roots);

  /**
   * Resolve `specifier` as imported from `from_file`.
   *
   * @param from_file Normalized path of the importing file
   * @return Normalized path of the target file, or nullopt if not in the index
   */
  [[nodiscard]] std::optional<std::string> resolve(
    std::string_view from_file, std::string_view specifier);

  /// Workspace root containing `file` (longest match; the file's directory otherwise)
  [[nodiscard]] std::string workspace_root_for(std::string_view file) const;

  /// Alias entries visible from `from_file`, exact patterns first
  [[nodiscard]] const std::vector<PathAliasEntry> & alias_entries(std::string_view from_file);

  /// Nearest tsconfig.json/jsconfig.json between the file and its root
  [[nodiscard]] std::optional<std::string> find_nearest_config(std::string_view from_file);

  /// Load one config, following `extends` (cycle-safe)
  [[nodiscard]] const PathAliasConfig & load_alias_config(
    const std::string & config_path, std::unordered_set<std::string> & seen);

private:
  std::optional<std::string> resolve_relative(
    std::string_view from_file, std::string_view specifier) const;
  std::optional<std::string> resolve_alias(std::string_view from_file, std::string_view specifier);
  std::optional<std::string> resolve_extends(
    const std::string & config_dir, const std::string & extends_value) const;

  [[nodiscard]] bool has_file(const std::string & path) const { return index_.contains(path); }

  const SymbolIndex & index_;
  std::vector<std::string> roots_;

  std::unordered_map<std::string, std::optional<std::string>> nearest_config_;
  std::unordered_map<std::string, PathAliasConfig> parsed_configs_;
  std::unordered_map<std::string, std::vector<PathAliasEntry>> alias_entries_;
  std::unordered_map<std::string, std::optional<std::string>> resolved_;
};

}  // namespace qk_graph
