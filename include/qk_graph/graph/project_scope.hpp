// qk_graph/graph/project_scope.hpp - Workspace roots, display paths and project scopes
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace qk_graph
{

namespace fs = std::filesystem;

/// Named analysis root (a workspace folder)
struct WorkspaceRoot
{
  std::string name;
  fs::path path;
};

/// Name of the package manifest that bounds a project
inline constexpr std::string_view k_package_manifest = "package.json";

/**
 * Maps absolute file paths to display paths and project scopes.
 *
 * A project scope is `<root name>:<dir>` where `<dir>` is the nearest
 * directory inside the root that holds a package manifest, relative to the
 * root (`.` for the root itself). Without a manifest the first path segment
 * below the root is used. Files outside every root fall back to
 * `workspace:<manifest dir name>` or `workspace:<parent dir name>`.
 *
 * Manifest lookups and scopes are cached per instance.
 */
class ProjectScopeResolver
{
public:
  explicit ProjectScopeResolver(std::vector<WorkspaceRoot> roots);

  [[nodiscard]] const std::vector<WorkspaceRoot> & roots() const noexcept { return roots_; }

  /// Root with the longest path that contains `file`
  [[nodiscard]] const WorkspaceRoot * best_root(const fs::path & file) const;

  /**
   * Path shown to users.
   *
   * Relative to the best root; prefixed with the root name when several
   * roots are configured; the absolute path when no root matches.
   */
  [[nodiscard]] std::string display_path(const fs::path & file) const;

  [[nodiscard]] std::string project_scope(const fs::path & file);

private:
  bool has_manifest(const fs::path & directory);
  std::optional<fs::path> nearest_manifest_dir(const fs::path * root, const fs::path & file);

  std::vector<WorkspaceRoot> roots_;
  std::unordered_map<std::string, bool> manifest_cache_;
  std::unordered_map<std::string, std::string> scope_cache_;
};

/// Lexical normal form with `/` separators
[[nodiscard]] std::string to_generic_path(const fs::path & path);

/// `root` equals `path` or is one of its ancestors (lexically)
[[nodiscard]] bool path_in_root(const fs::path & root, const fs::path & path);

}  // namespace qk_graph
