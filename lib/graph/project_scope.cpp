// qk_graph/graph/project_scope.cpp - Workspace roots, display paths and project scopes
//
#include "qk_graph/graph/project_scope.hpp"

#include <system_error>

namespace qk_graph
{

namespace
{

fs::path normalized(const fs::path & path)
{
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) absolute = path;
  return absolute.lexically_normal();
}

/// `a/b/` and `a/b` compare equal
fs::path strip_trailing_separator(fs::path path)
{
  if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
    path = path.parent_path();
  }
  return path;
}

std::string relative_generic(const fs::path & root, const fs::path & file)
{
  const std::string rel = file.lexically_relative(root).generic_string();
  return rel.empty() ? std::string(".") : rel;
}

}  // namespace

std::string to_generic_path(const fs::path & path)
{
  return strip_trailing_separator(normalized(path)).generic_string();
}

bool path_in_root(const fs::path & root, const fs::path & path)
{
  const fs::path rel = strip_trailing_separator(path.lexically_normal())
                         .lexically_relative(strip_trailing_separator(root.lexically_normal()));
  if (rel.empty()) return false;
  if (rel == ".") return true;
  return rel.is_relative() && *rel.begin() != "..";
}

ProjectScopeResolver::ProjectScopeResolver(std::vector<WorkspaceRoot> roots)
: roots_(std::move(roots))
{
  for (WorkspaceRoot & root : roots_) {
    root.path = strip_trailing_separator(normalized(root.path));
  }
}

const WorkspaceRoot * ProjectScopeResolver::best_root(const fs::path & file) const
{
  const fs::path target = normalized(file);
  const WorkspaceRoot * best = nullptr;
  size_t best_length = 0;
  for (const WorkspaceRoot & root : roots_) {
    if (!path_in_root(root.path, target)) continue;
    const size_t length = root.path.native().size();
    if (best == nullptr || length > best_length) {
      best = &root;
      best_length = length;
    }
  }
  return best;
}

std::string ProjectScopeResolver::display_path(const fs::path & file) const
{
  const fs::path target = normalized(file);
  const WorkspaceRoot * root = best_root(target);
  if (root == nullptr) return target.generic_string();

  const std::string rel = relative_generic(root->path, target);
  if (roots_.size() == 1) return rel;
  return root->name + "/" + rel;
}

bool ProjectScopeResolver::has_manifest(const fs::path & directory)
{
  const std::string key = directory.generic_string();
  auto it = manifest_cache_.find(key);
  if (it != manifest_cache_.end()) return it->second;

  std::error_code ec;
  const bool found = fs::is_regular_file(directory / k_package_manifest, ec) && !ec;
  manifest_cache_.emplace(key, found);
  return found;
}

std::optional<fs::path> ProjectScopeResolver::nearest_manifest_dir(
  const fs::path * root, const fs::path & file)
{
  fs::path cursor = file.parent_path();
  while (true) {
    if ((root == nullptr || path_in_root(*root, cursor)) && has_manifest(cursor)) return cursor;
    if (root != nullptr && cursor == *root) break;

    const fs::path parent = cursor.parent_path();
    if (parent == cursor || parent.empty()) break;
    cursor = parent;
  }
  return std::nullopt;
}

std::string ProjectScopeResolver::project_scope(const fs::path & file)
{
  const fs::path target = normalized(file);
  const std::string cache_key = target.generic_string();
  auto cached = scope_cache_.find(cache_key);
  if (cached != scope_cache_.end()) return cached->second;

  std::string scope;
  const WorkspaceRoot * root = best_root(target);
  if (root == nullptr) {
    if (const auto boundary = nearest_manifest_dir(nullptr, target)) {
      scope = "workspace:" + boundary->filename().generic_string();
    } else {
      const std::string parent = target.parent_path().filename().generic_string();
      scope = "workspace:" + (parent.empty() ? std::string("*") : parent);
    }
  } else if (const auto boundary = nearest_manifest_dir(&root->path, target)) {
    scope = root->name + ":" + relative_generic(root->path, *boundary);
  } else {
    const fs::path rel = target.lexically_relative(root->path);
    if (!rel.empty() && rel != ".") {
      scope = root->name + ":" + rel.begin()->generic_string();
    } else {
      scope = root->name + ":*";
    }
  }

  scope_cache_.emplace(cache_key, scope);
  return scope;
}

}  // namespace qk_graph
