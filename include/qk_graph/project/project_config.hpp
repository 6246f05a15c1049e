// qk_graph/project/project_config.hpp - qkg.yaml loading
//
// Keys left out of the file keep the defaults below; command-line flags
// override whatever the file sets.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qk_graph
{

inline constexpr const char * k_project_config_file_name = "qkg.yaml";

/// `roots:` entry, either a bare path or `{ name, path }`
struct RootConfig
{
  std::string name;  // defaults to the directory's own name
  std::filesystem::path path;
};

/// `scan:` section
struct ScanConfig
{
  std::vector<std::string> include = {"**/*.{ts,tsx,js,jsx,mts,cts,mjs,cjs}"};
  std::vector<std::string> exclude = {
    "**/node_modules/**", "**/dist/**", "**/build/**", "**/.git/**", "**/*.d.ts"};
  bool respect_gitignore = true;
  uint32_t max_file_size_kb = 512;
};

struct ProjectConfig
{
  std::vector<RootConfig> roots;
  ScanConfig scan;

  /// Graph JSON destination; empty means stdout
  std::filesystem::path output;

  /// Directory holding qkg.yaml; relative paths in the file resolve here
  std::filesystem::path project_root;
};

/**
 * Outcome of reading one qkg.yaml: a configuration, or why there is none.
 */
struct ConfigLoadResult
{
  std::optional<ProjectConfig> config;
  std::string error;

  [[nodiscard]] explicit operator bool() const noexcept { return config.has_value(); }
};

/**
 * Read and validate a qkg.yaml file.
 *
 * Relative root and output paths become absolute against the file's
 * directory. An empty file yields the defaults. Never throws.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Nearest qkg.yaml at or above `start` (a directory or a file inside one).
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start);

}  // namespace qk_graph
