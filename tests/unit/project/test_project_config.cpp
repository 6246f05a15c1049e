// tests/unit/project/test_project_config.cpp - Unit tests for qkg.yaml loading
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "qk_graph/project/project_config.hpp"

using namespace qk_graph;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  std::filesystem::path write_config(const std::string & yaml) const
  {
    const std::filesystem::path file = path / k_project_config_file_name;
    std::ofstream out(file, std::ios::binary);
    out << yaml;
    return file;
  }
};

}  // namespace

TEST(ProjectConfig, FullFile)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_config_full");
  const auto file = dir.write_config(
    "roots:\n"
    "  - apps/web\n"
    "  - name: admin\n"
    "    path: ./apps/admin/\n"
    "scan:\n"
    "  include: ['src/**/*.ts']\n"
    "  exclude: []\n"
    "  respect_gitignore: false\n"
    "  max_file_size_kb: 64\n"
    "output: out/graph.json\n");

  const ConfigLoadResult result = load_project_config(file);
  ASSERT_TRUE(result) << result.error;

  const ProjectConfig & config = *result.config;
  const std::filesystem::path base = std::filesystem::absolute(dir.path);
  ASSERT_EQ(config.roots.size(), 2U);
  EXPECT_EQ(config.roots[0].name, "web");
  EXPECT_EQ(config.roots[0].path, (base / "apps/web").lexically_normal());
  EXPECT_EQ(config.roots[1].name, "admin");
  EXPECT_EQ(config.roots[1].path, (base / "apps/admin").lexically_normal());

  EXPECT_EQ(config.scan.include, std::vector<std::string>{"src/**/*.ts"});
  EXPECT_TRUE(config.scan.exclude.empty());
  EXPECT_FALSE(config.scan.respect_gitignore);
  EXPECT_EQ(config.scan.max_file_size_kb, 64U);
  EXPECT_EQ(config.output, base / "out/graph.json");
  EXPECT_EQ(config.project_root, base);
}

TEST(ProjectConfig, EmptyFileKeepsDefaults)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_config_empty");
  const ConfigLoadResult result = load_project_config(dir.write_config(""));
  ASSERT_TRUE(result) << result.error;

  const ScanConfig defaults;
  EXPECT_TRUE(result.config->roots.empty());
  EXPECT_EQ(result.config->scan.include, defaults.include);
  EXPECT_EQ(result.config->scan.exclude, defaults.exclude);
  EXPECT_TRUE(result.config->scan.respect_gitignore);
  EXPECT_EQ(result.config->scan.max_file_size_kb, 512U);
  EXPECT_TRUE(result.config->output.empty());
}

TEST(ProjectConfig, Errors)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_config_errors");

  const auto check = [&](const std::string & yaml, const std::string & expected) {
    const ConfigLoadResult result = load_project_config(dir.write_config(yaml));
    EXPECT_FALSE(result) << yaml;
    EXPECT_NE(result.error.find(expected), std::string::npos) << result.error;
  };

  check("roots: apps\n", "roots must be a list");
  check("roots:\n  - name: x\n", "must have a 'path'");
  check("roots:\n  - [a, b]\n", "must be a path or a map");
  check("scan: []\n", "scan must be a map");
  check("scan:\n  include: '*.ts'\n", "scan.include must be a list");
  check("scan:\n  max_file_size_kb: 0\n", "must be positive");
  check("scan:\n  respect_gitignore: maybe\n", "invalid configuration value");
  check("- a\n- b\n", "must be a map");
  check("roots: [unclosed\n", "failed to parse YAML");
}

TEST(ProjectConfig, MissingFile)
{
  const ConfigLoadResult result =
    load_project_config(std::filesystem::temp_directory_path() / "qkg_config_none" / "qkg.yaml");
  EXPECT_FALSE(result);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_config_find");
  const auto file = dir.write_config("roots: [src]\n");
  std::filesystem::create_directories(dir.path / "src" / "deep");

  const auto found = find_project_config(dir.path / "src" / "deep");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::canonical(*found), std::filesystem::canonical(file));
}
