// tests/unit/sema/test_module_resolver.cpp - Unit tests for import specifier resolution
//
// Relative specifiers are resolved against an in-memory index; alias tests
// write tsconfig files to a temporary directory.
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "qk_graph/sema/resolution/module_resolver.hpp"

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

  void write(const std::string & rel, const std::string & text) const
  {
    const std::filesystem::path file = path / rel;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << text;
  }

  [[nodiscard]] std::string abs(const std::string & rel) const
  {
    return normalize_analyzer_path(path / rel);
  }
};

/// Index holding empty tables for `paths`
SymbolIndex index_of(const std::vector<std::string> & paths)
{
  SymbolIndex index;
  for (const std::string & path : paths) {
    FileSymbolTable table;
    table.path = path;
    index.add(std::move(table));
  }
  return index;
}

}  // namespace

// ============================================================================
// JSON with comments
// ============================================================================

TEST(SemaJsonc, TrailingCommas)
{
  EXPECT_EQ(strip_trailing_commas("{\"a\": [1, 2,], }"), "{\"a\": [1, 2] }");
  EXPECT_EQ(strip_trailing_commas("{\"a\": \",}\"}"), "{\"a\": \",}\"}");
  EXPECT_EQ(strip_trailing_commas("[1, // note, here\n]"), "[1 // note, here\n]");
}

TEST(SemaJsonc, ParseObject)
{
  const auto parsed = parse_jsonc_object(
    "// tsconfig\n"
    "{\n"
    "  /* options */\n"
    "  \"compilerOptions\": { \"baseUrl\": \".\", },\n"
    "}\n");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ((*parsed)["compilerOptions"]["baseUrl"], ".");

  EXPECT_FALSE(parse_jsonc_object("").has_value());
  EXPECT_FALSE(parse_jsonc_object("[1, 2]").has_value());
  EXPECT_FALSE(parse_jsonc_object("{ broken").has_value());
}

// ============================================================================
// Pattern helpers
// ============================================================================

TEST(SemaAlias, Capture)
{
  EXPECT_EQ(alias_capture("@/*", "@/hooks/useTodos"), "hooks/useTodos");
  EXPECT_EQ(alias_capture("~lib", "~lib"), "");
  EXPECT_FALSE(alias_capture("~lib", "~lib/x").has_value());
  EXPECT_EQ(alias_capture("@app/*/keys", "@app/todos/keys"), "todos");
  EXPECT_FALSE(alias_capture("@app/*/keys", "@app/keys").has_value());
  EXPECT_FALSE(alias_capture("@/*", "lodash").has_value());
}

TEST(SemaAlias, CommonPrefix)
{
  EXPECT_EQ(common_path_prefix_length("/a/b/c", "/a/b/d"), 2U);
  EXPECT_EQ(common_path_prefix_length("/a/b", "/a/b"), 2U);
  EXPECT_EQ(common_path_prefix_length("/x", "/y"), 0U);
}

// ============================================================================
// Relative specifiers
// ============================================================================

TEST(SemaModuleResolver, RelativeSpecifiers)
{
  const SymbolIndex index = index_of({
    "/virtual/src/keys.ts",
    "/virtual/src/hooks/index.tsx",
    "/virtual/src/util.js",
    "/virtual/lib/shared.ts",
  });
  ModuleResolver resolver(index, {"/virtual"});

  const std::string from = "/virtual/src/App.tsx";
  EXPECT_EQ(resolver.resolve(from, "./keys"), "/virtual/src/keys.ts");
  EXPECT_EQ(resolver.resolve(from, "./keys.ts"), "/virtual/src/keys.ts");
  EXPECT_EQ(resolver.resolve(from, "./hooks"), "/virtual/src/hooks/index.tsx");
  EXPECT_EQ(resolver.resolve(from, "./util"), "/virtual/src/util.js");
  EXPECT_EQ(resolver.resolve(from, "../lib/shared"), "/virtual/lib/shared.ts");
  EXPECT_EQ(resolver.resolve(from, "/virtual/lib/shared"), "/virtual/lib/shared.ts");

  EXPECT_FALSE(resolver.resolve(from, "./missing").has_value());
  EXPECT_FALSE(resolver.resolve(from, "react").has_value());
}

TEST(SemaModuleResolver, WorkspaceRootForFile)
{
  const SymbolIndex index;
  ModuleResolver resolver(index, {"/virtual", "/virtual/app"});
  EXPECT_EQ(resolver.workspace_root_for("/virtual/app/src/a.ts"), "/virtual/app");
  EXPECT_EQ(resolver.workspace_root_for("/virtual/lib/a.ts"), "/virtual");
  EXPECT_EQ(resolver.workspace_root_for("/elsewhere/a.ts"), "/elsewhere");
}

// ============================================================================
// tsconfig paths
// ============================================================================

TEST(SemaModuleResolver, PathAliases)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_module_aliases");
  dir.write(
    "tsconfig.json",
    "{\n"
    "  // shared settings\n"
    "  \"compilerOptions\": {\n"
    "    \"baseUrl\": \".\",\n"
    "    \"paths\": {\n"
    "      \"@/*\": [\"src/*\"],\n"
    "      \"@keys\": [\"src/query/keys.ts\"],\n"
    "    },\n"
    "  },\n"
    "}\n");

  const SymbolIndex index = index_of({
    dir.abs("src/query/keys.ts"),
    dir.abs("src/hooks/useTodos.ts"),
  });
  ModuleResolver resolver(index, {dir.abs("")});

  const std::string from = dir.abs("src/App.tsx");
  EXPECT_EQ(resolver.find_nearest_config(from), dir.abs("tsconfig.json"));
  EXPECT_EQ(resolver.resolve(from, "@/hooks/useTodos"), dir.abs("src/hooks/useTodos.ts"));
  EXPECT_EQ(resolver.resolve(from, "@keys"), dir.abs("src/query/keys.ts"));
  EXPECT_FALSE(resolver.resolve(from, "@/missing").has_value());

  const auto & entries = resolver.alias_entries(from);
  ASSERT_EQ(entries.size(), 2U);
  EXPECT_EQ(entries[0].pattern, "@keys");
}

TEST(SemaModuleResolver, ExtendsIsFollowed)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_module_extends");
  dir.write(
    "tsconfig.base.json",
    "{ \"compilerOptions\": { \"baseUrl\": \"packages\", \"paths\": { \"~/*\": [\"*\"] } } }");
  dir.write("web/tsconfig.json", "{ \"extends\": \"../tsconfig.base\" }");

  const SymbolIndex index = index_of({dir.abs("packages/ui/button.ts")});
  ModuleResolver resolver(index, {dir.abs("")});

  EXPECT_EQ(
    resolver.resolve(dir.abs("web/src/App.tsx"), "~/ui/button"), dir.abs("packages/ui/button.ts"));
}

TEST(SemaModuleResolver, ExtendsCycleTerminates)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_module_cycle");
  dir.write("a.json", "{ \"extends\": \"./b.json\" }");
  dir.write("b.json", "{ \"extends\": \"./a.json\", \"compilerOptions\": { \"baseUrl\": \".\" } }");

  const SymbolIndex index;
  ModuleResolver resolver(index, {dir.abs("")});
  std::unordered_set<std::string> seen;
  const PathAliasConfig & config = resolver.load_alias_config(dir.abs("a.json"), seen);
  EXPECT_EQ(config.baseUrl, dir.abs(""));
  EXPECT_TRUE(config.paths.empty());
}

TEST(SemaModuleResolver, ClosestAliasTargetWins)
{
  TempDir dir(std::filesystem::temp_directory_path() / "qkg_module_rank");
  dir.write(
    "tsconfig.json",
    "{ \"compilerOptions\": { \"paths\": { \"#keys\": [\"a/keys.ts\", \"b/deep/keys.ts\"] } } }");

  const SymbolIndex index = index_of({dir.abs("a/keys.ts"), dir.abs("b/deep/keys.ts")});
  ModuleResolver resolver(index, {dir.abs("")});

  EXPECT_EQ(resolver.resolve(dir.abs("b/deep/view.ts"), "#keys"), dir.abs("b/deep/keys.ts"));
  EXPECT_EQ(resolver.resolve(dir.abs("a/view.ts"), "#keys"), dir.abs("a/keys.ts"));
}
