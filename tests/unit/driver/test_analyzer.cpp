// tests/unit/driver/test_analyzer.cpp - End-to-end tests for the analysis driver
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "qk_graph/driver/analyzer.hpp"

using namespace qk_graph;

namespace
{

AnalyzeOptions app_options()
{
  AnalyzeOptions options;
  options.roots = {{"app", "/virtual/app"}};
  return options;
}

const char * const k_todo_component =
  "import { useQuery, useQueryClient } from '@tanstack/react-query';\n"
  "export function Todo({ id }) {\n"
  "  const queryClient = useQueryClient();\n"
  "  const query = useQuery({ queryKey: ['todos', id], queryFn: fetchTodo });\n"
  "  const save = () => queryClient.invalidateQueries({ queryKey: ['todos'] });\n"
  "  return null;\n"
  "}\n";

}  // namespace

// ============================================================================
// In-memory sources
// ============================================================================

TEST(DriverAnalyzer, SingleComponent)
{
  const AnalysisResult result =
    Analyzer::analyze_sources({{"/virtual/app/src/Todo.tsx", k_todo_component}}, app_options());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.files_scanned(), 1U);
  EXPECT_TRUE(result.parseErrors.empty());

  ASSERT_EQ(result.records.size(), 2U);
  EXPECT_EQ(result.records[0].relation, Relation::Declares);
  EXPECT_EQ(result.records[0].queryKey.display, "[todos, $id]");
  EXPECT_EQ(result.records[1].relation, Relation::Invalidates);
  EXPECT_EQ(result.records[1].queryKey.matchMode, MatchMode::Prefix);

  const Graph & graph = result.graph;
  EXPECT_EQ(graph.summary.files, 1U);
  EXPECT_EQ(graph.summary.actions, 2U);
  EXPECT_EQ(graph.summary.queryKeys, 1U);
  EXPECT_EQ(graph.edges.size(), 4U);

  const GraphNode * key = graph.find_node("qk:app:src::todos|$id");
  ASSERT_NE(key, nullptr);
  EXPECT_EQ(key->metrics.declaredCallsites, 1U);
  EXPECT_EQ(key->metrics.actionCallsites, 1U);
}

TEST(DriverAnalyzer, KeysFlowAcrossFiles)
{
  const AnalysisResult result = Analyzer::analyze_sources(
    {
      {"/virtual/app/src/keys.ts",
       "export const todoKeys = {\n"
       "  all: ['todos'] as const,\n"
       "  list: (filter: string) => [...todoKeys.all, 'list', filter] as const,\n"
       "};\n"},
      {"/virtual/app/src/List.tsx",
       "import { useQuery } from '@tanstack/react-query';\n"
       "import { todoKeys } from './keys';\n"
       "export const List = ({ filter }) => {\n"
       "  useQuery({ queryKey: todoKeys.list(filter), queryFn: load });\n"
       "  return null;\n"
       "};\n"},
      {"/virtual/app/src/Save.tsx",
       "import { useQueryClient } from '@tanstack/react-query';\n"
       "import { todoKeys } from './keys';\n"
       "export function useSave() {\n"
       "  const client = useQueryClient();\n"
       "  return () => client.invalidateQueries({ queryKey: todoKeys.all });\n"
       "}\n"},
    },
    app_options());

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.records.size(), 2U);
  EXPECT_EQ(result.records[0].queryKey.segments.front(), "todos");
  EXPECT_EQ(result.records[1].queryKey.display, "[todos]");

  // keys.ts has no call sites and gets no file node
  EXPECT_EQ(result.graph.summary.files, 2U);
  EXPECT_EQ(result.graph.summary.queryKeys, 1U);

  const GraphNode * save = result.graph.find_node("file:/virtual/app/src/Save.tsx");
  ASSERT_NE(save, nullptr);
  EXPECT_EQ(save->metrics.affectedKeys, 1U);
}

TEST(DriverAnalyzer, ParseFailureDoesNotFailTheRun)
{
  const AnalysisResult result = Analyzer::analyze_sources(
    {
      {"/virtual/app/src/Todo.tsx", k_todo_component},
      {"/virtual/app/src/broken.ts", "export const = ;\n"},
    },
    app_options());

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.files_scanned(), 2U);
  ASSERT_EQ(result.parseErrors.size(), 1U);
  EXPECT_EQ(result.parseErrors[0].file, "/virtual/app/src/broken.ts");
  EXPECT_NE(result.parseErrors[0].message.find(" at "), std::string::npos);

  EXPECT_EQ(result.graph.summary.parseErrors, 1U);
  ASSERT_EQ(result.graph.parseErrors.size(), 1U);
  EXPECT_EQ(result.graph.parseErrors[0].file, "src/broken.ts");
  EXPECT_EQ(result.graph.summary.actions, 2U);
}

TEST(DriverAnalyzer, VerboseRunAddsPhaseNotes)
{
  AnalyzeOptions options = app_options();
  options.verbose = true;
  const AnalysisResult result =
    Analyzer::analyze_sources({{"/virtual/app/src/Todo.tsx", k_todo_component}}, options);

  EXPECT_GT(result.diagnostics.count(Severity::Note), 0U);
  EXPECT_FALSE(result.diagnostics.has_errors());
}

TEST(DriverAnalyzer, UnreadableFileIsAParseError)
{
  const std::filesystem::path missing =
    std::filesystem::temp_directory_path() / "qkg_analyzer_missing" / "gone.ts";
  const AnalysisResult result = Analyzer::analyze_files({missing}, app_options());

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.parseErrors.size(), 1U);
  EXPECT_EQ(result.parseErrors[0].message, "Cannot read file");
  EXPECT_TRUE(result.diagnostics.has_errors());
}

TEST(DriverAnalyzer, ProjectWithoutRootsFails)
{
  const AnalysisResult result = Analyzer::analyze_project(AnalyzeOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
}

TEST(DriverAnalyzer, ProjectOnDisk)
{
  const std::filesystem::path root =
    std::filesystem::temp_directory_path() / "qkg_analyzer_project";
  std::filesystem::create_directories(root / "web" / "src");
  std::filesystem::create_directories(root / "web" / "node_modules" / "lib");
  {
    std::ofstream(root / "web" / "package.json") << "{ \"name\": \"web\" }\n";
    std::ofstream(root / "web" / "src" / "Todo.tsx") << k_todo_component;
    std::ofstream(root / "web" / "node_modules" / "lib" / "index.js") << k_todo_component;
  }

  AnalyzeOptions options;
  options.roots = make_workspace_roots({root});
  const AnalysisResult result = Analyzer::analyze_project(options);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.files_scanned(), 1U);
  EXPECT_EQ(result.records.size(), 2U);
  const GraphNode * key = nullptr;
  for (const GraphNode & node : result.graph.nodes) {
    if (node.kind == GraphNodeKind::QueryKey) key = &node;
  }
  ASSERT_NE(key, nullptr);
  EXPECT_EQ(key->metrics.projectScope, "qkg_analyzer_project:web");

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}

// ============================================================================
// Roots
// ============================================================================

TEST(DriverRoots, NamesFollowDirectories)
{
  const auto roots = make_workspace_roots({"/virtual/a/web", "/virtual/b/web/", "/virtual"});
  ASSERT_EQ(roots.size(), 3U);
  EXPECT_EQ(roots[0].name, "web");
  EXPECT_EQ(roots[1].name, "web-2");
  EXPECT_EQ(roots[1].path, std::filesystem::path("/virtual/b/web"));
  EXPECT_EQ(roots[2].name, "virtual");
}

TEST(DriverRoots, ConfigRoots)
{
  ProjectConfig config;
  config.project_root = "/virtual/repo";
  const auto fallback = workspace_roots_from_config(config);
  ASSERT_EQ(fallback.size(), 1U);
  EXPECT_EQ(fallback[0].name, "repo");

  config.roots = {{"frontend", "/virtual/repo/apps/web"}};
  const auto declared = workspace_roots_from_config(config);
  ASSERT_EQ(declared.size(), 1U);
  EXPECT_EQ(declared[0].name, "frontend");
  EXPECT_EQ(declared[0].path, std::filesystem::path("/virtual/repo/apps/web"));

  EXPECT_TRUE(workspace_roots_from_config(ProjectConfig{}).empty());
}
