// tests/unit/graph/test_graph_builder.cpp - Unit tests for key matching and graph assembly
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "qk_graph/graph/graph_builder.hpp"

using namespace qk_graph;

namespace
{

NormalizedKey key_of(std::vector<Segment> segments, MatchMode mode)
{
  return make_array_key(segments, mode);
}

CallSiteRecord record(
  Relation relation, std::string operation, std::string file, uint32_t line, NormalizedKey key)
{
  CallSiteRecord r;
  r.relation = relation;
  r.operation = std::move(operation);
  r.file = std::move(file);
  r.line = line;
  r.column = 3;
  r.resolution = key.resolution;
  r.declaresDirectly = relation == Relation::Declares;
  r.queryKey = std::move(key);
  return r;
}

const std::vector<WorkspaceRoot> k_app_root = {{"app", "/virtual/app"}};

}  // namespace

// ============================================================================
// Segment and key matching
// ============================================================================

TEST(GraphMatching, DynamicSegments)
{
  EXPECT_TRUE(is_dynamic_segment(""));
  EXPECT_TRUE(is_dynamic_segment("  "));
  EXPECT_TRUE(is_dynamic_segment("$id"));
  EXPECT_TRUE(is_dynamic_segment("item-${$id}"));
  EXPECT_TRUE(is_dynamic_segment("UNRESOLVED"));
  EXPECT_TRUE(is_dynamic_segment("call(currentUser)"));
  EXPECT_TRUE(is_dynamic_segment("cond(open ? a : b)"));

  EXPECT_FALSE(is_dynamic_segment("todos"));
  EXPECT_FALSE(is_dynamic_segment("{page: 1}"));
  EXPECT_FALSE(is_dynamic_segment("7"));
}

TEST(GraphMatching, SegmentsCompatible)
{
  EXPECT_TRUE(segments_compatible("todos", "todos"));
  EXPECT_TRUE(segments_compatible("todos", "$x"));
  EXPECT_TRUE(segments_compatible("$x", "users"));
  EXPECT_FALSE(segments_compatible("todos", "users"));
}

TEST(GraphMatching, PrefixReachesLongerKeys)
{
  const NormalizedKey declared =
    key_of({{"todos", true}, {"list", true}}, MatchMode::Exact);

  EXPECT_TRUE(action_affects_declared_key(key_of({{"todos", true}}, MatchMode::Prefix), declared));
  EXPECT_FALSE(action_affects_declared_key(
    key_of({{"todos", true}, {"detail", true}}, MatchMode::Prefix), declared));
  EXPECT_TRUE(action_affects_declared_key(
    key_of({{"todos", true}, {"$id", false}}, MatchMode::Prefix), declared));
  EXPECT_FALSE(action_affects_declared_key(
    key_of({{"users", true}}, MatchMode::Prefix), declared));
}

TEST(GraphMatching, PrefixLongerThanDeclaredFails)
{
  const NormalizedKey declared = key_of({{"todos", true}}, MatchMode::Exact);
  EXPECT_FALSE(action_affects_declared_key(
    key_of({{"todos", true}, {"list", true}}, MatchMode::Prefix), declared));
}

TEST(GraphMatching, ExactRequiresEqualLength)
{
  const NormalizedKey declared =
    key_of({{"todos", true}, {"list", true}}, MatchMode::Exact);

  EXPECT_FALSE(action_affects_declared_key(key_of({{"todos", true}}, MatchMode::Exact), declared));
  EXPECT_TRUE(action_affects_declared_key(
    key_of({{"todos", true}, {"$page", false}}, MatchMode::Exact), declared));
}

TEST(GraphMatching, UnresolvedSegmentsKeepTheirPosition)
{
  const Segment unresolved{std::string(k_unresolved_segment), false};

  // Declared side: the unresolved tail matches any concrete segment
  const NormalizedKey declared_open = key_of({{"todos", true}, unresolved}, MatchMode::Exact);
  EXPECT_TRUE(action_affects_declared_key(
    key_of({{"todos", true}, {"detail", true}}, MatchMode::Exact), declared_open));

  // Mutation side: positions after the unresolved segment still line up
  const NormalizedKey declared =
    key_of({{"todos", true}, {"list", true}, {"x", true}}, MatchMode::Exact);
  EXPECT_TRUE(action_affects_declared_key(
    key_of({{"todos", true}, unresolved, {"x", true}}, MatchMode::Prefix), declared));
  EXPECT_FALSE(action_affects_declared_key(
    key_of({{"todos", true}, unresolved, {"y", true}}, MatchMode::Prefix), declared));

  // Exact mode counts unresolved segments
  const NormalizedKey pair = key_of({{"todos", true}, {"list", true}}, MatchMode::Exact);
  EXPECT_FALSE(action_affects_declared_key(
    key_of({{"todos", true}, unresolved, {"list", true}}, MatchMode::Exact), pair));
}

TEST(GraphMatching, LoneUnresolvedKeyNeverMatches)
{
  const NormalizedKey declared = key_of({{"todos", true}, {"list", true}}, MatchMode::Exact);
  EXPECT_FALSE(action_affects_declared_key(make_unknown_key(MatchMode::Prefix), declared));
  EXPECT_FALSE(action_affects_declared_key(
    key_of({{"todos", true}}, MatchMode::Prefix), make_unknown_key(MatchMode::Exact)));
}

TEST(GraphMatching, PassThroughNeverMatches)
{
  const NormalizedKey declared = make_pass_through_key(MatchMode::Exact);
  EXPECT_FALSE(action_affects_declared_key(make_pass_through_key(MatchMode::Prefix), declared));
}

TEST(GraphMatching, WildcardAndPredicateMatchEverything)
{
  const NormalizedKey declared = key_of({{"todos", true}}, MatchMode::Exact);
  EXPECT_TRUE(action_affects_declared_key(make_all_cache_key(Resolution::Static), declared));

  NormalizedKey predicate = key_of({{"users", true}}, MatchMode::Predicate);
  EXPECT_TRUE(action_affects_declared_key(predicate, declared));
}

TEST(GraphMatching, SetAnchors)
{
  EXPECT_TRUE(is_set_anchored_key(key_of({{"todos", true}}, MatchMode::Exact)));
  EXPECT_FALSE(is_set_anchored_key(make_pass_through_key(MatchMode::Exact)));
  EXPECT_FALSE(is_set_anchored_key(make_unknown_key(MatchMode::Exact)));
  EXPECT_FALSE(is_set_anchored_key(make_all_cache_key(Resolution::Static)));
}

// ============================================================================
// Assembly
// ============================================================================

TEST(GraphBuilder, DeclarationAndInvalidation)
{
  const std::string file = "/virtual/app/src/todos.tsx";
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", file, 3,
           key_of({{"todos", true}, {"$id", false}}, MatchMode::Exact)),
    record(Relation::Invalidates, "invalidateQueries", file, 8,
           key_of({{"todos", true}}, MatchMode::Prefix)),
  };

  const Graph graph = build_graph(k_app_root, records);

  EXPECT_EQ(graph.summary.files, 1U);
  EXPECT_EQ(graph.summary.actions, 2U);
  EXPECT_EQ(graph.summary.queryKeys, 1U);
  EXPECT_EQ(graph.summary.parseErrors, 0U);
  EXPECT_EQ(graph.edges.size(), 4U);

  const GraphNode * file_node = graph.find_node("file:" + file);
  ASSERT_NE(file_node, nullptr);
  EXPECT_EQ(file_node->label, "src/todos.tsx");
  EXPECT_EQ(file_node->metrics.projectScope, "app:src");
  EXPECT_EQ(file_node->metrics.affectedKeys, 1U);

  const std::string key_id = "qk:app:src::todos|$id";
  const GraphNode * key = graph.find_node(key_id);
  ASSERT_NE(key, nullptr);
  EXPECT_EQ(key->label, "[todos, $id]");
  EXPECT_EQ(key->resolution, Resolution::Dynamic);
  EXPECT_EQ(key->metrics.rootSegment, "todos");
  EXPECT_EQ(key->metrics.declaredCallsites, 1U);
  EXPECT_EQ(key->metrics.declaredFiles, 1U);
  EXPECT_EQ(key->metrics.actionCallsites, 1U);
  EXPECT_EQ(key->metrics.affectedFiles, 1U);
  EXPECT_EQ(key->metrics.projectScope, "app:src");

  const std::string invalidate = action_node_id(records[1], 1);
  EXPECT_EQ(invalidate, "action:" + file + ":8:3:invalidateQueries:1");
  const GraphNode * action = graph.find_node(invalidate);
  ASSERT_NE(action, nullptr);
  EXPECT_EQ(action->loc->line, 8U);
  EXPECT_EQ(action->metrics.relation, Relation::Invalidates);
  EXPECT_EQ(action->metrics.displayFile, "src/todos.tsx");

  EXPECT_NE(graph.find_edge(invalidate + "->" + key_id + ":invalidates"), nullptr);
  EXPECT_NE(graph.find_edge("file:" + file + "->" + invalidate + ":invalidates"), nullptr);
}

TEST(GraphBuilder, NodesKeepFirstSeenOrder)
{
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", "/virtual/app/src/b.tsx", 1,
           key_of({{"b", true}}, MatchMode::Exact)),
    record(Relation::Declares, "useQuery", "/virtual/app/src/a.tsx", 1,
           key_of({{"a", true}}, MatchMode::Exact)),
  };

  const Graph graph = build_graph(k_app_root, records);
  ASSERT_EQ(graph.nodes.size(), 6U);
  EXPECT_EQ(graph.nodes[0].id, "file:/virtual/app/src/b.tsx");
  EXPECT_EQ(graph.nodes[1].kind, GraphNodeKind::Action);
  EXPECT_EQ(graph.nodes[2].id, "qk:app:src::b");
  EXPECT_EQ(graph.nodes[3].id, "file:/virtual/app/src/a.tsx");
}

TEST(GraphBuilder, RepeatedDeclarationsShareOneKey)
{
  const auto key = key_of({{"todos", true}}, MatchMode::Exact);
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", "/virtual/app/src/a.tsx", 1, key),
    record(Relation::Declares, "useQuery", "/virtual/app/src/a.tsx", 9, key),
    record(Relation::Declares, "useSuspenseQuery", "/virtual/app/src/b.tsx", 2, key),
  };

  const Graph graph = build_graph(k_app_root, records);
  EXPECT_EQ(graph.summary.queryKeys, 1U);

  const GraphNode * node = graph.find_node("qk:app:src::todos");
  ASSERT_NE(node, nullptr);
  EXPECT_EQ(node->metrics.declaredCallsites, 3U);
  EXPECT_EQ(node->metrics.declaredFiles, 2U);
  EXPECT_EQ(node->metrics.affectedFiles, 2U);
}

TEST(GraphBuilder, WildcardStaysInsideItsScope)
{
  const std::vector<WorkspaceRoot> roots = {{"a", "/virtual/a"}, {"b", "/virtual/b"}};
  const auto items = key_of({{"items", true}}, MatchMode::Exact);
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", "/virtual/a/web/list.tsx", 1, items),
    record(Relation::Declares, "useQuery", "/virtual/b/web/list.tsx", 1, items),
    record(Relation::Clears, "clear", "/virtual/a/web/reset.tsx", 4,
           make_all_cache_key(Resolution::Static)),
  };

  const Graph graph = build_graph(roots, records);
  EXPECT_EQ(graph.summary.queryKeys, 2U);

  const std::string clear = action_node_id(records[2], 2);
  EXPECT_NE(graph.find_edge(clear + "->qk:a:web::items:clears"), nullptr);
  EXPECT_EQ(graph.find_edge(clear + "->qk:b:web::items:clears"), nullptr);

  const GraphNode * file = graph.find_node("file:/virtual/a/web/reset.tsx");
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->label, "a/web/reset.tsx");
  EXPECT_EQ(file->metrics.affectedKeys, 1U);
}

TEST(GraphBuilder, MutationOutsideScopeFallsBackToOwnKey)
{
  const std::vector<WorkspaceRoot> roots = {{"a", "/virtual/a"}, {"b", "/virtual/b"}};
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", "/virtual/a/web/list.tsx", 1,
           key_of({{"items", true}}, MatchMode::Exact)),
    record(Relation::Invalidates, "invalidateQueries", "/virtual/b/web/save.tsx", 5,
           key_of({{"items", true}}, MatchMode::Prefix)),
  };

  const Graph graph = build_graph(roots, records);

  // The invalidation's own key has no declaration in scope b and is pruned
  EXPECT_EQ(graph.summary.queryKeys, 1U);
  EXPECT_EQ(graph.find_node("qk:b:web::items"), nullptr);
  const GraphNode * declared = graph.find_node("qk:a:web::items");
  ASSERT_NE(declared, nullptr);
  EXPECT_EQ(declared->metrics.actionCallsites, 0U);
}

TEST(GraphBuilder, UndeclaredKeysArePruned)
{
  const std::string file = "/virtual/app/src/save.tsx";
  const std::vector<CallSiteRecord> records = {
    record(Relation::Invalidates, "invalidateQueries", file, 2,
           key_of({{"users", true}}, MatchMode::Prefix)),
    record(Relation::Invalidates, "invalidateQueries", file, 3,
           make_pass_through_key(MatchMode::Prefix)),
  };

  const Graph graph = build_graph(k_app_root, records);
  EXPECT_EQ(graph.summary.files, 1U);
  EXPECT_EQ(graph.summary.actions, 2U);
  EXPECT_EQ(graph.summary.queryKeys, 0U);
  EXPECT_EQ(graph.edges.size(), 2U);
  for (const GraphEdge & edge : graph.edges) {
    EXPECT_EQ(edge.source, "file:" + file);
  }
  EXPECT_EQ(graph.find_node("file:" + file)->metrics.affectedKeys, 0U);
}

TEST(GraphBuilder, PassThroughMutationLeavesDeclaredKeysAlone)
{
  const std::string file = "/virtual/app/src/todos.tsx";
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", file, 2, key_of({{"todos", true}}, MatchMode::Exact)),
    record(Relation::Invalidates, "invalidateQueries", file, 9,
           make_pass_through_key(MatchMode::Prefix)),
  };

  const Graph graph = build_graph(k_app_root, records);
  EXPECT_EQ(graph.summary.actions, 2U);
  EXPECT_EQ(graph.summary.queryKeys, 1U);
  EXPECT_EQ(graph.edges.size(), 3U);
  EXPECT_EQ(graph.find_node("qk:app:src::" + std::string(k_pass_through_key_id)), nullptr);

  const GraphNode * declared = graph.find_node("qk:app:src::todos");
  ASSERT_NE(declared, nullptr);
  EXPECT_EQ(declared->metrics.declaredCallsites, 1U);
  EXPECT_EQ(declared->metrics.actionCallsites, 0U);

  const std::string invalidate = action_node_id(records[1], 1);
  EXPECT_EQ(graph.find_edge(invalidate + "->qk:app:src::todos:invalidates"), nullptr);
  EXPECT_NE(graph.find_edge("file:" + file + "->" + invalidate + ":invalidates"), nullptr);
  EXPECT_EQ(graph.find_node("file:" + file)->metrics.affectedKeys, 1U);
}

TEST(GraphBuilder, KeysReachedOnlyByUnresolvedActionsArePruned)
{
  const std::string file = "/virtual/app/src/save.tsx";
  const std::vector<CallSiteRecord> records = {
    record(Relation::Declares, "useQuery", file, 1, key_of({{"todos", true}}, MatchMode::Exact)),
    record(Relation::Invalidates, "invalidateQueries", file, 4,
           make_unknown_key(MatchMode::Prefix)),
    record(Relation::Resets, "resetQueries", file, 5,
           key_of({{std::string(k_unresolved_segment), false}}, MatchMode::Prefix)),
    record(Relation::Sets, "setQueryData", file, 6, make_pass_through_key(MatchMode::Exact)),
  };

  const Graph graph = build_graph(k_app_root, records);
  EXPECT_EQ(graph.summary.actions, 4U);
  EXPECT_EQ(graph.summary.queryKeys, 1U);
  EXPECT_EQ(graph.find_node("qk:app:src::" + std::string(k_unresolved_key_id)), nullptr);
  EXPECT_EQ(graph.find_node("qk:app:src::" + std::string(k_unresolved_segment)), nullptr);
  EXPECT_EQ(graph.find_node("qk:app:src::" + std::string(k_pass_through_key_id)), nullptr);

  const GraphNode * declared = graph.find_node("qk:app:src::todos");
  ASSERT_NE(declared, nullptr);
  EXPECT_EQ(declared->metrics.actionCallsites, 0U);

  // Only file -> action edges and the declaration survive
  EXPECT_EQ(graph.edges.size(), 5U);
}

TEST(GraphBuilder, SetQueryDataAnchorsItsKey)
{
  const std::vector<CallSiteRecord> records = {
    record(Relation::Sets, "setQueryData", "/virtual/app/src/cache.ts", 6,
           key_of({{"todos", true}, {"7", true}}, MatchMode::Exact)),
    record(Relation::Sets, "setQueryData", "/virtual/app/src/cache.ts", 7,
           make_pass_through_key(MatchMode::Exact)),
  };

  const Graph graph = build_graph(k_app_root, records);
  EXPECT_EQ(graph.summary.queryKeys, 1U);

  const GraphNode * key = graph.find_node("qk:app:src::todos|7");
  ASSERT_NE(key, nullptr);
  EXPECT_EQ(key->metrics.declaredCallsites, 0U);
  EXPECT_EQ(key->metrics.actionCallsites, 1U);
}

TEST(GraphBuilder, ParseFailuresUseDisplayPaths)
{
  const Graph graph = build_graph(
    k_app_root, {}, {FileParseFailure{"/virtual/app/src/broken.tsx", "Syntax error at 1:5"}});

  EXPECT_TRUE(graph.nodes.empty());
  EXPECT_EQ(graph.summary.parseErrors, 1U);
  ASSERT_EQ(graph.parseErrors.size(), 1U);
  EXPECT_EQ(graph.parseErrors[0].file, "src/broken.tsx");
  EXPECT_EQ(graph.parseErrors[0].message, "Syntax error at 1:5");
}

// ============================================================================
// Project scopes
// ============================================================================

TEST(GraphScopes, FirstSegmentWithoutManifest)
{
  ProjectScopeResolver scopes(std::vector<WorkspaceRoot>{{"app", "/virtual/app"}});
  EXPECT_EQ(scopes.project_scope("/virtual/app/packages/ui/button.tsx"), "app:packages");
  EXPECT_EQ(scopes.project_scope("/virtual/other/lib/x.ts"), "workspace:lib");
  EXPECT_EQ(scopes.display_path("/virtual/other/lib/x.ts"), "/virtual/other/lib/x.ts");
}

TEST(GraphScopes, LongestRootWins)
{
  ProjectScopeResolver scopes({{"outer", "/virtual"}, {"inner", "/virtual/app/"}});
  const WorkspaceRoot * root = scopes.best_root("/virtual/app/src/x.ts");
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->name, "inner");
  EXPECT_EQ(scopes.display_path("/virtual/app/src/x.ts"), "inner/src/x.ts");
}

TEST(GraphScopes, PathInRoot)
{
  EXPECT_TRUE(path_in_root("/virtual/app", "/virtual/app"));
  EXPECT_TRUE(path_in_root("/virtual/app", "/virtual/app/src/a.ts"));
  EXPECT_FALSE(path_in_root("/virtual/app", "/virtual/application/a.ts"));
  EXPECT_FALSE(path_in_root("/virtual/app", "/virtual"));
}
