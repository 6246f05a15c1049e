// tests/unit/analysis/test_call_site_classifier.cpp - Unit tests for call-site classification
//

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include "qk_graph/sema/analysis/call_site_classifier.hpp"
#include "qk_graph/test_support/parse_helpers.hpp"

using namespace qk_graph;
using qk_graph::test_support::make_project;
using qk_graph::test_support::make_single_file_project;

namespace
{

std::vector<CallSiteRecord> classify(const std::string & source)
{
  auto project = make_single_file_project(source);
  EXPECT_TRUE(project->failures.empty());
  return project->classify("src/test.tsx");
}

std::vector<CallSiteRecord> with_relation(const std::vector<CallSiteRecord> & records, Relation r)
{
  std::vector<CallSiteRecord> out;
  std::copy_if(records.begin(), records.end(), std::back_inserter(out), [r](const auto & rec) {
    return rec.relation == r;
  });
  return out;
}

constexpr const char * k_tanstack_import =
  "import { useQuery, useQueryClient } from '@tanstack/react-query';\n";

}  // namespace

// ============================================================================
// Hooks
// ============================================================================

TEST(AnalysisClassifier, UseQueryDeclaresItsKey)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Todo({ id }) {\n"
    "  const q = useQuery({ queryKey: ['todos', id], queryFn: load });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  const CallSiteRecord & r = records[0];
  EXPECT_EQ(r.relation, Relation::Declares);
  EXPECT_EQ(r.operation, "useQuery");
  EXPECT_EQ(r.file, "/virtual/src/test.tsx");
  EXPECT_EQ(r.line, 3U);
  EXPECT_EQ(r.column, 13U);
  EXPECT_EQ(r.queryKey.display, "[todos, $id]");
  EXPECT_EQ(r.queryKey.matchMode, MatchMode::Exact);
  EXPECT_EQ(r.resolution, Resolution::Dynamic);
  EXPECT_TRUE(r.declaresDirectly);
}

TEST(AnalysisClassifier, StaticKeyFromTanstackIsStatic)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Todos() {\n"
    "  useQuery({ queryKey: ['todos', 'list'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.id, "todos|list");
  EXPECT_EQ(records[0].resolution, Resolution::Static);
}

TEST(AnalysisClassifier, HookFromOtherModuleIsDynamic)
{
  const auto records = classify(
    "import { useQuery } from './lib/query';\n"
    "export function Todos() {\n"
    "  useQuery({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.resolution, Resolution::Static);
  EXPECT_EQ(records[0].resolution, Resolution::Dynamic);
}

TEST(AnalysisClassifier, UnimportedHookIsIgnored)
{
  const auto records = classify(
    "export function Todos() {\n"
    "  useQuery({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");
  EXPECT_TRUE(records.empty());
}

TEST(AnalysisClassifier, AliasedHookKeepsLocalName)
{
  const auto records = classify(
    "import { useQuery as useRQ } from '@tanstack/react-query';\n"
    "export function Todos() {\n"
    "  useRQ({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].operation, "useRQ");
}

TEST(AnalysisClassifier, UseQueriesDeclaresEachEntry)
{
  const auto records = classify(
    "import { useQueries } from '@tanstack/react-query';\n"
    "export function Dashboard() {\n"
    "  useQueries({ queries: [\n"
    "    { queryKey: ['todos'] },\n"
    "    { queryKey: ['users'] },\n"
    "  ] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].queryKey.display, "[todos]");
  EXPECT_EQ(records[1].queryKey.display, "[users]");
  EXPECT_EQ(records[0].operation, "useQueries");
}

TEST(AnalysisClassifier, UseQueriesMapExpandsEachValue)
{
  const auto records = classify(
    "import { useQueries } from '@tanstack/react-query';\n"
    "export function Todos() {\n"
    "  const ids = ['a', 'b'];\n"
    "  useQueries({ queries: ids.map((id) => ({ queryKey: ['todo', id] })) });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].queryKey.display, "[todo, a]");
  EXPECT_EQ(records[1].queryKey.display, "[todo, b]");
  for (const CallSiteRecord & r : records) {
    EXPECT_EQ(r.relation, Relation::Declares);
    EXPECT_EQ(r.queryKey.matchMode, MatchMode::Exact);
    EXPECT_EQ(r.resolution, Resolution::Static);
  }
}

TEST(AnalysisClassifier, KeyThroughLocalConstantIsIndirect)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "const TODOS = ['todos'];\n"
    "export function Todos() {\n"
    "  useQuery({ queryKey: TODOS });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.display, "[todos]");
  EXPECT_TRUE(records[0].declaresDirectly);

  const auto by_options = classify(
    std::string(k_tanstack_import) +
    "const todoOptions = { queryKey: ['todos'] };\n"
    "export function Todos() {\n"
    "  useQuery(todoOptions);\n"
    "  return null;\n"
    "}\n");
  ASSERT_EQ(by_options.size(), 1U);
  EXPECT_EQ(by_options[0].queryKey.display, "[todos]");
  EXPECT_FALSE(by_options[0].declaresDirectly);
}

// ============================================================================
// Client methods
// ============================================================================

TEST(AnalysisClassifier, InvalidateQueriesIsPrefix)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  const onSave = () => client.invalidateQueries({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  const CallSiteRecord & r = records[0];
  EXPECT_EQ(r.relation, Relation::Invalidates);
  EXPECT_EQ(r.operation, "invalidateQueries");
  EXPECT_EQ(r.queryKey.display, "[todos]");
  EXPECT_EQ(r.queryKey.matchMode, MatchMode::Prefix);
  EXPECT_EQ(r.resolution, Resolution::Static);
  EXPECT_EQ(r.line, 4U);
}

TEST(AnalysisClassifier, ExactFlagSelectsExactMode)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  client.invalidateQueries({ queryKey: ['todos', 'list'], exact: true });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::Exact);
}

TEST(AnalysisClassifier, EveryMutationMethodHasItsRelation)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  client.invalidateQueries({ queryKey: ['a'] });\n"
    "  client.refetchQueries({ queryKey: ['a'] });\n"
    "  client.cancelQueries({ queryKey: ['a'] });\n"
    "  client.resetQueries({ queryKey: ['a'] });\n"
    "  client.removeQueries({ queryKey: ['a'] });\n"
    "  client.setQueryData(['a'], 1);\n"
    "  client.clear();\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 7U);
  EXPECT_EQ(records[0].relation, Relation::Invalidates);
  EXPECT_EQ(records[1].relation, Relation::Refetches);
  EXPECT_EQ(records[2].relation, Relation::Cancels);
  EXPECT_EQ(records[3].relation, Relation::Resets);
  EXPECT_EQ(records[4].relation, Relation::Removes);
  EXPECT_EQ(records[5].relation, Relation::Sets);
  EXPECT_EQ(records[6].relation, Relation::Clears);
}

TEST(AnalysisClassifier, SetQueryDataIsExact)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  client.setQueryData(['todo', 1], { done: true });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].relation, Relation::Sets);
  EXPECT_EQ(records[0].queryKey.display, "[todo, 1]");
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::Exact);
}

TEST(AnalysisClassifier, ClearCoversWholeCache)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Logout() {\n"
    "  const client = useQueryClient();\n"
    "  client.clear();\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].relation, Relation::Clears);
  EXPECT_TRUE(records[0].queryKey.is_wildcard());
  EXPECT_EQ(records[0].queryKey.display, "ALL_QUERY_CACHE (clear all)");
  EXPECT_EQ(records[0].resolution, Resolution::Static);
}

TEST(AnalysisClassifier, NoArgumentsIsWildcard)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Refresh() {\n"
    "  const client = useQueryClient();\n"
    "  client.invalidateQueries();\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_TRUE(records[0].queryKey.is_wildcard());
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::All);
}

TEST(AnalysisClassifier, EqualityPredicateBecomesPrefix)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  client.invalidateQueries({ predicate: (q) => q.queryKey[0] === 'todos' });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.display, "[todos]");
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::Prefix);
  EXPECT_FALSE(records[0].queryKey.is_wildcard());
}

TEST(AnalysisClassifier, OpaquePredicateIsPredicateWildcard)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  client.invalidateQueries({ predicate: (q) => q.state.isInvalidated });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_TRUE(records[0].queryKey.is_wildcard());
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::Predicate);
}

TEST(AnalysisClassifier, FetchMethodsDeclare)
{
  const auto records = classify(
    "import { QueryClient } from '@tanstack/react-query';\n"
    "const client = new QueryClient();\n"
    "export async function preload() {\n"
    "  await client.prefetchQuery({ queryKey: ['todos'], queryFn: load });\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].relation, Relation::Declares);
  EXPECT_EQ(records[0].operation, "prefetchQuery");
  EXPECT_EQ(records[0].queryKey.display, "[todos]");
  EXPECT_EQ(records[0].resolution, Resolution::Static);
}

TEST(AnalysisClassifier, TypedParameterIsAClient)
{
  const auto records = classify(
    "import type { QueryClient } from '@tanstack/react-query';\n"
    "export function reset(qc: QueryClient) {\n"
    "  qc.resetQueries({ queryKey: ['todos'] });\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].relation, Relation::Resets);
}

TEST(AnalysisClassifier, UntrackedObjectIsIgnored)
{
  const auto records = classify(
    "export function Save(cache) {\n"
    "  cache.invalidateQueries({ queryKey: ['todos'] });\n"
    "}\n");
  EXPECT_TRUE(records.empty());
}

TEST(AnalysisClassifier, ClientFromOtherModuleIsDynamic)
{
  const auto records = classify(
    "import { useQueryClient } from './lib/query';\n"
    "export function Save() {\n"
    "  const client = useQueryClient();\n"
    "  client.invalidateQueries({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.resolution, Resolution::Static);
  EXPECT_EQ(records[0].resolution, Resolution::Dynamic);
}

TEST(AnalysisClassifier, ContextClientIsDynamic)
{
  const auto records = classify(
    "import { useContext } from 'react';\n"
    "import { AppContext } from './app-context';\n"
    "export function Save() {\n"
    "  const { queryClient } = useContext(AppContext);\n"
    "  queryClient.removeQueries({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].relation, Relation::Removes);
  EXPECT_EQ(records[0].resolution, Resolution::Dynamic);
}

TEST(AnalysisClassifier, ClientReturnedByLocalHookKeepsItsCertainty)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "function useApp() {\n"
    "  return { queryClient: useQueryClient() };\n"
    "}\n"
    "export function Save() {\n"
    "  const { queryClient } = useApp();\n"
    "  queryClient.invalidateQueries({ queryKey: ['todos'] });\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].resolution, Resolution::Static);
}

// ============================================================================
// Iterator expansion
// ============================================================================

TEST(AnalysisClassifier, ForEachExpandsEachValue)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save() {\n"
    "  const qc = useQueryClient();\n"
    "  ['a', 'b'].forEach((id) => qc.invalidateQueries({ queryKey: ['todo', id] }));\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].queryKey.display, "[todo, a]");
  EXPECT_EQ(records[1].queryKey.display, "[todo, b]");
  for (const CallSiteRecord & r : records) {
    EXPECT_EQ(r.relation, Relation::Invalidates);
    EXPECT_EQ(r.queryKey.matchMode, MatchMode::Prefix);
    EXPECT_EQ(r.resolution, Resolution::Static);
    EXPECT_EQ(r.line, 4U);
  }
}

TEST(AnalysisClassifier, MapOverLocalConstantExpandsEachValue)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "const SECTIONS = ['open', 'done'];\n"
    "export function Save() {\n"
    "  const qc = useQueryClient();\n"
    "  SECTIONS.map((section) =>\n"
    "    qc.invalidateQueries({ queryKey: ['todos', section], exact: true }));\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].queryKey.display, "[todos, open]");
  EXPECT_EQ(records[1].queryKey.display, "[todos, done]");
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::Exact);
}

TEST(AnalysisClassifier, IteratorOverUnknownValuesKeepsThePlaceholder)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Save({ ids }) {\n"
    "  const qc = useQueryClient();\n"
    "  ids.forEach((id) => qc.invalidateQueries({ queryKey: ['todo', id] }));\n"
    "  return null;\n"
    "}\n");

  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(records[0].queryKey.display, "[todo, $id]");
  EXPECT_EQ(records[0].resolution, Resolution::Dynamic);
}

// ============================================================================
// Refetch handles
// ============================================================================

TEST(AnalysisClassifier, RefetchHandlesUseTheHookKey)
{
  const auto records = classify(
    std::string(k_tanstack_import) +
    "export function Todos() {\n"
    "  const { refetch } = useQuery({ queryKey: ['todos'] });\n"
    "  const list = useQuery({ queryKey: ['list'] });\n"
    "  const reload = () => { refetch(); list.refetch(); };\n"
    "  return null;\n"
    "}\n");

  const auto refetches = with_relation(records, Relation::Refetches);
  ASSERT_EQ(refetches.size(), 2U);
  EXPECT_EQ(refetches[0].operation, "refetch");
  EXPECT_EQ(refetches[0].queryKey.display, "[todos]");
  EXPECT_EQ(refetches[0].resolution, Resolution::Dynamic);
  EXPECT_EQ(refetches[1].queryKey.display, "[list]");
}

// ============================================================================
// queryKeysToInvalidate
// ============================================================================

TEST(AnalysisClassifier, InvalidatePropListsKeys)
{
  const auto records = classify(
    "export function Page({ id }) {\n"
    "  return <SaveButton queryKeysToInvalidate={[['todos'], ['users', id]]} />;\n"
    "}\n");

  ASSERT_EQ(records.size(), 2U);
  EXPECT_EQ(records[0].relation, Relation::Invalidates);
  EXPECT_EQ(records[0].operation, "invalidateQueries");
  EXPECT_EQ(records[0].queryKey.display, "[todos]");
  EXPECT_EQ(records[0].queryKey.matchMode, MatchMode::Prefix);
  EXPECT_EQ(records[0].resolution, Resolution::Dynamic);
  EXPECT_EQ(records[1].queryKey.display, "[users, $id]");
}

TEST(AnalysisClassifier, InvalidatePropSingleKeyAndStringValue)
{
  const auto single = classify(
    "export function Page() {\n"
    "  return <SaveButton queryKeysToInvalidate={['todos', 'list']} />;\n"
    "}\n");
  ASSERT_EQ(single.size(), 1U);
  EXPECT_EQ(single[0].queryKey.display, "[todos, list]");

  const auto text = classify(
    "export function Page() {\n"
    "  return <SaveButton queryKeysToInvalidate=\"todos\" />;\n"
    "}\n");
  EXPECT_TRUE(text.empty());
}

// ============================================================================
// Cross-file keys
// ============================================================================

TEST(AnalysisClassifier, ImportedFactoryKey)
{
  auto project = make_project({
    {"src/keys.ts",
     "export const todoKeys = {\n"
     "  all: ['todos'] as const,\n"
     "  detail: (id: number) => [...todoKeys.all, 'detail', id] as const,\n"
     "};\n"},
    {"src/Todo.tsx",
     "import { useQuery } from '@tanstack/react-query';\n"
     "import { todoKeys } from './keys';\n"
     "export function Todo({ id }) {\n"
     "  useQuery({ queryKey: todoKeys.detail(id) });\n"
     "  return null;\n"
     "}\n"},
  });
  ASSERT_TRUE(project->failures.empty());

  const auto records = project->classify("src/Todo.tsx");
  ASSERT_EQ(records.size(), 1U);
  ASSERT_EQ(records[0].queryKey.segments.size(), 3U);
  EXPECT_EQ(records[0].queryKey.segments[0], "todos");
  EXPECT_EQ(records[0].queryKey.segments[1], "detail");
  EXPECT_EQ(records[0].resolution, Resolution::Dynamic);
}

TEST(AnalysisClassifier, RecordsFollowSourceOrder)
{
  auto project = make_single_file_project(
    std::string(k_tanstack_import) +
    "export function A() {\n"
    "  const client = useQueryClient();\n"
    "  useQuery({ queryKey: ['b'] });\n"
    "  client.invalidateQueries({ queryKey: ['a'] });\n"
    "  useQuery({ queryKey: ['c'] });\n"
    "  return null;\n"
    "}\n");

  const auto records = project->classify_all();
  ASSERT_EQ(records.size(), 3U);
  EXPECT_LT(records[0].line, records[1].line);
  EXPECT_LT(records[1].line, records[2].line);
}
