// tests/unit/keys/test_key_normalizer.cpp - Unit tests for key normalization
//

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "qk_graph/sema/keys/key_normalizer.hpp"
#include "qk_graph/test_support/parse_helpers.hpp"

using namespace qk_graph;
using qk_graph::test_support::make_project;
using qk_graph::test_support::make_single_file_project;

namespace
{

/// Key of `const key = <expr>;` in a one-file project
NormalizedKey key_of(const std::string & source, NormalizeOptions options = {})
{
  auto project = make_single_file_project(source);
  EXPECT_TRUE(project->failures.empty());
  return project->normalize("src/test.tsx", "key", options);
}

}  // namespace

// ============================================================================
// Literals
// ============================================================================

TEST(KeysNormalizer, StaticArray)
{
  const NormalizedKey key = key_of("const key = ['todos', 'list'];");
  EXPECT_EQ(key.id, "todos|list");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.matchMode, MatchMode::Prefix);
  EXPECT_EQ(key.resolution, Resolution::Static);
  EXPECT_EQ(key.source, KeySource::Literal);
}

TEST(KeysNormalizer, ScalarKeyDefaultsToExact)
{
  const NormalizedKey key = key_of("const key = 'todos';");
  EXPECT_EQ(key.id, "todos");
  EXPECT_EQ(key.display, "todos");
  EXPECT_EQ(key.matchMode, MatchMode::Exact);
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, ModeOverride)
{
  const NormalizedKey key = key_of("const key = ['todos'];", {MatchMode::Exact});
  EXPECT_EQ(key.matchMode, MatchMode::Exact);
}

TEST(KeysNormalizer, ScalarLiterals)
{
  const NormalizedKey key = key_of("const key = ['a', 1, 2.5, true, null, undefined];");
  EXPECT_EQ(key.display, "[a, 1, 2.5, true, null, undefined]");
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, MissingExpression)
{
  auto project = make_single_file_project("const other = 1;");
  const NormalizedKey unknown = project->normalizer->normalize(nullptr);
  EXPECT_EQ(unknown.id, "unresolved_query_key");
  EXPECT_EQ(unknown.resolution, Resolution::Dynamic);

  const NormalizedKey wildcard = project->normalizer->normalize(nullptr, {MatchMode::All, true});
  EXPECT_TRUE(wildcard.is_wildcard());
  EXPECT_EQ(wildcard.matchMode, MatchMode::All);
}

// ============================================================================
// Identifiers
// ============================================================================

TEST(KeysNormalizer, UnresolvedIdentifierIsPlaceholder)
{
  const NormalizedKey key = key_of("const key = ['todos', id];");
  EXPECT_EQ(key.display, "[todos, $id]");
  EXPECT_EQ(key.id, "todos|$id");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
  EXPECT_EQ(key.source, KeySource::Expression);
}

TEST(KeysNormalizer, ConstantIsInlined)
{
  const NormalizedKey key = key_of(
    "const scope = 'todos';\n"
    "const key = [scope, 'list'];\n");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, SpreadOfKnownArrayIsFlattened)
{
  const NormalizedKey key = key_of(
    "const base = ['todos'];\n"
    "const key = [...base, 'detail', 7];\n");
  EXPECT_EQ(key.display, "[todos, detail, 7]");
  ASSERT_EQ(key.segments.size(), 3U);
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, SpreadOfUnknownValueIsDynamic)
{
  const NormalizedKey key = key_of("const key = ['todos', ...rest];");
  EXPECT_EQ(key.display, "[todos, $rest]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

TEST(KeysNormalizer, Idempotent)
{
  auto project = make_single_file_project(
    "const key = ['todos', { page, sort: 'asc' }, `item-${id}`, fetcher(id)];");
  const NormalizedKey first = project->normalize("src/test.tsx", "key");
  const NormalizedKey second = project->normalize("src/test.tsx", "key");
  EXPECT_EQ(first.id, second.id);
  EXPECT_EQ(first.display, second.display);
  EXPECT_EQ(first, second);
}

// ============================================================================
// Objects
// ============================================================================

TEST(KeysNormalizer, ObjectPropertiesAreSorted)
{
  const NormalizedKey ab = key_of("const key = ['todos', { a: 1, b: 2 }];");
  const NormalizedKey ba = key_of("const key = ['todos', { b: 2, a: 1 }];");
  EXPECT_EQ(ab.display, "[todos, {a: 1, b: 2}]");
  EXPECT_EQ(ab.display, ba.display);
  EXPECT_EQ(ab.id, ba.id);
}

TEST(KeysNormalizer, UndefinedPropertiesAreDropped)
{
  const NormalizedKey with = key_of("const key = ['todos', { a: 1, b: undefined }];");
  const NormalizedKey without = key_of("const key = ['todos', { a: 1 }];");
  EXPECT_EQ(with.display, without.display);
  EXPECT_EQ(with.id, without.id);
  EXPECT_EQ(with.resolution, Resolution::Static);
}

TEST(KeysNormalizer, ShorthandPropertyUsesValue)
{
  const NormalizedKey key = key_of("const key = ['todos', { status, page: 1 }];");
  EXPECT_EQ(key.display, "[todos, {page: 1, status: $status}]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

TEST(KeysNormalizer, SpreadKeepsSourceOrder)
{
  const NormalizedKey key = key_of(
    "const base = { z: 1 };\n"
    "const key = ['todos', { ...base, b: 2, a: 1 }];\n");
  EXPECT_EQ(key.display, "[todos, {z: 1, b: 2, a: 1}]");
}

TEST(KeysNormalizer, ComputedKeyKeepsSourceOrder)
{
  const NormalizedKey key = key_of("const key = ['todos', { b: 2, ['a']: 1 }];");
  EXPECT_EQ(key.display, "[todos, {b: 2, [a]: 1}]");
}

TEST(KeysNormalizer, EmbeddedQueryKeyIsUnwrapped)
{
  const NormalizedKey key = key_of("const key = [{ queryKey: ['todos', 'list'] }];");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.segments.size(), 2U);
}

TEST(KeysNormalizer, OptionsObjectYieldsItsQueryKey)
{
  const NormalizedKey key = key_of("const key = { queryKey: ['todos'], staleTime: 5 };");
  EXPECT_EQ(key.display, "[todos]");
}

TEST(KeysNormalizer, QueryOptionsPassesItsKeyThrough)
{
  const NormalizedKey key =
    key_of("const key = queryOptions({ queryKey: ['todos', 'detail'], staleTime: 5 });");
  EXPECT_EQ(key.display, "[todos, detail]");
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, FrozenConstantPassesThrough)
{
  const NormalizedKey key = key_of(
    "const base = ['todos', 'list'];\n"
    "const key = Object.freeze(base);");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.segments.size(), 2U);
}

TEST(KeysNormalizer, NestedIdentityWrappersPassThrough)
{
  const NormalizedKey key =
    key_of("const key = Object.freeze(queryOptions({ queryKey: ['todos'] }));");
  EXPECT_EQ(key.display, "[todos]");
}

// ============================================================================
// Templates, calls and conditionals
// ============================================================================

TEST(KeysNormalizer, TemplateRendersHoles)
{
  const NormalizedKey key = key_of("const key = ['todo', `item-${id}`];");
  EXPECT_EQ(key.display, "[todo, item-${$id}]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);

  const NormalizedKey fixed = key_of(
    "const kind = 'open';\n"
    "const key = [`todos-${kind}`];\n");
  EXPECT_EQ(fixed.display, "[todos-${open}]");
  EXPECT_EQ(fixed.resolution, Resolution::Static);
}

TEST(KeysNormalizer, ConditionalIsOpaque)
{
  const NormalizedKey key = key_of("const key = ['todos', done ? 'done' : 'open'];");
  EXPECT_EQ(key.display, "[todos, cond(...)]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

TEST(KeysNormalizer, UnresolvedCallIsNamed)
{
  const NormalizedKey key = key_of("const key = ['todos', currentUser()];");
  EXPECT_EQ(key.display, "[todos, call(currentUser)]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

TEST(KeysNormalizer, MethodCallIsApproximated)
{
  const NormalizedKey key = key_of("const key = ['todos', filters.serialize('x')];");
  EXPECT_EQ(key.display, "[todos, $filters.serialize(x)]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

TEST(KeysNormalizer, CollectionTransformRendersReceiver)
{
  const NormalizedKey key = key_of("const key = ['todos', ids.slice().sort()];");
  EXPECT_EQ(key.display, "[todos, $ids]");
}

TEST(KeysNormalizer, EmptyFallbackIsIgnored)
{
  const NormalizedKey key = key_of("const key = ['todos', search || ''];");
  EXPECT_EQ(key.display, "[todos, $search]");
}

TEST(KeysNormalizer, LocalFactoryReturnIsUsed)
{
  const NormalizedKey key = key_of(
    "function todoListKey() { return ['todos', 'list']; }\n"
    "const key = todoListKey();\n");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, CyclicAliasTerminates)
{
  const NormalizedKey key = key_of(
    "const a = b;\n"
    "const b = a;\n"
    "const key = ['x', a];\n");
  ASSERT_EQ(key.segments.size(), 2U);
  EXPECT_EQ(key.segments[0], "x");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

// ============================================================================
// Cross-file
// ============================================================================

TEST(KeysNormalizer, ImportedConstant)
{
  auto project = make_project({
    {"src/keys.ts", "export const TODOS_KEY = ['todos'] as const;"},
    {"src/use.ts",
     "import { TODOS_KEY } from './keys';\n"
     "const key = [...TODOS_KEY, 'list'];\n"},
  });
  ASSERT_TRUE(project->failures.empty());

  const NormalizedKey key = project->normalize("src/use.ts", "key");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, ImportedFactoryKeepsParameterSymbolic)
{
  auto project = make_project({
    {"src/keys.ts", "export const todoKey = (id: string) => ['todo', id];"},
    {"src/use.ts",
     "import { todoKey } from './keys';\n"
     "const key = todoKey(userId);\n"},
  });
  ASSERT_TRUE(project->failures.empty());

  const NormalizedKey key = project->normalize("src/use.ts", "key");
  EXPECT_EQ(key.display, "[todo, $id]");
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
}

TEST(KeysNormalizer, KeyFactoryObjectMember)
{
  auto project = make_project({
    {"src/keys.ts",
     "export const todoKeys = {\n"
     "  all: ['todos'],\n"
     "  lists: () => [...todoKeys.all, 'list'],\n"
     "};\n"},
    {"src/use.ts",
     "import { todoKeys } from './keys';\n"
     "const key = todoKeys.lists();\n"},
  });
  ASSERT_TRUE(project->failures.empty());

  const NormalizedKey key = project->normalize("src/use.ts", "key");
  EXPECT_EQ(key.display, "[todos, list]");
  EXPECT_EQ(key.resolution, Resolution::Static);
}

TEST(KeysNormalizer, WithoutResolverIdentifiersStaySymbolic)
{
  auto unit = qk_graph::test_support::parse("const scope = 'todos'; const key = [scope];");
  ASSERT_NE(unit.program, nullptr);

  AstContext scratch;
  KeyNormalizer normalizer(nullptr, scratch);
  const NormalizedKey key =
    normalizer.normalize(qk_graph::test_support::find_initializer(unit.program, "key"));
  EXPECT_EQ(key.display, "[$scope]");
}

// ============================================================================
// Free helpers
// ============================================================================

TEST(KeysNormalizerHelpers, QueryKeyLikeNames)
{
  EXPECT_TRUE(is_query_key_like_name("queryKey"));
  EXPECT_TRUE(is_query_key_like_name("queryKeys"));
  EXPECT_TRUE(is_query_key_like_name("query_key"));
  EXPECT_TRUE(is_query_key_like_name("QUERYKEY"));
  EXPECT_FALSE(is_query_key_like_name("key"));
  EXPECT_FALSE(is_query_key_like_name("queryFn"));
}

TEST(KeysNormalizerHelpers, CollectionHooks)
{
  EXPECT_TRUE(is_query_collection_hook("useQueries"));
  EXPECT_TRUE(is_query_collection_hook("useSuspenseQueries"));
  EXPECT_FALSE(is_query_collection_hook("useQuery"));
}
