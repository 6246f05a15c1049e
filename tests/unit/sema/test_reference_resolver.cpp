// tests/unit/sema/test_reference_resolver.cpp - Unit tests for cross-file reference resolution
//

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "qk_graph/sema/resolution/reference_resolver.hpp"
#include "qk_graph/test_support/parse_helpers.hpp"

using namespace qk_graph;
using qk_graph::test_support::make_project;
using qk_graph::test_support::TestProject;

namespace
{

const char * const k_keys_module =
  "export const todosKey = ['todos'];\n"
  "export const detailKey = (id: number) => ['todos', 'detail', id];\n"
  "export function listKey() { return ['todos', 'list'] as const; }\n"
  "export const todoKeys = { all: ['todos'], nested: { deep: ['todos', 'deep'] } };\n";

/// Number of elements of the array `expr` resolves to, or -1
int array_size(const Expr * expr)
{
  const auto * array = dyn_cast<ArrayExpr>(expr);
  return array != nullptr ? static_cast<int>(array->elements.size()) : -1;
}

const Expr * resolve(TestProject & project, const char * path, const char * name)
{
  return project.resolver->resolve_reference(project.initializer(path, name));
}

}  // namespace

// ============================================================================
// Symbol tables
// ============================================================================

TEST(SemaSymbolTable, RecordsExportsAndImports)
{
  auto project = make_project({
    {"src/keys.ts", k_keys_module},
    {"src/use.ts",
     "import def, { todosKey as tk } from './keys';\n"
     "import * as keys from './keys';\n"
     "export { tk as renamed };\n"
     "export * from './more';\n"
     "export { a as b } from './other';\n"
     "function local() { const userQueryKey = ['users']; return userQueryKey; }\n"},
  });
  ASSERT_TRUE(project->failures.empty());

  const FileSymbolTable * keys = project->index->find("/virtual/src/keys.ts");
  ASSERT_NE(keys, nullptr);
  EXPECT_TRUE(keys->find_export("todosKey").has_value());
  EXPECT_TRUE(keys->find_export("listKey").has_value());
  EXPECT_NE(keys->find_value("todoKeys"), nullptr);
  EXPECT_NE(keys->find_function("detailKey"), nullptr);
  EXPECT_NE(keys->find_function("listKey"), nullptr);

  const FileSymbolTable * use = project->index->find("/virtual/src/use.ts");
  ASSERT_NE(use, nullptr);
  const ImportBinding * def = use->find_import("def");
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->kind, ImportKind::Default);
  const ImportBinding * tk = use->find_import("tk");
  ASSERT_NE(tk, nullptr);
  EXPECT_EQ(tk->imported, "todosKey");
  EXPECT_EQ(tk->source, "./keys");
  EXPECT_EQ(use->find_import("keys")->kind, ImportKind::Namespace);

  EXPECT_EQ(use->find_export("renamed"), std::string_view("tk"));
  ASSERT_EQ(use->reExports.size(), 2U);
  EXPECT_TRUE(use->reExports[0].all);
  EXPECT_EQ(use->reExports[1].imported, "a");
  EXPECT_EQ(use->reExports[1].exported, "b");

  // Key-named declarations are recorded at any depth
  EXPECT_NE(use->find_value("userQueryKey"), nullptr);
}

TEST(SemaSymbolTable, AnonymousDefaultExport)
{
  auto project = make_project({{"src/keys.ts", "export default ['todos', 'all'];\n"}});
  const FileSymbolTable * keys = project->index->find("/virtual/src/keys.ts");
  ASSERT_NE(keys, nullptr);
  EXPECT_EQ(keys->find_export("default"), k_default_export_name);
  EXPECT_EQ(array_size(keys->find_value(k_default_export_name)), 2);
}

// ============================================================================
// Imports
// ============================================================================

TEST(SemaReferenceResolver, LocalConstant)
{
  auto project = make_project({{"src/a.ts", "const base = ['a', 'b'];\nconst key = base;\n"}});
  EXPECT_EQ(array_size(resolve(*project, "src/a.ts", "key")), 2);
}

TEST(SemaReferenceResolver, NamedImport)
{
  auto project = make_project({
    {"src/keys.ts", k_keys_module},
    {"src/use.ts", "import { todosKey as k } from './keys';\nconst key = k;\n"},
  });
  EXPECT_EQ(array_size(resolve(*project, "src/use.ts", "key")), 1);
}

TEST(SemaReferenceResolver, NamespaceMember)
{
  auto project = make_project({
    {"src/keys.ts", k_keys_module},
    {"src/use.ts", "import * as keys from './keys';\nconst key = keys.todosKey;\n"},
  });
  EXPECT_EQ(array_size(resolve(*project, "src/use.ts", "key")), 1);
}

TEST(SemaReferenceResolver, DefaultImport)
{
  auto project = make_project({
    {"src/keys.ts", "export default ['todos', 'all'];\n"},
    {"src/use.ts", "import allKey from './keys';\nconst key = allKey;\n"},
  });
  EXPECT_EQ(array_size(resolve(*project, "src/use.ts", "key")), 2);
}

TEST(SemaReferenceResolver, ReExportChains)
{
  auto project = make_project({
    {"src/keys.ts", k_keys_module},
    {"src/barrel.ts", "export { todosKey as listAll } from './keys';\n"},
    {"src/star.ts", "export * from './barrel';\n"},
    {"src/use.ts", "import { listAll } from './star';\nconst key = listAll;\n"},
  });
  ASSERT_TRUE(project->failures.empty());
  EXPECT_EQ(array_size(resolve(*project, "src/use.ts", "key")), 1);
}

TEST(SemaReferenceResolver, ObjectMembers)
{
  auto project = make_project({
    {"src/keys.ts", k_keys_module},
    {"src/use.ts",
     "import { todoKeys } from './keys';\n"
     "const key = todoKeys.nested.deep;\n"
     "const computed = todoKeys['all'];\n"},
  });
  EXPECT_EQ(array_size(resolve(*project, "src/use.ts", "key")), 2);
  EXPECT_EQ(array_size(resolve(*project, "src/use.ts", "computed")), 1);
}

TEST(SemaReferenceResolver, CallResults)
{
  auto project = make_project({
    {"src/keys.ts", k_keys_module},
    {"src/use.ts",
     "import { detailKey, listKey } from './keys';\n"
     "const detail = detailKey(3);\n"
     "const list = listKey();\n"},
  });

  const auto * detail = dyn_cast<CallExpr>(project->initializer("src/use.ts", "detail"));
  ASSERT_NE(detail, nullptr);
  EXPECT_EQ(array_size(project->resolver->resolve_call_result(detail->callee)), 3);

  const auto * list = dyn_cast<CallExpr>(project->initializer("src/use.ts", "list"));
  ASSERT_NE(list, nullptr);
  EXPECT_EQ(array_size(unwrap_expr(project->resolver->resolve_call_result(list->callee))), 2);
}

// ============================================================================
// Workspace factory search
// ============================================================================

TEST(SemaWorkspaceFactory, SingleDefinitionIsFound)
{
  auto project = make_project({
    {"src/keys.ts", "export function todoQueryKey(id: number) { return ['todo', id]; }\n"},
    {"src/use.ts", "const x = 1;\n"},
  });
  const FileSymbolTable * use = project->index->find("/virtual/src/use.ts");
  ASSERT_NE(use, nullptr);

  EXPECT_EQ(array_size(project->resolver->resolve_workspace_factory(*use, "todoQueryKey")), 2);
  EXPECT_EQ(project->resolver->resolve_workspace_factory(*use, "missingQueryKey"), nullptr);
}

TEST(SemaWorkspaceFactory, OnlyKeyLikeNamesAreSearched)
{
  auto project = make_project({
    {"src/keys.ts", "export function makeTodo() { return ['todo']; }\n"},
    {"src/use.ts", "const x = 1;\n"},
  });
  const FileSymbolTable * use = project->index->find("/virtual/src/use.ts");
  ASSERT_NE(use, nullptr);
  EXPECT_EQ(project->resolver->resolve_workspace_factory(*use, "makeTodo"), nullptr);
}

TEST(SemaWorkspaceFactory, NearestDirectoryWins)
{
  auto project = make_project({
    {"apps/web/keys.ts", "export const listQueryKey = () => ['web'];\n"},
    {"apps/admin/keys.ts", "export const listQueryKey = () => ['admin', 'list'];\n"},
    {"apps/web/page.ts", "const x = 1;\n"},
  });
  const FileSymbolTable * page = project->index->find("/virtual/apps/web/page.ts");
  ASSERT_NE(page, nullptr);
  EXPECT_EQ(array_size(project->resolver->resolve_workspace_factory(*page, "listQueryKey")), 1);
}

TEST(SemaWorkspaceFactory, EquallyCloseDefinitionsAreAmbiguous)
{
  auto project = make_project({
    {"libs/a/keys.ts", "export function listQueryKey() { return ['a']; }\n"},
    {"libs/b/keys.ts", "export function listQueryKey() { return ['b', 'list']; }\n"},
    {"app/page.ts", "const x = 1;\n"},
  });
  const FileSymbolTable * page = project->index->find("/virtual/app/page.ts");
  ASSERT_NE(page, nullptr);
  EXPECT_EQ(project->resolver->resolve_workspace_factory(*page, "listQueryKey"), nullptr);
}

TEST(SemaReferenceResolver, ComputedMemberWithConstantKey)
{
  auto project = make_project({
    {"src/a.ts",
     "const LIST = 'list';\n"
     "const todoKeys = { list: ['todos', 'list'], all: ['todos'] };\n"
     "const key = todoKeys[LIST];\n"},
  });
  EXPECT_EQ(array_size(resolve(*project, "src/a.ts", "key")), 2);
}

// ============================================================================
// Failures
// ============================================================================

TEST(SemaReferenceResolver, CyclicReExportsAreUnresolved)
{
  auto project = make_project({
    {"src/a.ts", "export { x } from './b';\n"},
    {"src/b.ts", "export { x } from './a';\n"},
    {"src/use.ts", "import { x } from './a';\nconst key = x;\n"},
  });
  EXPECT_EQ(resolve(*project, "src/use.ts", "key"), nullptr);
}

TEST(SemaReferenceResolver, UnknownModulesAreUnresolved)
{
  auto project = make_project({
    {"src/use.ts",
     "import { key as external } from 'some-package';\n"
     "import { missing } from './nowhere';\n"
     "const key = external;\n"
     "const other = missing;\n"},
  });
  EXPECT_EQ(resolve(*project, "src/use.ts", "key"), nullptr);
  EXPECT_EQ(resolve(*project, "src/use.ts", "other"), nullptr);
}

TEST(SemaReferenceResolver, AliasCycleTerminates)
{
  auto project = make_project({{"src/a.ts", "const a = b;\nconst b = a;\nconst key = a;\n"}});
  const Expr * resolved = resolve(*project, "src/a.ts", "key");
  EXPECT_EQ(array_size(resolved), -1);
  EXPECT_TRUE(resolved == nullptr || isa<Identifier>(resolved));
}

// ============================================================================
// Helpers
// ============================================================================

TEST(SemaReferenceHelpers, NumberFormatting)
{
  EXPECT_EQ(js_number_to_string(1.0), "1");
  EXPECT_EQ(js_number_to_string(2.5), "2.5");
  EXPECT_EQ(js_number_to_string(-0.0), "0");
  EXPECT_EQ(js_number_to_string(1e21), "1e+21");
}

TEST(SemaReferenceHelpers, QueryKeySymbolNames)
{
  EXPECT_TRUE(is_query_key_symbol_name("todoQueryKey"));
  EXPECT_FALSE(is_query_key_symbol_name("USER_RQ_KEY"));
  EXPECT_TRUE(is_query_key_symbol_name("rqKeys"));
  EXPECT_FALSE(is_query_key_symbol_name("queryKey"));
  EXPECT_FALSE(is_query_key_symbol_name("todos"));
}
