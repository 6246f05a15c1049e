// tests/unit/syntax/test_frontend.cpp - Unit tests for the parse pipeline and local bindings
//

#include <gtest/gtest.h>

#include <string>

#include "qk_graph/syntax/frontend.hpp"
#include "qk_graph/test_support/parse_helpers.hpp"

using namespace qk_graph;
using qk_graph::test_support::find_initializer;
using qk_graph::test_support::parse;

// ============================================================================
// Grammar selection
// ============================================================================

TEST(SyntaxFrontend, GrammarFollowsExtension)
{
  EXPECT_EQ(grammar_for_path("a.ts"), ts_ll::Grammar::TypeScript);
  EXPECT_EQ(grammar_for_path("a.mts"), ts_ll::Grammar::TypeScript);
  EXPECT_EQ(grammar_for_path("a.cts"), ts_ll::Grammar::TypeScript);
  EXPECT_EQ(grammar_for_path("a.tsx"), ts_ll::Grammar::Tsx);
  EXPECT_EQ(grammar_for_path("a.js"), ts_ll::Grammar::Tsx);
  EXPECT_EQ(grammar_for_path("a.mjs"), ts_ll::Grammar::Tsx);
}

TEST(SyntaxFrontend, JsxElement)
{
  auto unit = parse("const el = <Todo id={1} title=\"x\" />;\n", "/virtual/App.tsx");
  ASSERT_NE(unit.program, nullptr) << unit.error_message;

  const auto * el = dyn_cast<JsxElement>(find_initializer(unit.program, "el"));
  ASSERT_NE(el, nullptr);
  EXPECT_EQ(el->name, "Todo");
  EXPECT_EQ(el->attributes.size(), 2U);
}

TEST(SyntaxFrontend, AngleBracketCastInTypeScript)
{
  auto unit = parse("declare const y: unknown;\nconst x = <string[]>y;\n", "/virtual/a.ts");
  ASSERT_NE(unit.program, nullptr) << unit.error_message;
  EXPECT_TRUE(isa<TsCastExpr>(find_initializer(unit.program, "x")));
}

TEST(SyntaxFrontend, AsConstIsACast)
{
  auto unit = parse("const key = ['todos'] as const;\n", "/virtual/a.ts");
  ASSERT_NE(unit.program, nullptr);

  const Expr * init = find_initializer(unit.program, "key");
  EXPECT_TRUE(isa<TsCastExpr>(init));
  EXPECT_TRUE(isa<ArrayExpr>(unwrap_expr(init)));
}

TEST(SyntaxFrontend, OtherGrammarIsTriedOnFailure)
{
  auto unit = parse("export const El = () => <div />;\n", "/virtual/component.ts");
  ASSERT_NE(unit.program, nullptr) << unit.error_message;
  EXPECT_TRUE(unit.error_message.empty());
}

TEST(SyntaxFrontend, TypeOnlyImport)
{
  auto unit = parse(
    "import type { QueryKey } from '@tanstack/react-query';\n"
    "import { useQuery } from '@tanstack/react-query';\n",
    "/virtual/a.ts");
  ASSERT_NE(unit.program, nullptr);
  ASSERT_EQ(unit.program->body.size(), 2U);

  const auto * type_import = dyn_cast<ImportDecl>(unit.program->body[0]);
  ASSERT_NE(type_import, nullptr);
  EXPECT_TRUE(type_import->typeOnly);
  EXPECT_EQ(type_import->source, "@tanstack/react-query");

  const auto * value_import = dyn_cast<ImportDecl>(unit.program->body[1]);
  ASSERT_NE(value_import, nullptr);
  EXPECT_FALSE(value_import->typeOnly);
  ASSERT_EQ(value_import->specifiers.size(), 1U);
}

TEST(SyntaxFrontend, SyntaxErrorIsReported)
{
  auto unit = parse("const = ;\n", "/virtual/broken.ts");
  EXPECT_EQ(unit.program, nullptr);
  EXPECT_NE(unit.error_message.find(" at 1:"), std::string::npos) << unit.error_message;
  EXPECT_TRUE(unit.diags.has_errors());
  EXPECT_TRUE(unit.file_id.is_valid());
}

TEST(SyntaxFrontend, RangesPointIntoTheSource)
{
  auto unit = parse("const key = ['todos', id];\n");
  ASSERT_NE(unit.program, nullptr);
  EXPECT_EQ(unit.slice(find_initializer(unit.program, "key")->get_range()), "['todos', id]");
}

// ============================================================================
// Local bindings
// ============================================================================

TEST(SyntaxBindings, ConstReference)
{
  auto unit = parse("const a = ['x'];\nconst b = a;\n");
  ASSERT_NE(unit.program, nullptr);

  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "b"));
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->binding, nullptr);
  EXPECT_EQ(ref->binding->kind, BindingKind::Const);
  EXPECT_TRUE(ref->binding->constant);
  EXPECT_TRUE(isa<ArrayExpr>(ref->binding->init));
  EXPECT_EQ(ref->binding->owner, nullptr);
}

TEST(SyntaxBindings, GlobalsHaveNoBinding)
{
  auto unit = parse("const w = window;\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "w"));
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->binding, nullptr);
}

TEST(SyntaxBindings, ReassignmentClearsConstant)
{
  auto unit = parse("let n = 1;\nn = 2;\nconst m = n;\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "m"));
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->binding, nullptr);
  EXPECT_EQ(ref->binding->kind, BindingKind::Let);
  EXPECT_FALSE(ref->binding->constant);
}

TEST(SyntaxBindings, VarIsHoisted)
{
  auto unit = parse("const early = later;\nvar later = 1;\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "early"));
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->binding, nullptr);
  EXPECT_EQ(ref->binding->kind, BindingKind::Var);
}

TEST(SyntaxBindings, BlockScopeDoesNotLeak)
{
  auto unit = parse("{ const inner = 1; }\nconst outside = inner;\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "outside"));
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(ref->binding, nullptr);
}

TEST(SyntaxBindings, ParametersKnowTheirFunction)
{
  auto unit = parse("function f(first, { second }) {\n  const ref = second;\n}\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "ref"));
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->binding, nullptr);
  EXPECT_TRUE(ref->binding->is_param());
  EXPECT_EQ(ref->binding->paramIndex, 1);
  EXPECT_NE(ref->binding->function, nullptr);
}

TEST(SyntaxBindings, InnerNameShadowsOuter)
{
  auto unit = parse(
    "const id = 'outer';\n"
    "function f(id) {\n"
    "  const ref = id;\n"
    "}\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "ref"));
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->binding, nullptr);
  EXPECT_EQ(ref->binding->kind, BindingKind::Param);
}

TEST(SyntaxBindings, CallbackKnowsItsCall)
{
  auto unit = parse("const r = useMemo(() => ['a'], []);\n");
  const auto * call = dyn_cast<CallExpr>(find_initializer(unit.program, "r"));
  ASSERT_NE(call, nullptr);
  ASSERT_FALSE(call->arguments.empty());

  const auto * callback = dyn_cast<FunctionExpr>(call->arguments[0]);
  ASSERT_NE(callback, nullptr);
  EXPECT_EQ(callback->enclosingCall, call);
  EXPECT_TRUE(callback->isArrow);
}

TEST(SyntaxBindings, ImportsAreBindings)
{
  auto unit = parse("import { todoKeys as keys } from './keys';\nconst k = keys;\n");
  const auto * ref = dyn_cast<Identifier>(find_initializer(unit.program, "k"));
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->binding, nullptr);
  EXPECT_TRUE(ref->binding->is_import());
}

TEST(SyntaxBindings, ScopeTable)
{
  auto unit = parse(
    "import { a } from './a';\n"
    "const top = 1;\n"
    "function f(p) {\n"
    "  if (p) { let inner = p; }\n"
    "}\n");
  ASSERT_NE(unit.program, nullptr);

  const Scope * module = unit.bindings->module_scope();
  ASSERT_NE(module, nullptr);
  // module, function, block
  EXPECT_GE(unit.bindings->scope_count(), 3U);

  const Binding * top = module->lookup_local("top");
  ASSERT_NE(top, nullptr);
  EXPECT_TRUE(top->is_variable());
  EXPECT_NE(module->lookup_local("f"), nullptr);
  const Binding * import = module->lookup_local("a");
  ASSERT_NE(import, nullptr);
  EXPECT_FALSE(import->is_variable());
  EXPECT_EQ(module->lookup_local("inner"), nullptr);
  EXPECT_EQ(module->lookup_local("p"), nullptr);
}
