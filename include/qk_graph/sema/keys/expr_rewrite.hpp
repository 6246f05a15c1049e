// qk_graph/sema/keys/expr_rewrite.hpp - Identifier substitution over expressions
//
// Factory return expressions are specialised for one call site by
// substituting the call's arguments for the identifiers they bind. The
// rewritten tree lives in a scratch AstContext and shares every unchanged
// subtree with the original.
//
#pragma once

#include <string_view>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/ast/ast_context.hpp"

namespace qk_graph
{

/**
 * True if `name` occurs in a reference position of `expr`.
 *
 * Non-computed property keys, non-computed member names and function
 * parameter lists are not references.
 */
[[nodiscard]] bool expression_contains_identifier(const Expr * expr, std::string_view name);

/**
 * Replace every reference to `name` inside `expr` by `replacement`.
 *
 * Descends through arrays, objects, members, calls, templates, unary,
 * binary, logical, assignment, conditional and sequence expressions.
 *
 * @return `expr` itself when nothing was replaced, otherwise a new tree
 *         allocated in `scratch` that keeps the original source ranges
 */
[[nodiscard]] const Expr * substitute_identifier(
  AstContext & scratch, const Expr * expr, std::string_view name, const Expr * replacement);

/// Copy of `object` with `target` (one of its properties) holding `value`
[[nodiscard]] const ObjectExpr * replace_property_value(
  AstContext & scratch, const ObjectExpr * object, const Property * target, const Expr * value);

/// Argument list whose first element is `first`
[[nodiscard]] gsl::span<Expr *> replace_first_argument(
  AstContext & scratch, gsl::span<Expr *> args, const Expr * first);

}  // namespace qk_graph
