// qk_graph/sema/resolution/local_binding_resolver.hpp - Scope walk attaching local bindings
//
// Runs once per parsed file, before any cross-file resolution. Afterwards
// every Identifier reference carries the Binding it refers to (or nullptr
// for globals), and every function passed directly as a call argument knows
// that call.
//
#pragma once

#include <vector>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/ast/visitor.hpp"
#include "qk_graph/sema/resolution/binding.hpp"

namespace qk_graph
{

/**
 * Scope walk following JavaScript scoping rules:
 * - `var` and parameters live in the enclosing function (or module) scope
 * - `let`, `const`, `class` and nested function declarations are block scoped
 * - declarations are hoisted, so references may precede them
 *
 * Any assignment, update or `var` redeclaration clears Binding::constant.
 */
class LocalBindingResolver : public RecursiveAstVisitor<LocalBindingResolver>
{
public:
  explicit LocalBindingResolver(BindingTable & table) : table_(table) {}

  /// Entry point
  void resolve(Program & program);

  // ===========================================================================
  // Visitor Methods
  // ===========================================================================

  bool visit_identifier(Identifier * node);
  bool visit_function_expr(FunctionExpr * node);
  bool visit_block_stmt(BlockStmt * node);
  bool visit_for_stmt(ForStmt * node);
  bool visit_for_in_of_stmt(ForInOfStmt * node);
  bool visit_switch_stmt(SwitchStmt * node);
  bool visit_catch_clause(CatchClause * node);
  bool visit_assignment_expr(AssignmentExpr * node);
  bool visit_update_expr(UpdateExpr * node);
  bool visit_call_expr(CallExpr * node);
  bool visit_import_decl(ImportDecl * node);
  bool visit_export_named_decl(ExportNamedDecl * node);

private:
  // Hoisting
  void hoist_var_declarations(AstNode * stmt);
  void hoist_lexical_declarations(gsl::span<AstNode *> body);
  void declare_variable_decl(VariableDecl * decl);
  void declare_pattern(
    AstNode * pattern, BindingKind kind, const AstNode * declarator, const Expr * init);
  void declare_params(FunctionExpr * fn);

  /// Declare one name in the scope chosen by `kind`
  Binding * declare(
    BindingIdentifier * id, BindingKind kind, const AstNode * declarator, const Expr * init);

  // Reassignment
  void mark_assignment_target(AstNode * target);
  void mark_reassigned(Identifier * id);

  void push_scope(ScopeKind kind);
  void pop_scope();

  [[nodiscard]] const FunctionExpr * current_owner() const
  {
    return owners_.empty() ? nullptr : owners_.back();
  }

  BindingTable & table_;
  Scope * current_ = nullptr;
  std::vector<const FunctionExpr *> owners_;

  // Parameter being declared (index into the function's parameter list)
  const FunctionExpr * param_function_ = nullptr;
  int param_index_ = -1;
};

/// Collect every BindingIdentifier introduced by a pattern (in source order)
void collect_pattern_identifiers(AstNode * pattern, std::vector<BindingIdentifier *> & out);

}  // namespace qk_graph
