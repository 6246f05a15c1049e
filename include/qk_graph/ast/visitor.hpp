// qk_graph/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// AstVisitor dispatches on NodeKind to visit_<snake>() methods generated from
// ast_nodes.def. RecursiveAstVisitor additionally walks children in source
// order (pre-order: a node is visited before its children).
//
#pragma once

#include <type_traits>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/ast/ast_enums.hpp"
#include "qk_graph/basic/casting.hpp"

namespace qk_graph
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * @code
 *   class CallCounter : public ConstRecursiveAstVisitor<CallCounter> {
 *   public:
 *     bool visit_call_expr(const CallExpr * node) {
 *       ++count;
 *       return RecursiveAstVisitor::visit_call_expr(node);
 *     }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE(Class, Snake) \
  case NodeKind::Class:        \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "qk_graph/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from ast_nodes.def)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Snake)                                         \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_PATTERN(Class, Snake)                                      \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_pattern(node);                               \
  }
#define AST_NODE_TYPE(Class, Snake)                                         \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_STMT(Class, Snake)                                         \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Snake)                                         \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Snake)                                      \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Snake)                                          \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "qk_graph/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_pattern(detail::propagate_const_t<NodePtrT, Pattern> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes.
 *
 * Override a visit method and call the base implementation to continue
 * into the children, or skip it to prune the subtree. Returning false
 * aborts the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Absent children (nullptr) do not stop the traversal
  bool visit(NodePtrT node) { return node == nullptr || Base::visit(node); }

  /// Leaves (and anything without an override) continue the traversal
  bool visit_node(NodePtrT /*node*/) { return true; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_template_literal(NodePtr<TemplateLiteral> node)
  {
    return visit_all(node->expressions);
  }

  bool visit_array_expr(NodePtr<ArrayExpr> node) { return visit_all(node->elements); }

  bool visit_object_expr(NodePtr<ObjectExpr> node) { return visit_all(node->properties); }

  bool visit_spread_element(NodePtr<SpreadElement> node)
  {
    return get_derived().visit(node->argument);
  }

  bool visit_member_expr(NodePtr<MemberExpr> node)
  {
    if (!get_derived().visit(node->object)) return false;
    return !node->computed || get_derived().visit(node->property);
  }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    if (!get_derived().visit(node->callee)) return false;
    return visit_all(node->arguments);
  }

  bool visit_new_expr(NodePtr<NewExpr> node)
  {
    if (!get_derived().visit(node->callee)) return false;
    return visit_all(node->arguments);
  }

  bool visit_function_expr(NodePtr<FunctionExpr> node)
  {
    if (!visit_all(node->params)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_class_expr(NodePtr<ClassExpr> node)
  {
    if (node->superClass && !get_derived().visit(node->superClass)) return false;
    return visit_all(node->members);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->argument); }

  bool visit_update_expr(NodePtr<UpdateExpr> node) { return get_derived().visit(node->argument); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->left)) return false;
    return get_derived().visit(node->right);
  }

  bool visit_logical_expr(NodePtr<LogicalExpr> node)
  {
    if (!get_derived().visit(node->left)) return false;
    return get_derived().visit(node->right);
  }

  bool visit_conditional_expr(NodePtr<ConditionalExpr> node)
  {
    if (!get_derived().visit(node->test)) return false;
    if (!get_derived().visit(node->consequent)) return false;
    return get_derived().visit(node->alternate);
  }

  bool visit_assignment_expr(NodePtr<AssignmentExpr> node)
  {
    if (!get_derived().visit(node->left)) return false;
    return get_derived().visit(node->right);
  }

  bool visit_sequence_expr(NodePtr<SequenceExpr> node) { return visit_all(node->expressions); }

  bool visit_ts_cast_expr(NodePtr<TsCastExpr> node)
  {
    return get_derived().visit(node->expression);
  }

  bool visit_await_expr(NodePtr<AwaitExpr> node) { return get_derived().visit(node->argument); }

  bool visit_jsx_element(NodePtr<JsxElement> node)
  {
    if (!visit_all(node->attributes)) return false;
    return visit_all(node->children);
  }

  bool visit_opaque_expr(NodePtr<OpaqueExpr> node) { return visit_all(node->children); }

  // ===========================================================================
  // Patterns
  // ===========================================================================

  bool visit_object_pattern(NodePtr<ObjectPattern> node) { return visit_all(node->properties); }

  bool visit_array_pattern(NodePtr<ArrayPattern> node) { return visit_all(node->elements); }

  bool visit_assignment_pattern(NodePtr<AssignmentPattern> node)
  {
    if (!get_derived().visit(node->left)) return false;
    return get_derived().visit(node->right);
  }

  bool visit_rest_element(NodePtr<RestElement> node) { return get_derived().visit(node->argument); }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_block_stmt(NodePtr<BlockStmt> node) { return visit_all(node->body); }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expression); }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return get_derived().visit(node->argument); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    if (!get_derived().visit(node->test)) return false;
    if (!get_derived().visit(node->consequent)) return false;
    return get_derived().visit(node->alternate);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    if (!get_derived().visit(node->init)) return false;
    if (!get_derived().visit(node->test)) return false;
    if (!get_derived().visit(node->update)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_for_in_of_stmt(NodePtr<ForInOfStmt> node)
  {
    if (!get_derived().visit(node->left)) return false;
    if (!get_derived().visit(node->right)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    if (!get_derived().visit(node->test)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_switch_stmt(NodePtr<SwitchStmt> node)
  {
    if (!get_derived().visit(node->discriminant)) return false;
    return visit_all(node->cases);
  }

  bool visit_try_stmt(NodePtr<TryStmt> node)
  {
    if (!get_derived().visit(node->block)) return false;
    if (!get_derived().visit(node->handler)) return false;
    return get_derived().visit(node->finalizer);
  }

  bool visit_labeled_stmt(NodePtr<LabeledStmt> node) { return get_derived().visit(node->body); }

  bool visit_throw_stmt(NodePtr<ThrowStmt> node) { return get_derived().visit(node->argument); }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  bool visit_variable_decl(NodePtr<VariableDecl> node) { return visit_all(node->declarators); }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return get_derived().visit(node->function);
  }

  bool visit_class_decl(NodePtr<ClassDecl> node) { return get_derived().visit(node->klass); }

  bool visit_import_decl(NodePtr<ImportDecl> node) { return visit_all(node->specifiers); }

  bool visit_export_named_decl(NodePtr<ExportNamedDecl> node)
  {
    if (!get_derived().visit(node->declaration)) return false;
    return visit_all(node->specifiers);
  }

  bool visit_export_default_decl(NodePtr<ExportDefaultDecl> node)
  {
    return get_derived().visit(node->declaration);
  }

  // ===========================================================================
  // Supporting nodes
  // ===========================================================================

  bool visit_property(NodePtr<Property> node)
  {
    if (node->computed && !get_derived().visit(node->key)) return false;
    return get_derived().visit(node->value);
  }

  bool visit_pattern_property(NodePtr<PatternProperty> node)
  {
    if (node->computed && !get_derived().visit(node->key)) return false;
    return get_derived().visit(node->value);
  }

  bool visit_variable_declarator(NodePtr<VariableDeclarator> node)
  {
    if (!get_derived().visit(node->id)) return false;
    return get_derived().visit(node->init);
  }

  bool visit_import_specifier(NodePtr<ImportSpecifier> node)
  {
    return get_derived().visit(node->local);
  }

  bool visit_switch_case(NodePtr<SwitchCase> node)
  {
    if (!get_derived().visit(node->test)) return false;
    return visit_all(node->consequent);
  }

  bool visit_catch_clause(NodePtr<CatchClause> node)
  {
    if (!get_derived().visit(node->param)) return false;
    return get_derived().visit(node->body);
  }

  bool visit_jsx_attribute(NodePtr<JsxAttribute> node) { return get_derived().visit(node->value); }

  bool visit_program(NodePtr<Program> node) { return visit_all(node->body); }

protected:
  template <typename Span>
  bool visit_all(const Span & nodes)
  {
    for (auto * n : nodes) {
      if (n != nullptr && !get_derived().visit(n)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace qk_graph
