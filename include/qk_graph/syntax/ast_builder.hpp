// qk_graph/syntax/ast_builder.hpp - CST -> AST lowering for JavaScript/TypeScript
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/ast/ast_context.hpp"
#include "qk_graph/basic/diagnostic.hpp"
#include "qk_graph/basic/source_manager.hpp"
#include "qk_graph/syntax/ts_ll.hpp"

namespace qk_graph
{

/**
 * Lowers a tree-sitter-typescript concrete syntax tree into the closed AST.
 *
 * Owns no memory; writes into AstContext. Every produced range carries the
 * FileId given at construction. Unknown constructs degrade to OpaqueExpr,
 * OpaqueType or EmptyStmt, never to diagnostics (syntax errors are reported
 * by the front end before lowering).
 */
class AstBuilder
{
public:
  AstBuilder(AstContext & ast, FileId file, std::string_view source)
  : ast_(ast), file_(file), source_(source)
  {
  }

  [[nodiscard]] Program * build_program(ts_ll::Node program_node);

  [[nodiscard]] Expr * build_expr(ts_ll::Node expr_node);
  [[nodiscard]] TypeNode * build_type(ts_ll::Node type_node);
  [[nodiscard]] AstNode * build_statement(ts_ll::Node stmt_node);
  [[nodiscard]] AstNode * build_pattern(ts_ll::Node pattern_node);

private:
  // Declarations (AstBuilder.cpp)
  [[nodiscard]] ImportDecl * build_import_decl(ts_ll::Node import_node);
  [[nodiscard]] Decl * build_export_decl(ts_ll::Node export_node);
  [[nodiscard]] VariableDecl * build_variable_decl(ts_ll::Node decl_node);
  [[nodiscard]] VariableDeclarator * build_variable_declarator(ts_ll::Node declarator_node);
  [[nodiscard]] FunctionDecl * build_function_decl(ts_ll::Node fn_node);
  [[nodiscard]] ClassDecl * build_class_decl(ts_ll::Node class_node);

  // Statements (BuildStmt.cpp)
  [[nodiscard]] BlockStmt * build_block(ts_ll::Node block_node);
  [[nodiscard]] AstNode * build_if(ts_ll::Node if_node);
  [[nodiscard]] AstNode * build_for(ts_ll::Node for_node);
  [[nodiscard]] AstNode * build_for_in(ts_ll::Node for_node);
  [[nodiscard]] AstNode * build_switch(ts_ll::Node switch_node);
  [[nodiscard]] AstNode * build_try(ts_ll::Node try_node);
  [[nodiscard]] AstNode * build_statement_or_empty(ts_ll::Node stmt_node);
  void build_statement_list(ts_ll::Node parent, std::vector<AstNode *> & out);

  // Expressions (BuildExpr.cpp)
  [[nodiscard]] Expr * build_identifier(ts_ll::Node id_node);
  [[nodiscard]] Expr * build_string(ts_ll::Node string_node);
  [[nodiscard]] Expr * build_number(ts_ll::Node number_node);
  [[nodiscard]] Expr * build_template(ts_ll::Node template_node);
  [[nodiscard]] Expr * build_array(ts_ll::Node array_node);
  [[nodiscard]] Expr * build_object(ts_ll::Node object_node);
  [[nodiscard]] Expr * build_member(ts_ll::Node member_node);
  [[nodiscard]] Expr * build_subscript(ts_ll::Node subscript_node);
  [[nodiscard]] Expr * build_call(ts_ll::Node call_node);
  [[nodiscard]] Expr * build_new(ts_ll::Node new_node);
  [[nodiscard]] FunctionExpr * build_function(ts_ll::Node fn_node);
  [[nodiscard]] ClassExpr * build_class(ts_ll::Node class_node);
  [[nodiscard]] Expr * build_binary(ts_ll::Node binary_node);
  [[nodiscard]] Expr * build_unary(ts_ll::Node unary_node);
  [[nodiscard]] Expr * build_update(ts_ll::Node update_node);
  [[nodiscard]] Expr * build_assignment(ts_ll::Node assign_node);
  [[nodiscard]] Expr * build_sequence(ts_ll::Node seq_node);
  [[nodiscard]] Expr * build_cast(ts_ll::Node cast_node);
  [[nodiscard]] Expr * build_jsx(ts_ll::Node jsx_node);
  [[nodiscard]] Expr * build_opaque(ts_ll::Node node);
  [[nodiscard]] gsl::span<Expr *> build_arguments(ts_ll::Node args_node);

  // Supporting nodes (BuildSupport.cpp)
  [[nodiscard]] AstNode * build_object_member(ts_ll::Node member_node);
  [[nodiscard]] Property * build_method(ts_ll::Node method_node);
  [[nodiscard]] Property * build_class_member(ts_ll::Node member_node);
  [[nodiscard]] Expr * build_property_key(ts_ll::Node key_node, bool & computed);
  [[nodiscard]] gsl::span<AstNode *> build_params(ts_ll::Node params_node);
  [[nodiscard]] AstNode * build_param(ts_ll::Node param_node);
  [[nodiscard]] AstNode * build_pattern_member(ts_ll::Node member_node);
  [[nodiscard]] JsxAttribute * build_jsx_attribute(ts_ll::Node attr_node);

  // Types (BuildType.cpp)
  [[nodiscard]] TypeNode * build_type_annotation(ts_ll::Node annotation_node);
  [[nodiscard]] gsl::span<TypeNode *> build_type_arguments(ts_ll::Node args_node);
  [[nodiscard]] gsl::span<std::string_view> build_entity_path(ts_ll::Node entity_node);

  // Utility
  [[nodiscard]] std::string_view node_text(ts_ll::Node n) const;
  [[nodiscard]] std::string_view intern_text(ts_ll::Node n);
  [[nodiscard]] std::string_view intern(std::string_view s) { return ast_.intern(s); }
  [[nodiscard]] SourceRange node_range(ts_ll::Node n) const noexcept { return n.range(file_); }

  /// Decode a JS string body (escapes included) and intern it
  [[nodiscard]] std::string_view cook(std::string_view raw);

  template <typename T>
  [[nodiscard]] gsl::span<T> to_span(const std::vector<T> & v)
  {
    return ast_.store(v);
  }

  AstContext & ast_;
  FileId file_;
  std::string_view source_;
};

/// Decode JavaScript string escapes (`\n`, `\x41`, `A`, `\u{1F600}`, line continuations)
[[nodiscard]] std::string unescape_js_string(std::string_view body);

}  // namespace qk_graph
