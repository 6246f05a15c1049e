// qk_graph/syntax/BuildStmt.cpp - CST -> AST for statements
#include <string_view>
#include <vector>

#include "qk_graph/syntax/ast_builder.hpp"

namespace qk_graph
{

namespace
{

bool is_type_only_statement(std::string_view k)
{
  return k == "type_alias_declaration" || k == "interface_declaration" ||
         k == "enum_declaration" || k == "ambient_declaration" || k == "function_signature" ||
         k == "import_alias" || k == "abstract_method_signature" || k == "index_signature";
}

}  // namespace

AstNode * AstBuilder::build_statement(ts_ll::Node stmt_node)
{
  if (stmt_node.is_null()) return nullptr;

  const std::string_view k = stmt_node.kind();
  const SourceRange range = node_range(stmt_node);

  if (k == "expression_statement") {
    const ts_ll::Node inner = stmt_node.first_named_child();
    if (inner.is_null()) return ast_.create<EmptyStmt>(range);
    if (inner.kind() == "internal_module" || inner.kind() == "module") {
      return build_statement(inner);
    }
    return ast_.create<ExprStmt>(build_expr(inner), range);
  }
  if (k == "lexical_declaration" || k == "variable_declaration") {
    return build_variable_decl(stmt_node);
  }
  if (k == "function_declaration" || k == "generator_function_declaration") {
    return build_function_decl(stmt_node);
  }
  if (k == "class_declaration" || k == "abstract_class_declaration") {
    return build_class_decl(stmt_node);
  }
  if (k == "import_statement") return build_import_decl(stmt_node);
  if (k == "export_statement") return build_export_decl(stmt_node);
  if (k == "statement_block") return build_block(stmt_node);
  if (k == "if_statement") return build_if(stmt_node);
  if (k == "for_statement") return build_for(stmt_node);
  if (k == "for_in_statement") return build_for_in(stmt_node);

  if (k == "while_statement") {
    return ast_.create<WhileStmt>(
      build_expr(stmt_node.child_by_field("condition")),
      build_statement_or_empty(stmt_node.child_by_field("body")), false, range);
  }
  if (k == "do_statement") {
    return ast_.create<WhileStmt>(
      build_expr(stmt_node.child_by_field("condition")),
      build_statement_or_empty(stmt_node.child_by_field("body")), true, range);
  }
  if (k == "switch_statement") return build_switch(stmt_node);
  if (k == "try_statement") return build_try(stmt_node);

  if (k == "return_statement") {
    const ts_ll::Node arg = stmt_node.first_named_child();
    return ast_.create<ReturnStmt>(arg.is_null() ? nullptr : build_expr(arg), range);
  }
  if (k == "throw_statement") {
    return ast_.create<ThrowStmt>(build_expr(stmt_node.first_named_child()), range);
  }
  if (k == "labeled_statement") {
    return ast_.create<LabeledStmt>(
      intern_text(stmt_node.child_by_field("label")),
      build_statement_or_empty(stmt_node.child_by_field("body")), range);
  }

  // namespace X { ... } keeps its statements
  if (k == "internal_module" || k == "module") {
    const ts_ll::Node body = stmt_node.child_by_field("body");
    if (!body.is_null()) return build_block(body);
    return ast_.create<EmptyStmt>(range);
  }

  if (
    k == "empty_statement" || k == "break_statement" || k == "continue_statement" ||
    k == "debugger_statement" || is_type_only_statement(k)) {
    return ast_.create<EmptyStmt>(range);
  }

  // Anything else is lowered as an expression statement (ERROR fragments included)
  return ast_.create<ExprStmt>(build_expr(stmt_node), range);
}

AstNode * AstBuilder::build_statement_or_empty(ts_ll::Node stmt_node)
{
  if (stmt_node.is_null()) return ast_.create<EmptyStmt>(SourceRange{});
  return build_statement(stmt_node);
}

BlockStmt * AstBuilder::build_block(ts_ll::Node block_node)
{
  std::vector<AstNode *> body;
  if (!block_node.is_null()) {
    build_statement_list(block_node, body);
  }
  return ast_.create<BlockStmt>(to_span(body), node_range(block_node));
}

AstNode * AstBuilder::build_if(ts_ll::Node if_node)
{
  Expr * test = build_expr(if_node.child_by_field("condition"));
  AstNode * consequent = build_statement_or_empty(if_node.child_by_field("consequence"));

  AstNode * alternate = nullptr;
  const ts_ll::Node alt = if_node.child_by_field("alternative");
  if (!alt.is_null()) {
    // else_clause wraps the statement
    alternate = alt.kind() == "else_clause" ? build_statement_or_empty(alt.first_named_child())
                                            : build_statement(alt);
  }
  return ast_.create<IfStmt>(test, consequent, alternate, node_range(if_node));
}

AstNode * AstBuilder::build_for(ts_ll::Node for_node)
{
  AstNode * init = nullptr;
  const ts_ll::Node init_node = for_node.child_by_field("initializer");
  if (!init_node.is_null()) {
    const std::string_view k = init_node.kind();
    if (k == "lexical_declaration" || k == "variable_declaration") {
      init = build_variable_decl(init_node);
    } else if (k == "expression_statement") {
      const ts_ll::Node inner = init_node.first_named_child();
      init = inner.is_null() ? nullptr : build_expr(inner);
    } else if (k != "empty_statement") {
      init = build_expr(init_node);
    }
  }

  Expr * test = nullptr;
  const ts_ll::Node cond = for_node.child_by_field("condition");
  if (!cond.is_null() && cond.kind() != "empty_statement") {
    const ts_ll::Node inner = cond.kind() == "expression_statement" ? cond.first_named_child() : cond;
    test = inner.is_null() ? nullptr : build_expr(inner);
  }

  Expr * update = nullptr;
  const ts_ll::Node inc = for_node.child_by_field("increment");
  if (!inc.is_null()) update = build_expr(inc);

  return ast_.create<ForStmt>(
    init, test, update, build_statement_or_empty(for_node.child_by_field("body")),
    node_range(for_node));
}

AstNode * AstBuilder::build_for_in(ts_ll::Node for_node)
{
  const ts_ll::Node left = for_node.child_by_field("left");
  const ts_ll::Node kind = for_node.child_by_field("kind");
  const ts_ll::Node op = for_node.child_by_field("operator");
  const bool is_of = !op.is_null() ? node_text(op) == "of" : for_node.has_token("of");

  AstNode * left_ast = nullptr;
  if (!kind.is_null()) {
    // for (const x of xs): a single declarator without initializer
    const std::string_view kt = node_text(kind);
    VariableKind vk = VariableKind::Var;
    if (kt == "let") vk = VariableKind::Let;
    if (kt == "const") vk = VariableKind::Const;
    auto * d = ast_.create<VariableDeclarator>(build_pattern(left), nullptr, node_range(left));
    left_ast = ast_.create<VariableDecl>(
      vk, to_span(std::vector<VariableDeclarator *>{d}), node_range(left));
  } else if (
    left.kind() == "object_pattern" || left.kind() == "array_pattern") {
    left_ast = build_pattern(left);
  } else {
    left_ast = build_expr(left);
  }

  return ast_.create<ForInOfStmt>(
    left_ast, build_expr(for_node.child_by_field("right")),
    build_statement_or_empty(for_node.child_by_field("body")), is_of, node_range(for_node));
}

AstNode * AstBuilder::build_switch(ts_ll::Node switch_node)
{
  std::vector<SwitchCase *> cases;
  const ts_ll::Node body = switch_node.child_by_field("body");
  if (!body.is_null()) {
    for (uint32_t i = 0; i < body.named_child_count(); ++i) {
      const ts_ll::Node c = body.named_child(i);
      if (c.kind() != "switch_case" && c.kind() != "switch_default") continue;

      const ts_ll::Node value = c.child_by_field("value");
      std::vector<AstNode *> consequent;
      for (uint32_t j = 0; j < c.named_child_count(); ++j) {
        const ts_ll::Node s = c.named_child(j);
        if (s.is_extra()) continue;
        if (!value.is_null() && s.start_byte() == value.start_byte()) continue;
        if (AstNode * stmt = build_statement(s)) consequent.push_back(stmt);
      }
      cases.push_back(ast_.create<SwitchCase>(
        value.is_null() ? nullptr : build_expr(value), to_span(consequent), node_range(c)));
    }
  }

  return ast_.create<SwitchStmt>(
    build_expr(switch_node.child_by_field("value")), to_span(cases), node_range(switch_node));
}

AstNode * AstBuilder::build_try(ts_ll::Node try_node)
{
  BlockStmt * block = build_block(try_node.child_by_field("body"));

  CatchClause * handler = nullptr;
  const ts_ll::Node h = try_node.child_by_field("handler");
  if (!h.is_null()) {
    const ts_ll::Node param = h.child_by_field("parameter");
    AstNode * p = param.is_null() ? nullptr : build_pattern(param);
    handler = ast_.create<CatchClause>(p, build_block(h.child_by_field("body")), node_range(h));
  }

  BlockStmt * finalizer = nullptr;
  const ts_ll::Node f = try_node.child_by_field("finalizer");
  if (!f.is_null()) {
    finalizer = build_block(f.child_by_field("body"));
  }

  return ast_.create<TryStmt>(block, handler, finalizer, node_range(try_node));
}

}  // namespace qk_graph
