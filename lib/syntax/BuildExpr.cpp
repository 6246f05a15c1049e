// qk_graph/syntax/BuildExpr.cpp - CST -> AST for expressions
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "qk_graph/syntax/ast_builder.hpp"

namespace qk_graph
{

namespace
{

bool is_optional_chain(ts_ll::Node n)
{
  return !n.first_named_child_of_kind("optional_chain").is_null() || n.has_token("?.");
}

/// Numeric value of a JavaScript numeric literal (separators and bigint suffix stripped)
double parse_js_number(std::string_view raw)
{
  std::string digits;
  digits.reserve(raw.size());
  for (const char c : raw) {
    if (c != '_') digits.push_back(c);
  }
  if (!digits.empty() && digits.back() == 'n') digits.pop_back();

  int base = 10;
  if (digits.size() > 2 && digits[0] == '0') {
    const char p = digits[1];
    if (p == 'x' || p == 'X') base = 16;
    if (p == 'o' || p == 'O') base = 8;
    if (p == 'b' || p == 'B') base = 2;
  }

  if (base != 10) {
    double value = 0.0;
    for (size_t i = 2; i < digits.size(); ++i) {
      const char c = digits[i];
      int d = 0;
      if (c >= '0' && c <= '9') {
        d = c - '0';
      } else if (c >= 'a' && c <= 'f') {
        d = 10 + (c - 'a');
      } else if (c >= 'A' && c <= 'F') {
        d = 10 + (c - 'A');
      } else {
        return 0.0;
      }
      value = value * base + d;
    }
    return value;
  }

  char * end = nullptr;
  const double v = std::strtod(digits.c_str(), &end);
  return end == digits.c_str() ? 0.0 : v;
}

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

Expr * AstBuilder::build_expr(ts_ll::Node expr_node)
{
  if (expr_node.is_null()) return nullptr;

  const std::string_view k = expr_node.kind();
  const SourceRange range = node_range(expr_node);

  if (k == "parenthesized_expression") {
    const ts_ll::Node inner = expr_node.first_named_child();
    return inner.is_null() ? build_opaque(expr_node) : build_expr(inner);
  }

  if (
    k == "identifier" || k == "property_identifier" || k == "shorthand_property_identifier" ||
    k == "private_property_identifier" || k == "undefined" || k == "statement_identifier" ||
    k == "type_identifier" || k == "shorthand_property_identifier_pattern") {
    return build_identifier(expr_node);
  }

  if (k == "string") return build_string(expr_node);
  if (k == "template_string") return build_template(expr_node);
  if (k == "number") return build_number(expr_node);
  if (k == "true") return ast_.create<BooleanLiteral>(true, range);
  if (k == "false") return ast_.create<BooleanLiteral>(false, range);
  if (k == "null") return ast_.create<NullLiteral>(range);
  if (k == "this") return ast_.create<ThisExpr>(range);

  if (k == "array") return build_array(expr_node);
  if (k == "object") return build_object(expr_node);
  if (k == "member_expression") return build_member(expr_node);
  if (k == "subscript_expression") return build_subscript(expr_node);
  if (k == "call_expression") return build_call(expr_node);
  if (k == "new_expression") return build_new(expr_node);

  if (
    k == "function_expression" || k == "function" || k == "arrow_function" ||
    k == "generator_function") {
    return build_function(expr_node);
  }
  if (k == "class") return build_class(expr_node);

  if (k == "unary_expression") return build_unary(expr_node);
  if (k == "update_expression") return build_update(expr_node);
  if (k == "binary_expression") return build_binary(expr_node);
  if (k == "assignment_expression" || k == "augmented_assignment_expression") {
    return build_assignment(expr_node);
  }

  if (k == "ternary_expression") {
    return ast_.create<ConditionalExpr>(
      build_expr(expr_node.child_by_field("condition")),
      build_expr(expr_node.child_by_field("consequence")),
      build_expr(expr_node.child_by_field("alternative")), range);
  }

  if (k == "sequence_expression") return build_sequence(expr_node);

  if (
    k == "as_expression" || k == "satisfies_expression" || k == "non_null_expression" ||
    k == "type_assertion") {
    return build_cast(expr_node);
  }

  if (k == "await_expression" || k == "yield_expression") {
    const ts_ll::Node arg = expr_node.first_named_child();
    return ast_.create<AwaitExpr>(
      arg.is_null() ? nullptr : build_expr(arg), k == "yield_expression", range);
  }

  if (k == "spread_element") {
    return ast_.create<SpreadElement>(build_expr(expr_node.first_named_child()), range);
  }

  if (k == "jsx_element" || k == "jsx_self_closing_element" || k == "jsx_fragment") {
    return build_jsx(expr_node);
  }
  if (k == "jsx_expression") {
    const ts_ll::Node inner = expr_node.first_named_child();
    return inner.is_null() ? build_opaque(expr_node) : build_expr(inner);
  }

  // fn<T> keeps the callee
  if (k == "instantiation_expression") {
    const ts_ll::Node fn = expr_node.child_by_field("function");
    return build_expr(fn.is_null() ? expr_node.first_named_child() : fn);
  }

  return build_opaque(expr_node);
}

// ============================================================================
// Leaves
// ============================================================================

Expr * AstBuilder::build_identifier(ts_ll::Node id_node)
{
  return ast_.create<Identifier>(intern_text(id_node), node_range(id_node));
}

Expr * AstBuilder::build_string(ts_ll::Node string_node)
{
  const std::string_view raw = node_text(string_node);
  const std::string_view body =
    raw.size() >= 2 ? raw.substr(1, raw.size() - 2) : std::string_view{};
  return ast_.create<StringLiteral>(cook(body), node_range(string_node));
}

Expr * AstBuilder::build_number(ts_ll::Node number_node)
{
  const std::string_view raw = intern_text(number_node);
  auto * lit = ast_.create<NumberLiteral>(raw, parse_js_number(raw), node_range(number_node));
  lit->isBigInt = !raw.empty() && raw.back() == 'n';
  return lit;
}

Expr * AstBuilder::build_template(ts_ll::Node template_node)
{
  std::vector<std::string_view> quasis;
  std::vector<Expr *> expressions;

  // Quasis are the raw slices between substitutions, cooked afterwards
  uint32_t pos = template_node.start_byte() + 1;
  const uint32_t end = template_node.end_byte() > 0 ? template_node.end_byte() - 1 : 0;

  for (uint32_t i = 0; i < template_node.named_child_count(); ++i) {
    const ts_ll::Node c = template_node.named_child(i);
    if (c.kind() != "template_substitution") continue;
    const uint32_t sub_start = c.start_byte();
    quasis.push_back(
      sub_start >= pos ? cook(source_.substr(pos, sub_start - pos)) : std::string_view{});
    const ts_ll::Node inner = c.first_named_child();
    expressions.push_back(inner.is_null() ? build_opaque(c) : build_expr(inner));
    pos = c.end_byte();
  }
  quasis.push_back(end >= pos ? cook(source_.substr(pos, end - pos)) : std::string_view{});

  return ast_.create<TemplateLiteral>(
    to_span(quasis), to_span(expressions), node_range(template_node));
}

// ============================================================================
// Literals with children
// ============================================================================

Expr * AstBuilder::build_array(ts_ll::Node array_node)
{
  std::vector<Expr *> elements;
  for (const ts_ll::Node c : array_node.named_children()) {
    elements.push_back(build_expr(c));
  }
  return ast_.create<ArrayExpr>(to_span(elements), node_range(array_node));
}

Expr * AstBuilder::build_object(ts_ll::Node object_node)
{
  std::vector<AstNode *> props;
  for (const ts_ll::Node c : object_node.named_children()) {
    if (AstNode * member = build_object_member(c)) {
      props.push_back(member);
    }
  }
  return ast_.create<ObjectExpr>(to_span(props), node_range(object_node));
}

// ============================================================================
// Member access and calls
// ============================================================================

Expr * AstBuilder::build_member(ts_ll::Node member_node)
{
  Expr * object = build_expr(member_node.child_by_field("object"));
  const ts_ll::Node prop = member_node.child_by_field("property");
  Expr * property = prop.is_null() ? nullptr : build_identifier(prop);
  return ast_.create<MemberExpr>(
    object, property, false, is_optional_chain(member_node), node_range(member_node));
}

Expr * AstBuilder::build_subscript(ts_ll::Node subscript_node)
{
  Expr * object = build_expr(subscript_node.child_by_field("object"));
  Expr * index = build_expr(subscript_node.child_by_field("index"));
  return ast_.create<MemberExpr>(
    object, index, true, is_optional_chain(subscript_node), node_range(subscript_node));
}

gsl::span<Expr *> AstBuilder::build_arguments(ts_ll::Node args_node)
{
  std::vector<Expr *> args;
  if (!args_node.is_null()) {
    for (const ts_ll::Node c : args_node.named_children()) {
      args.push_back(build_expr(c));
    }
  }
  return to_span(args);
}

Expr * AstBuilder::build_call(ts_ll::Node call_node)
{
  const ts_ll::Node fn = call_node.child_by_field("function");
  const ts_ll::Node args = call_node.child_by_field("arguments");

  // Tagged templates carry a template_string instead of arguments
  if (!args.is_null() && args.kind() == "template_string") {
    return build_opaque(call_node);
  }

  Expr * callee = fn.kind() == "import" ? build_opaque(fn) : build_expr(fn);
  auto * call =
    ast_.create<CallExpr>(callee, build_arguments(args), is_optional_chain(call_node),
                          node_range(call_node));
  call->typeArguments = build_type_arguments(call_node.child_by_field("type_arguments"));
  return call;
}

Expr * AstBuilder::build_new(ts_ll::Node new_node)
{
  Expr * callee = build_expr(new_node.child_by_field("constructor"));
  return ast_.create<NewExpr>(
    callee, build_arguments(new_node.child_by_field("arguments")), node_range(new_node));
}

// ============================================================================
// Functions and classes
// ============================================================================

FunctionExpr * AstBuilder::build_function(ts_ll::Node fn_node)
{
  const bool is_arrow = fn_node.kind() == "arrow_function";

  gsl::span<AstNode *> params;
  const ts_ll::Node params_node = fn_node.child_by_field("parameters");
  const ts_ll::Node single_param = fn_node.child_by_field("parameter");
  if (!params_node.is_null()) {
    params = build_params(params_node);
  } else if (!single_param.is_null()) {
    params = to_span(std::vector<AstNode *>{build_pattern(single_param)});
  }

  const ts_ll::Node body_node = fn_node.child_by_field("body");
  AstNode * body = nullptr;
  if (!body_node.is_null()) {
    body = body_node.kind() == "statement_block" ? static_cast<AstNode *>(build_block(body_node))
                                                 : build_expr(body_node);
  }

  auto * fn = ast_.create<FunctionExpr>(params, body, is_arrow, node_range(fn_node));
  const ts_ll::Node name = fn_node.child_by_field("name");
  if (!name.is_null()) fn->name = intern_text(name);
  fn->returnType = build_type_annotation(fn_node.child_by_field("return_type"));
  fn->isAsync = fn_node.has_token("async");
  return fn;
}

ClassExpr * AstBuilder::build_class(ts_ll::Node class_node)
{
  std::vector<Property *> members;
  const ts_ll::Node body = class_node.child_by_field("body");
  if (!body.is_null()) {
    for (const ts_ll::Node c : body.named_children()) {
      if (Property * p = build_class_member(c)) {
        members.push_back(p);
      }
    }
  }

  auto * klass = ast_.create<ClassExpr>(to_span(members), node_range(class_node));
  const ts_ll::Node name = class_node.child_by_field("name");
  if (!name.is_null()) klass->name = intern_text(name);

  const ts_ll::Node heritage = class_node.first_named_child_of_kind("class_heritage");
  if (!heritage.is_null()) {
    const ts_ll::Node extends = heritage.first_named_child_of_kind("extends_clause");
    if (!extends.is_null()) {
      const ts_ll::Node value = extends.child_by_field("value");
      klass->superClass = build_expr(value.is_null() ? extends.first_named_child() : value);
    } else {
      const ts_ll::Node value = heritage.first_named_child();
      if (!value.is_null() && value.kind() != "implements_clause") {
        klass->superClass = build_expr(value);
      }
    }
  }
  return klass;
}

// ============================================================================
// Operators
// ============================================================================

Expr * AstBuilder::build_binary(ts_ll::Node binary_node)
{
  const ts_ll::Node op_node = binary_node.child_by_field("operator");
  const std::string_view op = intern_text(op_node);
  Expr * left = build_expr(binary_node.child_by_field("left"));
  Expr * right = build_expr(binary_node.child_by_field("right"));
  const SourceRange range = node_range(binary_node);

  if (op == "&&" || op == "||" || op == "??") {
    return ast_.create<LogicalExpr>(op, left, right, range);
  }
  return ast_.create<BinaryExpr>(op, left, right, range);
}

Expr * AstBuilder::build_unary(ts_ll::Node unary_node)
{
  return ast_.create<UnaryExpr>(
    intern_text(unary_node.child_by_field("operator")),
    build_expr(unary_node.child_by_field("argument")), node_range(unary_node));
}

Expr * AstBuilder::build_update(ts_ll::Node update_node)
{
  const ts_ll::Node op = update_node.child_by_field("operator");
  const ts_ll::Node first = update_node.child(0);
  const bool prefix = !first.is_named();
  return ast_.create<UpdateExpr>(
    intern_text(op), prefix, build_expr(update_node.child_by_field("argument")),
    node_range(update_node));
}

Expr * AstBuilder::build_assignment(ts_ll::Node assign_node)
{
  const ts_ll::Node left = assign_node.child_by_field("left");
  const ts_ll::Node op = assign_node.child_by_field("operator");

  AstNode * target = nullptr;
  if (left.kind() == "object_pattern" || left.kind() == "array_pattern") {
    target = build_pattern(left);
  } else {
    target = build_expr(left);
  }

  return ast_.create<AssignmentExpr>(
    op.is_null() ? intern("=") : intern_text(op), target,
    build_expr(assign_node.child_by_field("right")), node_range(assign_node));
}

Expr * AstBuilder::build_sequence(ts_ll::Node seq_node)
{
  std::vector<Expr *> exprs;
  // Older grammars nest sequences as left/right pairs; flatten them
  const auto flatten = [&](const auto & self, ts_ll::Node n) -> void {
    for (const ts_ll::Node c : n.named_children()) {
      if (c.kind() == "sequence_expression") {
        self(self, c);
      } else {
        exprs.push_back(build_expr(c));
      }
    }
  };
  flatten(flatten, seq_node);

  return ast_.create<SequenceExpr>(to_span(exprs), node_range(seq_node));
}

Expr * AstBuilder::build_cast(ts_ll::Node cast_node)
{
  const std::string_view k = cast_node.kind();
  const std::vector<ts_ll::Node> kids = cast_node.named_children();
  const SourceRange range = node_range(cast_node);

  if (k == "non_null_expression") {
    return ast_.create<TsCastExpr>(
      CastKind::NonNull, kids.empty() ? nullptr : build_expr(kids.front()), nullptr, range);
  }

  if (k == "type_assertion") {
    // <T>expr
    TypeNode * type = nullptr;
    if (!kids.empty() && kids.front().kind() == "type_arguments") {
      const auto types = build_type_arguments(kids.front());
      if (!types.empty()) type = types[0];
    }
    return ast_.create<TsCastExpr>(
      CastKind::Angle, kids.empty() ? nullptr : build_expr(kids.back()), type, range);
  }

  Expr * inner = kids.empty() ? nullptr : build_expr(kids.front());
  TypeNode * type = kids.size() >= 2 ? build_type(kids[1]) : nullptr;
  return ast_.create<TsCastExpr>(
    k == "satisfies_expression" ? CastKind::Satisfies : CastKind::As, inner, type, range);
}

// ============================================================================
// JSX
// ============================================================================

Expr * AstBuilder::build_jsx(ts_ll::Node jsx_node)
{
  const std::string_view k = jsx_node.kind();
  ts_ll::Node opening = jsx_node;
  if (k == "jsx_element") {
    opening = jsx_node.child_by_field("open_tag");
  }

  std::string_view name;
  std::vector<AstNode *> attributes;
  if (!opening.is_null() && k != "jsx_fragment") {
    const ts_ll::Node name_node = opening.child_by_field("name");
    if (!name_node.is_null()) name = intern_text(name_node);

    for (const ts_ll::Node c : opening.named_children()) {
      if (c.kind() == "jsx_attribute") {
        if (JsxAttribute * attr = build_jsx_attribute(c)) attributes.push_back(attr);
      } else if (c.kind() == "jsx_expression") {
        // {...props}
        if (Expr * e = build_expr(c)) attributes.push_back(e);
      }
    }
  }

  std::vector<Expr *> children;
  if (k != "jsx_self_closing_element") {
    for (const ts_ll::Node c : jsx_node.named_children()) {
      const std::string_view ck = c.kind();
      if (ck == "jsx_opening_element" || ck == "jsx_closing_element" || ck == "jsx_text") {
        continue;
      }
      if (ck == "jsx_expression" && c.first_named_child().is_null()) continue;
      if (Expr * e = build_expr(c)) children.push_back(e);
    }
  }

  return ast_.create<JsxElement>(
    name, to_span(attributes), to_span(children), node_range(jsx_node));
}

// ============================================================================
// Opaque fallback
// ============================================================================

Expr * AstBuilder::build_opaque(ts_ll::Node node)
{
  std::vector<AstNode *> children;
  for (const ts_ll::Node c : node.named_children()) {
    const std::string_view ck = c.kind();
    if (ck == "type_arguments" || ck == "type_annotation" || ck == "type_parameters") continue;
    if (ck == "statement_block") {
      children.push_back(build_block(c));
    } else if (AstNode * child = build_expr(c)) {
      children.push_back(child);
    }
  }
  return ast_.create<OpaqueExpr>(intern(node.kind()), to_span(children), node_range(node));
}

}  // namespace qk_graph
