// qk_graph/syntax/BuildSupport.cpp - CST -> AST for patterns, parameters and members
#include <string_view>
#include <vector>

#include "qk_graph/syntax/ast_builder.hpp"

namespace qk_graph
{

namespace
{

void set_pattern_type(AstNode * pattern, TypeNode * type)
{
  if (type == nullptr) return;
  if (auto * id = dyn_cast<BindingIdentifier>(pattern)) {
    id->type = type;
  } else if (auto * op = dyn_cast<ObjectPattern>(pattern)) {
    op->type = type;
  } else if (auto * ap = dyn_cast<ArrayPattern>(pattern)) {
    ap->type = type;
  } else if (auto * rest = dyn_cast<RestElement>(pattern)) {
    rest->type = type;
  }
}

}  // namespace

// ============================================================================
// Patterns
// ============================================================================

AstNode * AstBuilder::build_pattern(ts_ll::Node pattern_node)
{
  if (pattern_node.is_null()) return nullptr;

  const std::string_view k = pattern_node.kind();
  const SourceRange range = node_range(pattern_node);

  if (k == "identifier" || k == "shorthand_property_identifier_pattern" || k == "undefined") {
    return ast_.create<BindingIdentifier>(intern_text(pattern_node), range);
  }

  if (k == "object_pattern") {
    std::vector<AstNode *> props;
    for (uint32_t i = 0; i < pattern_node.named_child_count(); ++i) {
      const ts_ll::Node c = pattern_node.named_child(i);
      if (c.is_extra()) continue;
      if (AstNode * member = build_pattern_member(c)) props.push_back(member);
    }
    return ast_.create<ObjectPattern>(to_span(props), range);
  }

  if (k == "array_pattern") {
    std::vector<AstNode *> elems;
    for (uint32_t i = 0; i < pattern_node.named_child_count(); ++i) {
      const ts_ll::Node c = pattern_node.named_child(i);
      if (c.is_extra()) continue;
      elems.push_back(build_pattern(c));
    }
    return ast_.create<ArrayPattern>(to_span(elems), range);
  }

  if (k == "assignment_pattern") {
    return ast_.create<AssignmentPattern>(
      build_pattern(pattern_node.child_by_field("left")),
      build_expr(pattern_node.child_by_field("right")), range);
  }

  if (k == "rest_pattern") {
    return ast_.create<RestElement>(build_pattern(pattern_node.first_named_child()), range);
  }

  // Member targets of destructuring assignments (`[a.b] = xs`)
  return build_expr(pattern_node);
}

AstNode * AstBuilder::build_pattern_member(ts_ll::Node member_node)
{
  const std::string_view k = member_node.kind();
  const SourceRange range = node_range(member_node);

  if (k == "pair_pattern") {
    bool computed = false;
    Expr * key = build_property_key(member_node.child_by_field("key"), computed);
    auto * prop =
      ast_.create<PatternProperty>(key, build_pattern(member_node.child_by_field("value")), range);
    prop->computed = computed;
    return prop;
  }

  if (k == "shorthand_property_identifier_pattern" || k == "identifier") {
    auto * key = ast_.create<Identifier>(intern_text(member_node), range);
    auto * value = ast_.create<BindingIdentifier>(intern_text(member_node), range);
    auto * prop = ast_.create<PatternProperty>(key, value, range);
    prop->shorthand = true;
    return prop;
  }

  if (k == "object_assignment_pattern") {
    // { a = 1 } or { [k]: v = 1 }
    const ts_ll::Node left = member_node.child_by_field("left");
    AstNode * target = build_pattern(left);
    auto * value = ast_.create<AssignmentPattern>(
      target, build_expr(member_node.child_by_field("right")), range);
    auto * key = ast_.create<Identifier>(intern_text(left), node_range(left));
    auto * prop = ast_.create<PatternProperty>(key, value, range);
    prop->shorthand = true;
    return prop;
  }

  if (k == "rest_pattern") {
    return build_pattern(member_node);
  }

  return nullptr;
}

// ============================================================================
// Parameters
// ============================================================================

gsl::span<AstNode *> AstBuilder::build_params(ts_ll::Node params_node)
{
  std::vector<AstNode *> params;
  for (uint32_t i = 0; i < params_node.named_child_count(); ++i) {
    const ts_ll::Node c = params_node.named_child(i);
    const std::string_view k = c.kind();
    if (k == "comment" || k == "decorator") continue;
    if (AstNode * p = build_param(c)) params.push_back(p);
  }
  return to_span(params);
}

AstNode * AstBuilder::build_param(ts_ll::Node param_node)
{
  const std::string_view k = param_node.kind();
  if (k != "required_parameter" && k != "optional_parameter") {
    return build_pattern(param_node);
  }

  const ts_ll::Node pattern_node = param_node.child_by_field("pattern");
  if (pattern_node.is_null() || pattern_node.kind() == "this") return nullptr;

  AstNode * pattern = build_pattern(pattern_node);
  set_pattern_type(pattern, build_type_annotation(param_node.child_by_field("type")));

  const ts_ll::Node value = param_node.child_by_field("value");
  if (!value.is_null()) {
    return ast_.create<AssignmentPattern>(pattern, build_expr(value), node_range(param_node));
  }
  return pattern;
}

// ============================================================================
// Object and class members
// ============================================================================

Expr * AstBuilder::build_property_key(ts_ll::Node key_node, bool & computed)
{
  computed = false;
  if (key_node.is_null()) return nullptr;

  const std::string_view k = key_node.kind();
  if (k == "computed_property_name") {
    computed = true;
    const ts_ll::Node inner = key_node.first_named_child();
    return inner.is_null() ? build_opaque(key_node) : build_expr(inner);
  }
  if (k == "string") return build_string(key_node);
  if (k == "number") return build_number(key_node);
  return build_identifier(key_node);
}

AstNode * AstBuilder::build_object_member(ts_ll::Node member_node)
{
  const std::string_view k = member_node.kind();
  const SourceRange range = node_range(member_node);

  if (k == "pair") {
    bool computed = false;
    Expr * key = build_property_key(member_node.child_by_field("key"), computed);
    auto * prop = ast_.create<Property>(
      PropertyKind::Init, key, build_expr(member_node.child_by_field("value")), range);
    prop->computed = computed;
    return prop;
  }

  if (k == "shorthand_property_identifier") {
    auto * key = ast_.create<Identifier>(intern_text(member_node), range);
    auto * value = ast_.create<Identifier>(intern_text(member_node), range);
    auto * prop = ast_.create<Property>(PropertyKind::Init, key, value, range);
    prop->shorthand = true;
    return prop;
  }

  if (k == "spread_element") return build_expr(member_node);
  if (k == "method_definition") return build_method(member_node);

  return nullptr;
}

Property * AstBuilder::build_method(ts_ll::Node method_node)
{
  bool computed = false;
  Expr * key = build_property_key(method_node.child_by_field("name"), computed);

  PropertyKind kind = PropertyKind::Method;
  if (method_node.has_token("get")) {
    kind = PropertyKind::Get;
  } else if (method_node.has_token("set")) {
    kind = PropertyKind::Set;
  }

  auto * prop =
    ast_.create<Property>(kind, key, build_function(method_node), node_range(method_node));
  prop->computed = computed;
  prop->isStatic = method_node.has_token("static");
  return prop;
}

Property * AstBuilder::build_class_member(ts_ll::Node member_node)
{
  const std::string_view k = member_node.kind();

  if (k == "method_definition") return build_method(member_node);

  if (k == "public_field_definition" || k == "field_definition") {
    ts_ll::Node name = member_node.child_by_field("name");
    if (name.is_null()) name = member_node.child_by_field("property");
    bool computed = false;
    Expr * key = build_property_key(name, computed);
    const ts_ll::Node value = member_node.child_by_field("value");
    auto * prop = ast_.create<Property>(
      PropertyKind::Field, key, value.is_null() ? nullptr : build_expr(value),
      node_range(member_node));
    prop->computed = computed;
    prop->isStatic = member_node.has_token("static");
    return prop;
  }

  return nullptr;
}

JsxAttribute * AstBuilder::build_jsx_attribute(ts_ll::Node attr_node)
{
  ts_ll::Node name_node;
  ts_ll::Node value_node;
  for (uint32_t i = 0; i < attr_node.named_child_count(); ++i) {
    const ts_ll::Node c = attr_node.named_child(i);
    if (c.is_extra()) continue;
    if (name_node.is_null()) {
      name_node = c;
    } else {
      value_node = c;
      break;
    }
  }
  if (name_node.is_null()) return nullptr;

  return ast_.create<JsxAttribute>(
    intern_text(name_node), value_node.is_null() ? nullptr : build_expr(value_node),
    node_range(attr_node));
}

}  // namespace qk_graph
