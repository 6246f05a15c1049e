// qk_graph/syntax/BuildType.cpp - CST -> AST for type annotations
//
// Only the shapes needed to recognise client types are kept: references,
// `typeof` queries, unions/intersections and object type literals.
//
#include <string_view>
#include <vector>

#include "qk_graph/syntax/ast_builder.hpp"

namespace qk_graph
{

namespace
{

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

std::string_view trim(std::string_view s)
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

}  // namespace

TypeNode * AstBuilder::build_type_annotation(ts_ll::Node annotation_node)
{
  if (annotation_node.is_null()) return nullptr;
  const std::string_view k = annotation_node.kind();
  if (k == "type_annotation" || k == "opting_type_annotation" || k == "omitting_type_annotation") {
    const ts_ll::Node inner = annotation_node.first_named_child();
    return inner.is_null() ? nullptr : build_type(inner);
  }
  return build_type(annotation_node);
}

gsl::span<TypeNode *> AstBuilder::build_type_arguments(ts_ll::Node args_node)
{
  std::vector<TypeNode *> types;
  if (!args_node.is_null()) {
    for (uint32_t i = 0; i < args_node.named_child_count(); ++i) {
      const ts_ll::Node c = args_node.named_child(i);
      if (c.is_extra()) continue;
      if (TypeNode * t = build_type(c)) types.push_back(t);
    }
  }
  return to_span(types);
}

gsl::span<std::string_view> AstBuilder::build_entity_path(ts_ll::Node entity_node)
{
  std::vector<std::string_view> path;
  std::string_view text = node_text(entity_node);
  while (!text.empty()) {
    const size_t dot = text.find('.');
    const std::string_view part = trim(text.substr(0, dot));
    if (!part.empty()) path.push_back(intern(part));
    if (dot == std::string_view::npos) break;
    text.remove_prefix(dot + 1);
  }
  return to_span(path);
}

TypeNode * AstBuilder::build_type(ts_ll::Node type_node)
{
  if (type_node.is_null()) return nullptr;

  const std::string_view k = type_node.kind();
  const SourceRange range = node_range(type_node);

  if (k == "type_identifier" || k == "identifier" || k == "nested_type_identifier") {
    return ast_.create<TypeReference>(
      build_entity_path(type_node), gsl::span<TypeNode *>{}, range);
  }

  if (k == "generic_type") {
    const ts_ll::Node name = type_node.child_by_field("name");
    ts_ll::Node args = type_node.child_by_field("type_arguments");
    if (args.is_null()) args = type_node.first_named_child_of_kind("type_arguments");
    return ast_.create<TypeReference>(
      build_entity_path(name.is_null() ? type_node.first_named_child() : name),
      build_type_arguments(args), range);
  }

  if (k == "type_query") {
    // typeof <entity>
    const ts_ll::Node entity = type_node.first_named_child();
    if (entity.is_null()) return ast_.create<OpaqueType>(range);
    return ast_.create<TypeQuery>(build_entity_path(entity), range);
  }

  if (k == "union_type" || k == "intersection_type") {
    std::vector<TypeNode *> types;
    for (uint32_t i = 0; i < type_node.named_child_count(); ++i) {
      const ts_ll::Node c = type_node.named_child(i);
      if (c.is_extra()) continue;
      if (TypeNode * t = build_type(c)) types.push_back(t);
    }
    return ast_.create<CompositeType>(to_span(types), k == "intersection_type", range);
  }

  if (k == "parenthesized_type") {
    const ts_ll::Node inner = type_node.first_named_child();
    return inner.is_null() ? ast_.create<OpaqueType>(range) : build_type(inner);
  }

  if (k == "object_type") {
    std::vector<TypeMember *> members;
    for (uint32_t i = 0; i < type_node.named_child_count(); ++i) {
      const ts_ll::Node c = type_node.named_child(i);
      if (c.kind() != "property_signature") continue;
      const ts_ll::Node name = c.child_by_field("name");
      if (name.is_null()) continue;
      std::string_view member_name = node_text(name);
      if (
        member_name.size() >= 2 && (member_name.front() == '"' || member_name.front() == '\'')) {
        member_name = member_name.substr(1, member_name.size() - 2);
      }
      members.push_back(ast_.create<TypeMember>(
        intern(member_name), build_type_annotation(c.child_by_field("type")), node_range(c)));
    }
    return ast_.create<TypeLiteral>(to_span(members), range);
  }

  return ast_.create<OpaqueType>(range);
}

}  // namespace qk_graph
