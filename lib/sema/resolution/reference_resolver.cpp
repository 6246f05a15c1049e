// qk_graph/sema/resolution/reference_resolver.cpp - Cross-file reference resolution
//
#include "qk_graph/sema/resolution/reference_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <vector>

#include <fmt/format.h>

namespace qk_graph
{

// ============================================================================
// Expression helpers
// ============================================================================

namespace
{

bool is_named(const Expr * e, std::string_view name)
{
  const auto * id = dyn_cast<Identifier>(e);
  return id != nullptr && id->name == name;
}

/// Name of a non-computed `a.b` property
std::optional<std::string_view> plain_member_name(const MemberExpr * member)
{
  if (member == nullptr || member->computed) return std::nullopt;
  if (const auto * id = dyn_cast<Identifier>(member->property)) return id->name;
  return std::nullopt;
}

/// `parseInt`-style leading integer; nullopt when negative or absent
std::optional<size_t> parse_array_index(std::string_view text)
{
  size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
  if (i < text.size() && text[i] == '-') return std::nullopt;
  if (i < text.size() && text[i] == '+') ++i;

  size_t value = 0;
  bool any = false;
  for (; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])); ++i) {
    value = value * 10 + static_cast<size_t>(text[i] - '0');
    any = true;
  }
  if (!any) return std::nullopt;
  return value;
}

const Expr * array_element(const ArrayExpr * array, std::string_view property)
{
  const auto idx = parse_array_index(property);
  if (!idx || *idx >= array->elements.size()) return nullptr;
  const Expr * element = array->elements[*idx];
  if (element == nullptr || isa<SpreadElement>(element)) return nullptr;
  return unwrap_expr(element);
}

/// `querykey`/`rqkey` containment, including the bare name `queryKey`
bool is_likely_factory_name(std::string_view name)
{
  if (name.empty()) return false;
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower.find("querykey") != std::string::npos || lower.find("rqkey") != std::string::npos;
}

}  // namespace

bool is_identity_wrapper_call(const Expr * callee)
{
  callee = unwrap_expr(callee);
  if (is_named(callee, "queryOptions") || is_named(callee, "infiniteQueryOptions")) return true;

  const auto * member = dyn_cast<MemberExpr>(callee);
  const auto name = plain_member_name(member);
  if (!name) return false;
  if (*name == "queryOptions" || *name == "infiniteQueryOptions") return true;
  return *name == "freeze" && is_named(member->object, "Object");
}

std::optional<std::string> static_property_key(const Property * prop)
{
  if (prop == nullptr || prop->key == nullptr) return std::nullopt;
  if (const auto * id = dyn_cast<Identifier>(prop->key)) {
    if (prop->computed) return std::nullopt;
    return std::string(id->name);
  }
  if (const auto * str = dyn_cast<StringLiteral>(prop->key)) return std::string(str->value);
  if (const auto * num = dyn_cast<NumberLiteral>(prop->key)) return js_number_to_string(num->value);
  return std::nullopt;
}

const Expr * object_property_value(const ObjectExpr * object, std::string_view name)
{
  if (object == nullptr) return nullptr;
  for (const AstNode * member : object->properties) {
    const auto * prop = dyn_cast<Property>(member);
    if (prop == nullptr || prop->propKind != PropertyKind::Init || prop->value == nullptr) continue;
    const auto key = static_property_key(prop);
    if (key && *key == name) return unwrap_expr(prop->value);
  }
  return nullptr;
}

const Expr * first_expression_argument(const CallExpr * call)
{
  if (call == nullptr || call->arguments.empty()) return nullptr;
  const Expr * first = call->arguments[0];
  if (first == nullptr || isa<SpreadElement>(first)) return nullptr;
  return unwrap_expr(first);
}

const Expr * query_key_property_from_call(const CallExpr * call)
{
  return object_property_value(dyn_cast<ObjectExpr>(first_expression_argument(call)), "queryKey");
}

std::string js_number_to_string(double value)
{
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  if (value == 0) return "0";
  if (std::trunc(value) == value && std::fabs(value) < 1e21) return fmt::format("{:.0f}", value);
  return fmt::format("{}", value);
}

// ============================================================================
// Entry points
// ============================================================================

const Expr * ReferenceResolver::resolve_reference(const Expr * expr)
{
  if (expr == nullptr) return nullptr;
  const FileSymbolTable * file = index_.find(expr->file_id());
  if (file == nullptr) return nullptr;

  SeenSet seen;
  return resolve_reference(*file, expr, 0, seen);
}

const Expr * ReferenceResolver::resolve_call_result(const Expr * callee)
{
  if (callee == nullptr) return nullptr;
  const FileSymbolTable * file = index_.find(callee->file_id());
  if (file == nullptr) return nullptr;

  SeenSet seen;
  return resolve_call_result(*file, callee, 0, seen);
}

const Expr * ReferenceResolver::resolve_call_result_by_name(FileId file_id, std::string_view name)
{
  const FileSymbolTable * file = index_.find(file_id);
  if (file == nullptr || name.empty()) return nullptr;

  SeenSet seen;
  if (const Expr * returned = resolve_local_function_return(*file, name, 1, seen)) return returned;

  const Expr * value = resolve_local_value(*file, name, 1, seen);
  if (value == nullptr) return resolve_workspace_factory(*file, name);
  if (const auto * fn = dyn_cast<FunctionExpr>(value)) {
    return extract_function_return_expression(fn);
  }
  return value;
}

const FileSymbolTable * ReferenceResolver::module_table(
  const FileSymbolTable & from, std::string_view source)
{
  const auto target = modules_.resolve(from.path, source);
  return target ? index_.find(*target) : nullptr;
}

namespace
{

/// Table of the file `node` was parsed from; `fallback` for synthetic nodes
const FileSymbolTable & origin_of(
  const SymbolIndex & index, const AstNode * node, const FileSymbolTable & fallback)
{
  const FileSymbolTable * table = node ? index.find(node->file_id()) : nullptr;
  return table ? *table : fallback;
}

}  // namespace

// ============================================================================
// Local / imported names
// ============================================================================

const Expr * ReferenceResolver::resolve_local_value(
  const FileSymbolTable & file, std::string_view name, int depth, SeenSet & seen)
{
  if (depth > k_max_resolve_depth) return nullptr;
  if (!seen.emplace(SeenKind::LocalValue, &file, std::string(name)).second) return nullptr;

  if (const Expr * value = file.find_value(name)) {
    const auto * alias = dyn_cast<Identifier>(value);
    if (alias != nullptr && alias->name != name) {
      const Expr * target = resolve_local_value(file, alias->name, depth + 1, seen);
      return target ? target : value;
    }
    return value;
  }

  if (const Expr * returned = file.find_function(name)) return returned;

  if (const ImportBinding * binding = file.find_import(name)) {
    return resolve_import(file, *binding, false, depth + 1, seen);
  }
  return nullptr;
}

const Expr * ReferenceResolver::resolve_local_function_return(
  const FileSymbolTable & file, std::string_view name, int depth, SeenSet & seen)
{
  if (depth > k_max_resolve_depth) return nullptr;
  if (!seen.emplace(SeenKind::LocalFunction, &file, std::string(name)).second) return nullptr;

  if (const Expr * returned = file.find_function(name)) return returned;

  if (const Expr * value = file.find_value(name)) {
    const auto * alias = dyn_cast<Identifier>(value);
    if (alias != nullptr && alias->name != name) {
      return resolve_local_function_return(file, alias->name, depth + 1, seen);
    }
    if (const auto * fn = dyn_cast<FunctionExpr>(value)) {
      return extract_function_return_expression(fn);
    }
    return nullptr;
  }

  if (const ImportBinding * binding = file.find_import(name)) {
    return resolve_import(file, *binding, true, depth + 1, seen);
  }
  return nullptr;
}

const Expr * ReferenceResolver::resolve_import(
  const FileSymbolTable & file, const ImportBinding & binding, bool function_return, int depth,
  SeenSet & seen)
{
  if (binding.kind == ImportKind::Namespace) return nullptr;

  const FileSymbolTable * target = module_table(file, binding.source);
  if (target == nullptr) return nullptr;

  std::string_view export_name = "default";
  if (binding.kind == ImportKind::Named && !binding.imported.empty()) {
    export_name = binding.imported;
  }
  return resolve_export(*target, export_name, function_return, depth + 1, seen);
}

const Expr * ReferenceResolver::resolve_export(
  const FileSymbolTable & file, std::string_view export_name, bool function_return, int depth,
  SeenSet & seen)
{
  if (depth > k_max_resolve_depth) return nullptr;
  const SeenKind kind = function_return ? SeenKind::ExportFunction : SeenKind::ExportValue;
  if (!seen.emplace(kind, &file, std::string(export_name)).second) return nullptr;

  if (const auto local = file.find_export(export_name)) {
    return function_return ? resolve_local_function_return(file, *local, depth + 1, seen)
                           : resolve_local_value(file, *local, depth + 1, seen);
  }

  // Re-export chains are followed lazily
  for (const ReExportBinding & re : file.reExports) {
    if (!re.all && re.exported != export_name) continue;

    const FileSymbolTable * nested = module_table(file, re.source);
    if (nested == nullptr) continue;

    const std::string_view nested_name =
      (re.all || re.imported.empty()) ? export_name : re.imported;
    const Expr * value = resolve_export(*nested, nested_name, function_return, depth + 1, seen);
    if (value != nullptr) {
      return value;
    }
  }
  return nullptr;
}

const Expr * ReferenceResolver::resolve_namespace_member(
  const FileSymbolTable & file, std::string_view ns, std::string_view member, int depth,
  SeenSet & seen)
{
  const ImportBinding * binding = file.find_import(ns);
  if (binding == nullptr || binding->kind != ImportKind::Namespace) return nullptr;

  const FileSymbolTable * target = module_table(file, binding->source);
  if (target == nullptr) return nullptr;
  return resolve_export(*target, member, false, depth + 1, seen);
}

// ============================================================================
// Fallback factory search
// ============================================================================

const Expr * ReferenceResolver::resolve_workspace_factory(
  const FileSymbolTable & file, std::string_view name)
{
  if (!is_likely_factory_name(name)) return nullptr;

  struct Candidate
  {
    const FileSymbolTable * table;
    const Expr * expression;
    size_t score;
  };

  std::vector<Candidate> candidates;
  for (const auto & table : index_.files()) {
    const Expr * returned = table->find_function(name);
    if (returned == nullptr) {
      const auto * fn = dyn_cast<FunctionExpr>(table->find_value(name));
      returned = extract_function_return_expression(fn);
    }
    if (returned == nullptr) continue;
    candidates.push_back(
      Candidate{table.get(), returned, common_path_prefix_length(file.path, table->path)});
  }

  if (candidates.empty()) return nullptr;

  std::sort(candidates.begin(), candidates.end(), [](const Candidate & a, const Candidate & b) {
    if (a.score != b.score) return a.score > b.score;
    return a.table->path < b.table->path;
  });

  // Equally ranked candidates in different files are ambiguous
  if (candidates.size() > 1 && candidates[1].score == candidates[0].score &&
      candidates[1].table != candidates[0].table) {
    return nullptr;
  }
  return candidates[0].expression;
}

// ============================================================================
// Member access
// ============================================================================

std::optional<std::string> ReferenceResolver::member_property_name(
  const FileSymbolTable & file, const MemberExpr * member, int depth, SeenSet & seen)
{
  if (const auto name = plain_member_name(member)) return std::string(*name);

  const Expr * property = unwrap_expr(member->property);
  if (property == nullptr) return std::nullopt;
  if (const auto * str = dyn_cast<StringLiteral>(property)) return std::string(str->value);
  if (const auto * num = dyn_cast<NumberLiteral>(property)) return js_number_to_string(num->value);

  // Computed key held in a constant
  const Expr * resolved = resolve_reference(file, property, depth + 1, seen);
  if (resolved == nullptr) resolved = property;
  if (const auto * str = dyn_cast<StringLiteral>(resolved)) return std::string(str->value);
  if (const auto * num = dyn_cast<NumberLiteral>(resolved)) return js_number_to_string(num->value);
  if (const auto * b = dyn_cast<BooleanLiteral>(resolved)) return b->value ? "true" : "false";
  return std::nullopt;
}

const Expr * ReferenceResolver::resolve_object_property(
  const FileSymbolTable & file, const ObjectExpr * object, std::string_view name, int depth,
  SeenSet & seen)
{
  if (depth > k_max_resolve_depth) return nullptr;

  // Last definition wins
  for (auto it = object->properties.rbegin(); it != object->properties.rend(); ++it) {
    const AstNode * member = *it;

    if (const auto * prop = dyn_cast<Property>(member)) {
      if (prop->propKind != PropertyKind::Init || prop->value == nullptr) continue;
      const auto key = static_property_key(prop);
      if (key && *key == name) return unwrap_expr(prop->value);
      continue;
    }

    const auto * spread = dyn_cast<SpreadElement>(member);
    if (spread == nullptr || spread->argument == nullptr) continue;

    const FileSymbolTable & origin = origin_of(index_, spread, file);
    const Expr * source = resolve_reference(origin, spread->argument, depth + 1, seen);
    if (source == nullptr) source = unwrap_expr(spread->argument);

    if (const auto * nested_object = dyn_cast<ObjectExpr>(source)) {
      const FileSymbolTable & nested_origin = origin_of(index_, nested_object, origin);
      if (const Expr * v =
            resolve_object_property(nested_origin, nested_object, name, depth + 1, seen)) {
        return v;
      }
    }
  }
  return nullptr;
}

const Expr * ReferenceResolver::resolve_wrapped_property(
  const FileSymbolTable & file, const CallExpr * call, std::string_view name, int depth,
  SeenSet & seen, bool & handled)
{
  handled = false;
  const Expr * wrapped = first_expression_argument(call);
  if (wrapped == nullptr) return nullptr;

  const bool passthrough = is_identity_wrapper_call(call->callee) ||
                           (call->arguments.size() == 1 && isa<ObjectExpr, ArrayExpr>(wrapped));
  if (!passthrough) return nullptr;

  const FileSymbolTable & origin = origin_of(index_, wrapped, file);
  const Expr * resolved = resolve_reference(origin, wrapped, depth + 1, seen);
  if (resolved == nullptr) resolved = wrapped;

  if (const auto * object = dyn_cast<ObjectExpr>(resolved)) {
    handled = true;
    return resolve_object_property(
      origin_of(index_, object, origin), object, name, depth + 1, seen);
  }
  if (const auto * array = dyn_cast<ArrayExpr>(resolved)) {
    handled = true;
    return array_element(array, name);
  }
  return nullptr;
}

// ============================================================================
// Reference resolution
// ============================================================================

const Expr * ReferenceResolver::resolve_reference(
  const FileSymbolTable & file, const Expr * expr, int depth, SeenSet & seen)
{
  if (depth > k_max_resolve_depth || expr == nullptr) return nullptr;

  const Expr * node = unwrap_expr(expr);
  if (const auto * id = dyn_cast<Identifier>(node)) {
    return resolve_local_value(file, id->name, depth + 1, seen);
  }

  const auto * member = dyn_cast<MemberExpr>(node);
  if (member == nullptr) return nullptr;

  // Resolved once: the walk marks a computed key's constant as seen
  const auto name = member_property_name(file, member, depth, seen);
  if (!name) return nullptr;

  if (const auto * ns = unwrap_as<Identifier>(member->object)) {
    if (const Expr * value = resolve_namespace_member(file, ns->name, *name, depth + 1, seen)) {
      return value;
    }
  }

  const Expr * object = resolve_reference(file, member->object, depth + 1, seen);
  if (object == nullptr) object = unwrap_expr(member->object);
  if (object == nullptr) return nullptr;

  const FileSymbolTable & origin = origin_of(index_, object, file);

  if (const auto * literal = dyn_cast<ObjectExpr>(object)) {
    return resolve_object_property(origin, literal, *name, depth + 1, seen);
  }

  if (const auto * call = dyn_cast<CallExpr>(object)) {
    if (*name == "queryKey") {
      if (const Expr * key = query_key_property_from_call(call)) return key;
    }

    bool handled = false;
    const Expr * wrapped = resolve_wrapped_property(origin, call, *name, depth, seen, handled);
    if (handled) return wrapped;

    const Expr * result = resolve_call_result(origin, call->callee, depth + 1, seen);
    if (const auto * result_object = dyn_cast<ObjectExpr>(result)) {
      return resolve_object_property(
        origin_of(index_, result_object, origin), result_object, *name, depth + 1, seen);
    }
    if (const auto * result_call = dyn_cast<CallExpr>(result)) {
      if (*name == "queryKey") {
        if (const Expr * key = query_key_property_from_call(result_call)) return key;
      }
      const Expr * nested = resolve_wrapped_property(
        origin_of(index_, result_call, origin), result_call, *name, depth, seen, handled);
      if (handled) return nested;
    }
  }

  if (const auto * array = dyn_cast<ArrayExpr>(object)) {
    return array_element(array, *name);
  }
  return nullptr;
}

// ============================================================================
// Call results
// ============================================================================

const Expr * ReferenceResolver::resolve_call_result(
  const FileSymbolTable & file, const Expr * callee, int depth, SeenSet & seen)
{
  if (depth > k_max_resolve_depth || callee == nullptr) return nullptr;
  callee = unwrap_expr(callee);

  if (const auto * id = dyn_cast<Identifier>(callee)) {
    if (const Expr * returned = resolve_local_function_return(file, id->name, depth + 1, seen)) {
      return returned;
    }

    const Expr * value = resolve_local_value(file, id->name, depth + 1, seen);
    if (value == nullptr) return resolve_workspace_factory(file, id->name);
    if (const auto * fn = dyn_cast<FunctionExpr>(value)) {
      return extract_function_return_expression(fn);
    }
    return value;
  }

  const auto * member = dyn_cast<MemberExpr>(callee);
  if (member == nullptr) return nullptr;

  const auto * ns = unwrap_as<Identifier>(member->object);
  const auto member_name = plain_member_name(member);
  if (ns != nullptr && member_name) {
    if (const Expr * fn = resolve_namespace_member(file, ns->name, *member_name, depth + 1, seen)) {
      if (const auto * fn_expr = dyn_cast<FunctionExpr>(fn)) {
        return extract_function_return_expression(fn_expr);
      }
      if (const auto * alias = dyn_cast<Identifier>(fn)) {
        return resolve_local_function_return(
          origin_of(index_, alias, file), alias->name, depth + 1, seen);
      }
      return fn;
    }
  }

  const Expr * reference = resolve_reference(file, callee, depth + 1, seen);
  if (reference == nullptr) return nullptr;

  if (const auto * fn_expr = dyn_cast<FunctionExpr>(reference)) {
    return extract_function_return_expression(fn_expr);
  }
  if (const auto * alias = dyn_cast<Identifier>(reference)) {
    return resolve_local_function_return(
      origin_of(index_, alias, file), alias->name, depth + 1, seen);
  }
  return reference;
}

}  // namespace qk_graph
