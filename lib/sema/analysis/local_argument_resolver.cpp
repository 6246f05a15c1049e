// qk_graph/sema/analysis/local_argument_resolver.cpp - Call-site argument resolution
//
#include "qk_graph/sema/analysis/local_argument_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "qk_graph/ast/visitor.hpp"
#include "qk_graph/sema/keys/expr_rewrite.hpp"
#include "qk_graph/sema/resolution/binding.hpp"

namespace qk_graph
{

namespace
{

constexpr std::string_view k_collection_passthrough_methods[] = {
  "filter", "slice", "sort", "reverse", "toSorted", "flat"};

bool is_collection_passthrough(std::string_view method)
{
  return std::find(
           std::begin(k_collection_passthrough_methods),
           std::end(k_collection_passthrough_methods), method) !=
         std::end(k_collection_passthrough_methods);
}

std::string lower(std::string_view text)
{
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

const Expr * first_argument(gsl::span<Expr *> args)
{
  if (args.empty() || args[0] == nullptr || isa<SpreadElement>(args[0])) return nullptr;
  return args[0];
}

/// `obj.method(...)` with an identifier method name
struct MemberCall
{
  std::string_view method;
  const Expr * object;
};

std::optional<MemberCall> member_call_parts(const Expr * callee)
{
  const auto * member = unwrap_as<MemberExpr>(callee);
  if (member == nullptr) return std::nullopt;
  const auto * property = dyn_cast<Identifier>(member->property);
  if (property == nullptr) return std::nullopt;
  return MemberCall{property->name, member->object};
}

std::optional<std::string> member_property_name(const MemberExpr * member)
{
  if (!member->computed) {
    if (const auto * id = dyn_cast<Identifier>(member->property)) return std::string(id->name);
  }
  if (const auto * str = dyn_cast<StringLiteral>(member->property)) return std::string(str->value);
  if (const auto * num = dyn_cast<NumberLiteral>(member->property)) {
    return js_number_to_string(num->value);
  }
  return std::nullopt;
}

/// `obj.name` / `arr[0]` looked up in an already resolved object or array literal
const Expr * member_of_literal(const MemberExpr * member, const Expr * object)
{
  const auto name = member_property_name(member);
  if (!name) return nullptr;

  if (const auto * literal = dyn_cast<ObjectExpr>(object)) {
    return literal_property_value(literal, *name);
  }

  const auto * array = dyn_cast<ArrayExpr>(object);
  if (array == nullptr || name->empty() || name->size() > 9) return nullptr;
  if (!std::all_of(name->begin(), name->end(), [](unsigned char c) { return std::isdigit(c); })) {
    return nullptr;
  }
  const size_t index = std::stoul(*name);
  if (index >= array->elements.size()) return nullptr;

  const Expr * element = array->elements[index];
  if (element == nullptr || isa<SpreadElement>(element)) return nullptr;
  return unwrap_expr(element);
}

bool is_query_options_like_call(const Expr * callee)
{
  const Expr * u = unwrap_expr(callee);
  std::string_view name;
  if (const auto * id = dyn_cast<Identifier>(u)) {
    name = id->name;
  } else if (const auto * member = dyn_cast<MemberExpr>(u)) {
    if (const auto * property = dyn_cast<Identifier>(member->property)) name = property->name;
  }
  return name == "queryOptions" || name == "infiniteQueryOptions";
}

/// `ReturnType<typeof factory>` -> factory
std::optional<std::string_view> return_type_factory_name(const TypeNode * type)
{
  const auto * ref = dyn_cast<TypeReference>(type);
  if (ref == nullptr || ref->path.size() != 1 || ref->path[0] != "ReturnType") return std::nullopt;
  if (ref->typeArguments.empty()) return std::nullopt;

  const auto * query = dyn_cast<TypeQuery>(ref->typeArguments[0]);
  if (query == nullptr || query->path.empty()) return std::nullopt;
  return query->path[query->path.size() - 1];
}

const TypeNode * type_literal_member_type(const TypeNode * type, std::string_view name)
{
  const auto * literal = dyn_cast<TypeLiteral>(type);
  if (literal == nullptr) return nullptr;
  for (const TypeMember * member : literal->members) {
    if (member != nullptr && member->type != nullptr && member->name == name) return member->type;
  }
  return nullptr;
}

/// Annotation of the destructured property that introduced `id`
const TypeNode * destructured_param_type(const AstNode * pattern, const BindingIdentifier * id)
{
  if (const auto * assign = dyn_cast<AssignmentPattern>(pattern)) {
    return destructured_param_type(assign->left, id);
  }
  const auto * object = dyn_cast<ObjectPattern>(pattern);
  if (object == nullptr) return nullptr;

  for (const AstNode * member : object->properties) {
    const auto * prop = dyn_cast<PatternProperty>(member);
    if (prop == nullptr) continue;

    const AstNode * value = prop->value;
    if (const auto * assign = dyn_cast<AssignmentPattern>(value)) value = assign->left;
    if (value == id) {
      const auto key = pattern_property_key(prop);
      return key ? type_literal_member_type(object->type, *key) : nullptr;
    }
    if (const TypeNode * nested = destructured_param_type(value, id)) return nested;
  }
  return nullptr;
}

/// Distinct parameter-bound identifiers referenced by an expression
class ParamReferenceCollector : public ConstRecursiveAstVisitor<ParamReferenceCollector>
{
public:
  bool visit_identifier(const Identifier * node)
  {
    if (node->binding == nullptr || !node->binding->is_param()) return true;
    const bool known = std::any_of(found.begin(), found.end(), [node](const Identifier * id) {
      return id->name == node->name;
    });
    if (!known) found.push_back(node);
    return true;
  }

  std::vector<const Identifier *> found;
};

/// Normalize every candidate, keeping concrete keys once
std::vector<NormalizedKey> normalize_candidates(
  KeyNormalizer & normalizer, const std::vector<const Expr *> & candidates, MatchMode mode)
{
  std::vector<NormalizedKey> keys;
  std::unordered_set<std::string> seen;
  for (const Expr * candidate : candidates) {
    NormalizedKey key = normalizer.normalize(candidate, {mode});
    if (key.is_wildcard() || is_unresolved_key(key)) continue;
    const std::string dedupe =
      key.id + ":" + key.display + ":" + std::string(to_string(key.matchMode));
    if (seen.insert(dedupe).second) keys.push_back(std::move(key));
  }
  return keys;
}

}  // namespace

// ============================================================================
// Free helpers
// ============================================================================

const Expr * literal_property_value(const ObjectExpr * object, std::string_view name)
{
  if (object == nullptr) return nullptr;

  for (auto it = object->properties.rbegin(); it != object->properties.rend(); ++it) {
    if (const auto * prop = dyn_cast<Property>(*it)) {
      const auto key = static_property_key(prop);
      if (key && *key == name && prop->value != nullptr && prop->propKind == PropertyKind::Init) {
        return unwrap_expr(prop->value);
      }
      continue;
    }

    const auto * spread = dyn_cast<SpreadElement>(*it);
    if (spread == nullptr) continue;
    const auto * source = unwrap_as<ObjectExpr>(spread->argument);
    if (const Expr * nested = literal_property_value(source, name)) return nested;
  }
  return nullptr;
}

std::optional<std::string> pattern_property_key(const PatternProperty * prop)
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

bool is_likely_key_factory_name(std::string_view name)
{
  const std::string lowered = lower(name);
  return lowered.find("querykey") != std::string::npos ||
         lowered.find("rqkey") != std::string::npos;
}

// ============================================================================
// Local resolution
// ============================================================================

const Expr * LocalArgumentResolver::resolve(const Expr * expr, int depth)
{
  SeenNames seen;
  return resolve(expr, depth, seen);
}

const Expr * LocalArgumentResolver::chain(const Expr * expr, int depth, SeenNames & seen)
{
  if (expr == nullptr) return nullptr;
  const Expr * chained = resolve(expr, depth, seen);
  return chained != nullptr ? chained : expr;
}

const Expr * LocalArgumentResolver::resolve(const Expr * expr, int depth, SeenNames & seen)
{
  if (depth >= k_max_local_resolve_depth || expr == nullptr) return nullptr;

  const Expr * u = unwrap_expr(expr);
  if (const auto * member = dyn_cast<MemberExpr>(u)) return resolve_member(member, depth, seen);
  if (const auto * call = dyn_cast<CallExpr>(u)) return resolve_call(call, depth, seen);
  if (const auto * id = dyn_cast<Identifier>(u)) return resolve_identifier(id, depth, seen);
  return nullptr;
}

const Expr * LocalArgumentResolver::resolve_member(
  const MemberExpr * member, int depth, SeenNames & seen)
{
  ReferenceResolver * resolver = normalizer_.resolver();

  if (const Expr * object = resolve(member->object, depth + 1, seen)) {
    if (const Expr * value = member_of_literal(member, object)) {
      return chain(value, depth + 1, seen);
    }
  }

  if (const auto property = member_property_name(member)) {
    if (const Expr * hinted = factory_hint_for_member(*property, member->file_id())) {
      return chain(hinted, depth + 1, seen);
    }
  }

  if (resolver != nullptr) {
    if (const Expr * direct = resolver->resolve_reference(member)) {
      return chain(direct, depth + 1, seen);
    }
  }
  return nullptr;
}

const Expr * LocalArgumentResolver::inline_call(const CallExpr * call, const FunctionExpr * fn)
{
  const Expr * inlined = extract_function_return_expression(fn);
  if (inlined == nullptr) return nullptr;

  for (size_t i = 0; i < fn->params.size(); ++i) {
    const auto * param = dyn_cast<BindingIdentifier>(fn->params[i]);
    if (param == nullptr || i >= call->arguments.size()) continue;
    const Expr * arg = call->arguments[i];
    if (arg == nullptr || isa<SpreadElement>(arg)) continue;
    inlined = substitute_identifier(normalizer_.scratch(), inlined, param->name, arg);
  }
  return inlined;
}

const Expr * LocalArgumentResolver::resolve_call(const CallExpr * call, int depth, SeenNames & seen)
{
  ReferenceResolver * resolver = normalizer_.resolver();
  const Expr * callee = unwrap_expr(call->callee);

  if (is_identity_wrapper_call(callee)) {
    if (const Expr * first = first_expression_argument(call)) return chain(first, depth + 1, seen);
  }

  if (const auto * fn = dyn_cast<FunctionExpr>(callee)) {
    if (const Expr * inlined = inline_call(call, fn)) return chain(inlined, depth + 1, seen);
  }

  const auto * callee_id = dyn_cast<Identifier>(callee);
  const bool factory_named = callee_id != nullptr && is_likely_key_factory_name(callee_id->name);

  if (callee_id != nullptr && !factory_named && callee_id->binding != nullptr) {
    const AstNode * declarator = callee_id->binding->declarator;
    const FunctionExpr * fn = nullptr;
    if (const auto * decl = dyn_cast<FunctionDecl>(declarator)) {
      fn = decl->function;
    } else if (isa<VariableDeclarator>(declarator)) {
      fn = dyn_cast<FunctionExpr>(callee_id->binding->init);
    }
    if (fn != nullptr) {
      if (const Expr * inlined = inline_call(call, fn)) return chain(inlined, depth + 1, seen);
    }
  }

  bool can_inline_reference = true;
  if (callee_id != nullptr) {
    if (factory_named) can_inline_reference = false;
    if (callee_id->binding != nullptr && callee_id->binding->is_import()) {
      can_inline_reference = false;
    }
  }

  if (resolver == nullptr) return nullptr;

  if (can_inline_reference) {
    const auto * fn = unwrap_as<FunctionExpr>(resolver->resolve_reference(callee));
    if (fn != nullptr) {
      if (const Expr * inlined = inline_call(call, fn)) return chain(inlined, depth + 1, seen);
    }
  }

  const Expr * result = resolver->resolve_call_result(callee);
  return chain(result, depth + 1, seen);
}

const Expr * LocalArgumentResolver::resolve_identifier(
  const Identifier * id, int depth, SeenNames & seen)
{
  if (!seen.insert(id->name).second) return nullptr;

  const Binding * binding = id->binding;
  if (binding == nullptr) return nullptr;

  if (binding->is_param()) {
    return chain(param_type_hint(binding, id->file_id()), depth + 1, seen);
  }

  if (binding->is_import() || !binding->constant) return nullptr;

  if (isa<VariableDeclarator>(binding->declarator)) {
    if (binding->init == nullptr) return nullptr;
    return chain(unwrap_expr(binding->init), depth + 1, seen);
  }

  if (const auto * decl = dyn_cast<FunctionDecl>(binding->declarator)) {
    return chain(extract_function_return_expression(decl->function), depth + 1, seen);
  }
  return nullptr;
}

const Expr * LocalArgumentResolver::param_type_hint(const Binding * binding, FileId file)
{
  ReferenceResolver * resolver = normalizer_.resolver();
  if (resolver == nullptr || binding->identifier == nullptr) return nullptr;

  const TypeNode * type = binding->identifier->type;
  if (type == nullptr) type = destructured_param_type(binding->declarator, binding->identifier);

  const auto factory = return_type_factory_name(type);
  if (!factory) return nullptr;
  return resolver->resolve_call_result_by_name(file, *factory);
}

const Expr * LocalArgumentResolver::factory_hint_for_member(std::string_view property, FileId file)
{
  ReferenceResolver * resolver = normalizer_.resolver();
  constexpr std::string_view suffix = "QueryKey";
  if (resolver == nullptr || property.size() <= suffix.size()) return nullptr;
  if (property.substr(property.size() - suffix.size()) != suffix) return nullptr;

  const std::string lowered = lower(property);
  if (lowered == "querykey" || lowered == "querykeys") return nullptr;

  const std::string_view base = property.substr(0, property.size() - suffix.size());
  std::string capitalized(base);
  capitalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(capitalized[0])));

  const std::string candidates[] = {
    "create" + capitalized + std::string(suffix), std::string(base) + std::string(suffix)};
  for (const std::string & candidate : candidates) {
    if (const Expr * resolved = resolver->resolve_call_result_by_name(file, candidate)) {
      return resolved;
    }
  }
  return nullptr;
}

gsl::span<Expr *> LocalArgumentResolver::resolve_arguments(gsl::span<Expr *> args)
{
  const Expr * first = first_argument(args);
  if (first == nullptr) return args;

  const Expr * resolved_first = resolve(first);
  const Expr * candidate = resolved_first != nullptr ? resolved_first : unwrap_expr(first);

  if (const auto * object = dyn_cast<ObjectExpr>(candidate)) {
    const ObjectExpr * rewritten = object;
    for (const AstNode * member : object->properties) {
      const auto * prop = dyn_cast<Property>(member);
      if (prop == nullptr || prop->value == nullptr || prop->propKind != PropertyKind::Init) {
        continue;
      }
      const auto key = static_property_key(prop);
      if (!key || *key != "queryKey") continue;

      if (const Expr * value = resolve(prop->value)) {
        rewritten = replace_property_value(normalizer_.scratch(), rewritten, prop, value);
      }
    }
    return replace_first_argument(normalizer_.scratch(), args, rewritten);
  }

  if (resolved_first == nullptr) return args;
  return replace_first_argument(normalizer_.scratch(), args, resolved_first);
}

// ============================================================================
// Iterator expansion
// ============================================================================

std::optional<std::vector<const Expr *>> LocalArgumentResolver::static_iterable_values(
  const Expr * expr, int depth)
{
  if (depth >= k_max_local_resolve_depth || expr == nullptr) return std::nullopt;

  ReferenceResolver * resolver = normalizer_.resolver();
  const Expr * u = unwrap_expr(expr);

  if (const auto * array = dyn_cast<ArrayExpr>(u)) {
    std::vector<const Expr *> out;
    for (const Expr * element : array->elements) {
      if (element == nullptr) continue;
      if (const auto * spread = dyn_cast<SpreadElement>(element)) {
        if (auto values = static_iterable_values(spread->argument, depth + 1)) {
          out.insert(out.end(), values->begin(), values->end());
        }
        continue;
      }

      const Expr * resolved = resolve(element, depth + 1);
      if (resolved == nullptr && resolver != nullptr) {
        resolved = resolver->resolve_reference(element);
      }
      if (resolved == nullptr) resolved = element;
      out.push_back(unwrap_expr(resolved));
    }
    return out;
  }

  if (isa<Identifier, MemberExpr>(u)) {
    const Expr * resolved = resolve(u, depth + 1);
    if (resolved == nullptr && resolver != nullptr) resolved = resolver->resolve_reference(u);
    if (resolved == nullptr) return std::nullopt;
    return static_iterable_values(resolved, depth + 1);
  }

  if (const auto * call = dyn_cast<CallExpr>(u)) {
    if (resolver == nullptr) return std::nullopt;
    const Expr * result = resolver->resolve_call_result(call->callee);
    if (result == nullptr) return std::nullopt;
    return static_iterable_values(result, depth + 1);
  }

  if (const auto * cond = dyn_cast<ConditionalExpr>(u)) {
    auto consequent = static_iterable_values(cond->consequent, depth + 1);
    auto alternate = static_iterable_values(cond->alternate, depth + 1);
    if (!consequent || !alternate) return std::nullopt;
    consequent->insert(consequent->end(), alternate->begin(), alternate->end());
    return consequent;
  }

  if (const auto * logical = dyn_cast<LogicalExpr>(u)) {
    if (logical->op != "||" && logical->op != "??") return std::nullopt;
    if (auto left = static_iterable_values(logical->left, depth + 1)) return left;
    return static_iterable_values(logical->right, depth + 1);
  }

  return std::nullopt;
}

std::optional<std::vector<const Expr *>> LocalArgumentResolver::iterator_param_values(
  const Binding * binding)
{
  if (binding == nullptr || !binding->is_param() || binding->function == nullptr) {
    return std::nullopt;
  }

  const CallExpr * iterator_call = binding->function->enclosingCall;
  if (iterator_call == nullptr) return std::nullopt;

  const auto member = member_call_parts(iterator_call->callee);
  if (!member) return std::nullopt;
  if (member->method != "forEach" && member->method != "map" && member->method != "flatMap") {
    return std::nullopt;
  }
  return static_iterable_values(member->object);
}

std::vector<NormalizedKey> LocalArgumentResolver::expand_action_keys(
  std::string_view method, gsl::span<Expr *> args)
{
  const Expr * first = first_argument(args);
  if (first == nullptr) return {};

  const Expr * key_expression = nullptr;
  MatchMode mode = MatchMode::Exact;
  if (method == "setQueryData") {
    key_expression = unwrap_expr(first);
  } else {
    const auto * options = unwrap_as<ObjectExpr>(first);
    if (options == nullptr) return {};
    key_expression = object_property_value(options, "queryKey");
    if (key_expression == nullptr) return {};
    mode = read_boolean_property(options, "exact").value_or(false) ? MatchMode::Exact
                                                                    : MatchMode::Prefix;
  }

  ParamReferenceCollector collector;
  collector.visit(key_expression);
  if (collector.found.size() != 1) return {};

  const Identifier * param = collector.found.front();
  const auto values = iterator_param_values(param->binding);
  if (!values || values->empty()) return {};

  std::vector<const Expr *> substituted;
  substituted.reserve(values->size());
  for (const Expr * value : *values) {
    substituted.push_back(
      substitute_identifier(normalizer_.scratch(), key_expression, param->name, value));
  }
  return normalize_candidates(normalizer_, substituted, mode);
}

// ============================================================================
// useQueries collections
// ============================================================================

const Expr * LocalArgumentResolver::resolve_collection_expression(const Expr * expr, int depth)
{
  if (depth >= k_max_local_resolve_depth) return unwrap_expr(expr);

  if (const Expr * local = resolve(expr, depth + 1)) return unwrap_expr(local);
  if (ReferenceResolver * resolver = normalizer_.resolver()) {
    if (const Expr * referenced = resolver->resolve_reference(expr)) return unwrap_expr(referenced);
  }
  return unwrap_expr(expr);
}

std::vector<const Expr *> LocalArgumentResolver::option_entry_templates(
  const Expr * expr, int depth)
{
  if (depth >= k_max_local_resolve_depth || expr == nullptr) return {};

  const Expr * resolved = resolve_collection_expression(expr, depth + 1);
  std::vector<const Expr *> out;
  auto append = [&out](const std::vector<const Expr *> & more) {
    out.insert(out.end(), more.begin(), more.end());
  };

  if (const auto * cond = dyn_cast<ConditionalExpr>(resolved)) {
    append(option_entry_templates(cond->consequent, depth + 1));
    append(option_entry_templates(cond->alternate, depth + 1));
    return out;
  }
  if (const auto * logical = dyn_cast<LogicalExpr>(resolved)) {
    if (logical->op == "&&") return option_entry_templates(logical->right, depth + 1);
    append(option_entry_templates(logical->left, depth + 1));
    append(option_entry_templates(logical->right, depth + 1));
    return out;
  }
  if (const auto * object = dyn_cast<ObjectExpr>(resolved)) {
    if (const Expr * key = object_property_value(object, "queryKey")) return {key};
    if (const Expr * queries = object_property_value(object, "queries")) {
      return collection_templates(queries, depth + 1);
    }
    return {};
  }
  if (isa<ArrayExpr>(resolved)) return {resolved};

  if (const auto * call = dyn_cast<CallExpr>(resolved)) {
    if (is_query_options_like_call(call->callee)) {
      const Expr * first = first_argument(call->arguments);
      if (first == nullptr) return {};
      return option_entry_templates(first, depth + 1);
    }
    return collection_templates(call, depth + 1);
  }
  return {};
}

const Expr * LocalArgumentResolver::mapper_return(const Expr * mapper, int depth)
{
  if (depth >= k_max_local_resolve_depth || mapper == nullptr) return nullptr;

  if (const auto * fn = dyn_cast<FunctionExpr>(mapper)) {
    return extract_function_return_expression(fn);
  }
  if (!isa<Identifier, MemberExpr>(mapper)) return nullptr;

  const auto * fn = dyn_cast<FunctionExpr>(resolve_collection_expression(mapper, depth + 1));
  return fn != nullptr ? extract_function_return_expression(fn) : nullptr;
}

std::vector<const Expr *> LocalArgumentResolver::collection_templates(const Expr * expr, int depth)
{
  if (depth >= k_max_local_resolve_depth || expr == nullptr) return {};

  const Expr * resolved = resolve_collection_expression(expr, depth + 1);
  std::vector<const Expr *> out;
  auto append = [&out](const std::vector<const Expr *> & more) {
    out.insert(out.end(), more.begin(), more.end());
  };

  if (const auto * cond = dyn_cast<ConditionalExpr>(resolved)) {
    append(collection_templates(cond->consequent, depth + 1));
    append(collection_templates(cond->alternate, depth + 1));
    return out;
  }
  if (const auto * logical = dyn_cast<LogicalExpr>(resolved)) {
    if (logical->op == "&&") return collection_templates(logical->right, depth + 1);
    append(collection_templates(logical->left, depth + 1));
    append(collection_templates(logical->right, depth + 1));
    return out;
  }

  if (const auto * call = dyn_cast<CallExpr>(resolved)) {
    const auto member = member_call_parts(call->callee);
    if (!member) return option_entry_templates(call, depth + 1);

    if (member->method == "map" || member->method == "flatMap") {
      const Expr * mapper = first_argument(call->arguments);
      const Expr * mapped = mapper_return(mapper, depth + 1);
      if (mapped == nullptr) return collection_templates(member->object, depth + 1);
      return member->method == "flatMap" ? collection_templates(mapped, depth + 1)
                                         : option_entry_templates(mapped, depth + 1);
    }
    if (is_collection_passthrough(member->method)) {
      return collection_templates(member->object, depth + 1);
    }
    if (member->method == "concat") {
      append(collection_templates(member->object, depth + 1));
      for (const Expr * arg : call->arguments) {
        if (arg == nullptr || isa<SpreadElement>(arg)) continue;
        append(collection_templates(arg, depth + 1));
      }
      return out;
    }
  }

  if (const auto * array = dyn_cast<ArrayExpr>(resolved)) {
    for (const Expr * element : array->elements) {
      if (element == nullptr) continue;
      if (const auto * spread = dyn_cast<SpreadElement>(element)) {
        append(collection_templates(spread->argument, depth + 1));
        continue;
      }
      append(option_entry_templates(element, depth + 1));
    }
    return out;
  }

  return option_entry_templates(resolved, depth + 1);
}

std::vector<LocalArgumentResolver::IteratorTemplate> LocalArgumentResolver::iterator_templates(
  const Expr * expr, int depth)
{
  if (depth >= k_max_local_resolve_depth || expr == nullptr) return {};

  const Expr * resolved = resolve_collection_expression(expr, depth + 1);
  std::vector<IteratorTemplate> out;
  auto append = [&out](const std::vector<IteratorTemplate> & more) {
    out.insert(out.end(), more.begin(), more.end());
  };

  if (const auto * cond = dyn_cast<ConditionalExpr>(resolved)) {
    append(iterator_templates(cond->consequent, depth + 1));
    append(iterator_templates(cond->alternate, depth + 1));
    return out;
  }
  if (const auto * logical = dyn_cast<LogicalExpr>(resolved)) {
    if (logical->op == "&&") return iterator_templates(logical->right, depth + 1);
    append(iterator_templates(logical->left, depth + 1));
    append(iterator_templates(logical->right, depth + 1));
    return out;
  }
  if (const auto * object = dyn_cast<ObjectExpr>(resolved)) {
    const Expr * queries = object_property_value(object, "queries");
    return queries != nullptr ? iterator_templates(queries, depth + 1) : out;
  }
  if (const auto * array = dyn_cast<ArrayExpr>(resolved)) {
    for (const Expr * element : array->elements) {
      if (element == nullptr || isa<SpreadElement>(element)) continue;
      append(iterator_templates(element, depth + 1));
    }
    return out;
  }

  const auto * call = dyn_cast<CallExpr>(resolved);
  if (call == nullptr) return out;
  const auto member = member_call_parts(call->callee);
  if (!member) return out;

  if (member->method == "map" || member->method == "flatMap") {
    const Expr * mapper = first_argument(call->arguments);
    if (mapper == nullptr) return out;

    // Only inline callbacks name their iterator parameter
    const auto * fn = dyn_cast<FunctionExpr>(mapper);
    if (fn == nullptr || fn->params.empty()) return out;
    const auto * param = dyn_cast<BindingIdentifier>(fn->params[0]);
    const Expr * mapped = extract_function_return_expression(fn);
    if (param == nullptr || mapped == nullptr) return out;

    const auto templates = member->method == "flatMap" ? collection_templates(mapped, depth + 1)
                                                       : option_entry_templates(mapped, depth + 1);
    for (const Expr * key_template : templates) {
      out.push_back(IteratorTemplate{member->object, param->name, key_template});
    }
    return out;
  }

  if (is_collection_passthrough(member->method)) {
    return iterator_templates(member->object, depth + 1);
  }
  if (member->method == "concat") {
    append(iterator_templates(member->object, depth + 1));
    for (const Expr * arg : call->arguments) {
      if (arg == nullptr || isa<SpreadElement>(arg)) continue;
      append(iterator_templates(arg, depth + 1));
    }
  }
  return out;
}

std::vector<NormalizedKey> LocalArgumentResolver::expand_hook_keys_by_iterator(
  std::string_view hook_name, gsl::span<Expr *> args)
{
  if (!is_query_collection_hook(hook_name)) return {};
  const Expr * first = first_argument(args);
  if (first == nullptr) return {};

  std::vector<const Expr *> substituted;
  for (const IteratorTemplate & candidate : iterator_templates(first, 0)) {
    const auto values = static_iterable_values(candidate.iterable);
    if (!values) continue;
    for (const Expr * value : *values) {
      substituted.push_back(substitute_identifier(
        normalizer_.scratch(), candidate.keyTemplate, candidate.param, value));
    }
  }
  return normalize_candidates(normalizer_, substituted, MatchMode::Exact);
}

std::vector<NormalizedKey> LocalArgumentResolver::expand_hook_keys_by_collection(
  std::string_view hook_name, gsl::span<Expr *> args)
{
  if (!is_query_collection_hook(hook_name)) return {};
  const Expr * first = first_argument(args);
  if (first == nullptr) return {};

  return normalize_candidates(normalizer_, collection_templates(first, 0), MatchMode::Exact);
}

}  // namespace qk_graph
