// qk_graph/sema/keys/key_normalizer.cpp - Segment folding and key-expression resolution
//
#include "qk_graph/sema/keys/key_normalizer.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "qk_graph/sema/keys/expr_rewrite.hpp"

namespace qk_graph
{

namespace
{

constexpr std::string_view k_collection_transform_methods[] = {
  "join", "sort", "slice", "map", "filter", "flat", "flatMap", "concat", "reverse", "toSorted"};

bool is_collection_transform(std::string_view name)
{
  return std::find(
           std::begin(k_collection_transform_methods), std::end(k_collection_transform_methods),
           name) != std::end(k_collection_transform_methods);
}

Segment dynamic(std::string text) { return Segment{std::move(text), false}; }

Segment unresolved() { return Segment{std::string(k_unresolved_segment), false}; }

/// Callee name of `f()` or `x.f()`
std::optional<std::string_view> call_callee_name(const Expr * callee)
{
  callee = unwrap_expr(callee);
  if (const auto * id = dyn_cast<Identifier>(callee)) return id->name;
  if (const auto * member = dyn_cast<MemberExpr>(callee)) {
    if (member->computed) return std::nullopt;
    if (const auto * prop = dyn_cast<Identifier>(member->property)) return prop->name;
  }
  return std::nullopt;
}

bool is_memo_like_call(const CallExpr * call)
{
  const auto name = call_callee_name(call->callee);
  return name && (*name == "useMemo" || *name == "useCallback");
}

/// Value memoized by `useMemo(() => value)` / `useCallback(fn)`
const Expr * memo_return_expression(const CallExpr * call)
{
  if (!is_memo_like_call(call)) return nullptr;
  const Expr * first = first_expression_argument(call);
  if (const auto * fn = dyn_cast<FunctionExpr>(first)) {
    return extract_function_return_expression(fn);
  }
  return first;
}

bool is_empty_fallback(const Expr * node)
{
  node = unwrap_expr(node);
  if (const auto * str = dyn_cast<StringLiteral>(node)) return str->value.empty();
  if (const auto * tpl = dyn_cast<TemplateLiteral>(node)) {
    return tpl->expressions.empty() && tpl->quasis.size() == 1 && tpl->quasis[0].empty();
  }
  if (const auto * object = dyn_cast<ObjectExpr>(node)) return object->properties.empty();
  if (const auto * array = dyn_cast<ArrayExpr>(node)) return array->elements.empty();
  if (isa<NullLiteral>(node)) return true;
  if (const auto * id = dyn_cast<Identifier>(node)) return id->name == "undefined";
  return false;
}

/// Key of a wrapper array whose first element is a `{ queryKey }` object
const Expr * embedded_query_key(const ArrayExpr * array)
{
  if (array->elements.empty() || array->elements[0] == nullptr) return nullptr;
  const auto * object = unwrap_as<ObjectExpr>(array->elements[0]);
  if (object == nullptr || object->properties.size() != 1) return nullptr;
  return object_property_value(object, "queryKey");
}

std::string literal_number_text(const NumberLiteral * num)
{
  if (num->isBigInt) {
    std::string_view raw = num->raw;
    if (!raw.empty() && raw.back() == 'n') raw.remove_suffix(1);
    return std::string(raw);
  }
  return js_number_to_string(num->value);
}

}  // namespace

// ============================================================================
// Free helpers
// ============================================================================

bool is_query_key_like_name(std::string_view name)
{
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower.compare(0, 5, "query") != 0) return false;

  std::string_view rest = std::string_view(lower).substr(5);
  if (!rest.empty() && rest.back() == 's') rest.remove_suffix(1);
  if (rest == "key") return true;
  return rest.size() == 4 && rest.substr(1) == "key";
}

bool is_pass_through_query_key_reference(const Expr * expr)
{
  auto matches = [](std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return lower == "querykey" || lower == "querykeys";
  };

  expr = unwrap_expr(expr);
  if (const auto * id = dyn_cast<Identifier>(expr)) return matches(id->name);

  const auto * member = dyn_cast<MemberExpr>(expr);
  if (member == nullptr || member->computed) return false;
  const auto * prop = dyn_cast<Identifier>(member->property);
  return prop != nullptr && matches(prop->name);
}

bool should_treat_as_wildcard_action_key(const NormalizedKey & key)
{
  if (key.id == k_empty_key_id && key.segments.empty()) return true;
  if (key.id == k_unresolved_key_id) return true;
  return key.segments.size() == 1 && key.segments[0] == k_unresolved_segment;
}

std::optional<bool> read_boolean_property(const ObjectExpr * object, std::string_view name)
{
  if (object == nullptr) return std::nullopt;
  for (const AstNode * member : object->properties) {
    const auto * prop = dyn_cast<Property>(member);
    if (prop == nullptr || prop->propKind != PropertyKind::Init) continue;
    const auto key = static_property_key(prop);
    if (!key || *key != name) continue;

    if (const auto * b = dyn_cast<BooleanLiteral>(prop->value)) return b->value;
    return std::nullopt;
  }
  return std::nullopt;
}

// ============================================================================
// Resolution
// ============================================================================

const Expr * KeyNormalizer::resolve_with_resolver(const Expr * node, int depth)
{
  if (resolver_ == nullptr || depth >= k_max_normalize_depth) return nullptr;

  if (const auto * call = dyn_cast<CallExpr>(node)) {
    const Expr * first = first_expression_argument(call);
    if (first != nullptr && call->arguments.size() == 1) {
      if (is_identity_wrapper_call(call->callee)) return first;
      if (isa<ObjectExpr, ArrayExpr>(first)) return first;
    }

    if (const Expr * result = resolver_->resolve_call_result(call->callee)) return result;
    return resolver_->resolve_reference(call->callee);
  }

  if (isa<Identifier, MemberExpr>(node)) return resolver_->resolve_reference(node);
  return nullptr;
}

const Expr * KeyNormalizer::resolve_object_property_expression(
  const ObjectExpr * object, std::string_view name, int depth)
{
  if (depth >= k_max_normalize_depth) return nullptr;

  for (auto it = object->properties.rbegin(); it != object->properties.rend(); ++it) {
    if (const auto * prop = dyn_cast<Property>(*it)) {
      if (prop->propKind != PropertyKind::Init || prop->value == nullptr) continue;
      const auto key = property_name_of(prop->key, prop->computed, depth + 1);
      if (key && *key == name) return unwrap_expr(prop->value);
      continue;
    }

    const auto * spread = dyn_cast<SpreadElement>(*it);
    if (spread == nullptr || spread->argument == nullptr) continue;

    const Expr * source = resolve_key_expression(spread->argument, depth + 1);
    if (source == nullptr) source = unwrap_expr(spread->argument);
    if (const auto * nested_object = dyn_cast<ObjectExpr>(source)) {
      const Expr * nested = resolve_object_property_expression(nested_object, name, depth + 1);
      if (nested != nullptr) {
        return nested;
      }
    }
  }
  return nullptr;
}

const Expr * KeyNormalizer::resolve_key_expression(const Expr * node, int depth)
{
  if (depth >= k_max_normalize_depth || node == nullptr) return nullptr;

  const Expr * u = unwrap_expr(node);

  if (const auto * object = dyn_cast<ObjectExpr>(u)) {
    if (const Expr * key = object_property_value(object, "queryKey")) {
      const Expr * r = resolve_key_expression(key, depth + 1);
      return r ? r : key;
    }
    return object;
  }

  if (const auto * call = dyn_cast<CallExpr>(u)) {
    const Expr * first = first_expression_argument(call);
    const bool single = first != nullptr && call->arguments.size() == 1;

    const Expr * resolved_first = nullptr;
    if (single) {
      resolved_first = resolve_key_expression(first, depth + 1);
      if (resolved_first == nullptr) resolved_first = first;

      if (const auto * object = dyn_cast<ObjectExpr>(resolved_first)) {
        if (const Expr * key = object_property_value(object, "queryKey")) {
          const Expr * r = resolve_key_expression(key, depth + 1);
          return r ? r : key;
        }
      }

      if (is_identity_wrapper_call(call->callee)) {
        const Expr * r = resolve_key_expression(resolved_first, depth + 1);
        return r ? r : resolved_first;
      }
    }

    if (resolver_ != nullptr) {
      if (const Expr * result = resolver_->resolve_call_result(call->callee)) {
        const Expr * hinted = apply_call_argument_hints(call, result, depth + 1);
        const Expr * r = resolve_key_expression(hinted, depth + 1);
        return r ? r : hinted;
      }
    }

    if (isa<ObjectExpr, ArrayExpr>(resolved_first)) return resolved_first;
    return call;
  }

  if (isa<Identifier, MemberExpr>(u) && resolver_ != nullptr) {
    if (const Expr * resolved = resolver_->resolve_reference(u)) {
      const Expr * r = resolve_key_expression(resolved, depth + 1);
      return r ? r : resolved;
    }
  }

  if (const auto * member = dyn_cast<MemberExpr>(u)) {
    const auto name = property_name_of(member->property, member->computed, depth + 1);
    if (!name) return member;

    const auto * object = unwrap_as<ObjectExpr>(member->object);
    if (object == nullptr) {
      object = dyn_cast<ObjectExpr>(resolve_key_expression(member->object, depth + 1));
    }
    if (object != nullptr) {
      if (const Expr * value = resolve_object_property_expression(object, *name, depth + 1)) {
        const Expr * r = resolve_key_expression(value, depth + 1);
        return r ? r : value;
      }
    }
  }

  return u;
}

const ObjectExpr * KeyNormalizer::resolve_action_options(const Expr * node, int depth)
{
  if (depth >= k_max_normalize_depth || node == nullptr) return nullptr;

  const Expr * u = unwrap_expr(node);
  if (const auto * object = dyn_cast<ObjectExpr>(u)) return object;

  if (const auto * call = dyn_cast<CallExpr>(u)) {
    const Expr * first = first_expression_argument(call);
    if (first != nullptr && call->arguments.size() == 1 && is_identity_wrapper_call(call->callee)) {
      return resolve_action_options(first, depth + 1);
    }

    if (resolver_ != nullptr) {
      if (const Expr * result = resolver_->resolve_call_result(call->callee)) {
        const Expr * hinted = apply_call_argument_hints(call, result, depth + 1);
        return resolve_action_options(hinted, depth + 1);
      }
    }
    return nullptr;
  }

  if (isa<Identifier, MemberExpr>(u) && resolver_ != nullptr) {
    if (const Expr * resolved = resolver_->resolve_reference(u)) {
      return resolve_action_options(resolved, depth + 1);
    }
  }
  return nullptr;
}

// ============================================================================
// Call-argument hints
// ============================================================================

void KeyNormalizer::collect_object_substitutions(
  const ObjectExpr * object, int depth, std::map<std::string, const Expr *> & out)
{
  if (depth >= k_max_normalize_depth) return;

  for (const AstNode * member : object->properties) {
    if (const auto * prop = dyn_cast<Property>(member)) {
      if (prop->propKind != PropertyKind::Init || prop->value == nullptr) continue;
      if (const auto key = property_name_of(prop->key, prop->computed, depth + 1)) {
        out[*key] = unwrap_expr(prop->value);
      }
      continue;
    }

    const auto * spread = dyn_cast<SpreadElement>(member);
    if (spread == nullptr || spread->argument == nullptr) continue;

    const Expr * source = resolve_key_expression(spread->argument, depth + 1);
    if (source == nullptr) source = unwrap_expr(spread->argument);
    if (const auto * nested = dyn_cast<ObjectExpr>(source)) {
      collect_object_substitutions(nested, depth + 1, out);
    }
  }
}

const Expr * KeyNormalizer::apply_object_argument_hints(
  const Expr * expr, const ObjectExpr * object, int depth)
{
  std::map<std::string, const Expr *> substitutions;
  collect_object_substitutions(object, depth + 1, substitutions);

  const Expr * next = expr;
  for (const auto & [name, replacement] : substitutions) {
    if (!expression_contains_identifier(next, name)) continue;
    // Names are interned so the rewritten tree never points at map storage
    next = substitute_identifier(scratch_, next, scratch_.intern(name), replacement);
  }
  return next;
}

const Expr * KeyNormalizer::apply_call_argument_hints(
  const CallExpr * call, const Expr * resolved_call, int depth)
{
  const Expr * first = first_expression_argument(call);
  if (first == nullptr) return resolved_call;

  const auto callee_name = call_callee_name(call->callee);
  const auto * returned_id = dyn_cast<Identifier>(resolved_call);
  if (returned_id != nullptr && is_query_key_like_name(returned_id->name) && callee_name &&
      is_query_key_like_name(*callee_name)) {
    const Expr * r = resolve_key_expression(first, depth + 1);
    return r ? r : first;
  }

  const Expr * resolved_first = resolve_key_expression(first, depth + 1);
  if (resolved_first == nullptr) resolved_first = first;
  if (const auto * object = dyn_cast<ObjectExpr>(resolved_first)) {
    const Expr * hinted = apply_object_argument_hints(resolved_call, object, depth + 1);
    if (hinted != resolved_call) return hinted;
  }

  if (!expression_contains_identifier(resolved_call, "queryKey")) return resolved_call;
  return substitute_identifier(scratch_, resolved_call, "queryKey", first);
}

// ============================================================================
// Property names
// ============================================================================

std::optional<PropertyName> KeyNormalizer::infer_property_name(
  const Expr * property, bool computed, int depth)
{
  if (property == nullptr) return std::nullopt;
  if (const auto * id = dyn_cast<Identifier>(property); id != nullptr && !computed) {
    return PropertyName{std::string(id->name), true};
  }
  if (const auto * str = dyn_cast<StringLiteral>(property)) {
    return PropertyName{std::string(str->value), true};
  }
  if (const auto * num = dyn_cast<NumberLiteral>(property)) {
    return PropertyName{literal_number_text(num), true};
  }

  const Segment evaluated = segment_from_expression(property, depth + 1);
  return PropertyName{evaluated.text, evaluated.isStatic};
}

std::optional<std::string> KeyNormalizer::property_name_of(
  const Expr * property, bool computed, int depth)
{
  auto inferred = infer_property_name(property, computed, depth);
  if (!inferred) return std::nullopt;
  return std::move(inferred->value);
}

// ============================================================================
// Segments
// ============================================================================

Segment KeyNormalizer::segment_from_expression(const Expr * node, int depth)
{
  if (depth >= k_max_normalize_depth || node == nullptr) return dynamic("expr");
  if (isa<SpreadElement>(node)) return dynamic("...spread");

  const Expr * u = unwrap_expr(node);

  if (const auto * id = dyn_cast<Identifier>(u)) {
    if (id->name == "undefined") return Segment{"undefined", true};

    const std::string placeholder = fmt::format("${}", id->name);
    const Expr * resolved = resolver_ ? resolver_->resolve_reference(id) : nullptr;
    if (resolved == nullptr) return dynamic(placeholder);

    const Expr * value = unwrap_expr(resolved);
    if (const auto * call = dyn_cast<CallExpr>(value)) {
      // Values computed by hooks or methods at runtime stay symbolic
      if (is_memo_like_call(call) || isa<MemberExpr>(unwrap_expr(call->callee))) {
        return dynamic(placeholder);
      }
      return segment_from_expression(value, depth + 1);
    }
    if (isa<MemberExpr>(value)) return dynamic(placeholder);
    return segment_from_expression(value, depth + 1);
  }

  if (const Expr * resolved = resolve_with_resolver(u, depth)) {
    return segment_from_expression(resolved, depth + 1);
  }

  switch (u->get_kind()) {
    case NodeKind::StringLiteral:
      return Segment{std::string(cast<StringLiteral>(u)->value), true};
    case NodeKind::NumberLiteral:
      return Segment{literal_number_text(cast<NumberLiteral>(u)), true};
    case NodeKind::BooleanLiteral:
      return Segment{cast<BooleanLiteral>(u)->value ? "true" : "false", true};
    case NodeKind::NullLiteral:
      return Segment{"null", true};
    case NodeKind::TemplateLiteral:
      return segment_from_template(cast<TemplateLiteral>(u), depth);
    case NodeKind::FunctionExpr:
      return segment_from_function(cast<FunctionExpr>(u), depth);
    case NodeKind::MemberExpr:
      return segment_from_member(cast<MemberExpr>(u), depth);
    case NodeKind::CallExpr:
      return segment_from_call(cast<CallExpr>(u), depth);

    case NodeKind::ArrayExpr: {
      std::vector<std::string> texts;
      bool is_static = true;
      for (const Expr * element : cast<ArrayExpr>(u)->elements) {
        const Segment seg =
          element ? segment_from_expression(element, depth + 1) : Segment{"undefined", true};
        texts.push_back(seg.text);
        is_static = is_static && seg.isStatic;
      }
      return Segment{fmt::format("[{}]", fmt::join(texts, ", ")), is_static};
    }

    case NodeKind::ObjectExpr: {
      const auto * object = cast<ObjectExpr>(u);
      if (const Expr * key = object_property_value(object, "queryKey")) {
        return segment_from_expression(key, depth + 1);
      }
      return segment_from_object(object, depth + 1);
    }

    case NodeKind::UnaryExpr: {
      const auto * unary = cast<UnaryExpr>(u);
      const Segment arg = segment_from_expression(unary->argument, depth + 1);
      return Segment{fmt::format("{}{}", unary->op, arg.text), arg.isStatic};
    }

    case NodeKind::LogicalExpr: {
      const auto * logical = cast<LogicalExpr>(u);
      const Segment left = normalize_segment(segment_from_expression(logical->left, depth + 1));
      const Segment right = normalize_segment(segment_from_expression(logical->right, depth + 1));
      if ((logical->op == "||" || logical->op == "??") &&
          (is_empty_fallback(logical->right) || right.text == k_unresolved_segment)) {
        return left;
      }
      return Segment{
        fmt::format("{} {} {}", left.text, logical->op, right.text),
        left.isStatic && right.isStatic};
    }

    case NodeKind::ConditionalExpr:
      // Branches are expanded by the classifier, never here
      return dynamic("cond(...)");

    default:
      return dynamic("expr");
  }
}

Segment KeyNormalizer::segment_from_template(const TemplateLiteral * tpl, int depth)
{
  std::string text;
  bool is_static = true;
  for (size_t i = 0; i < tpl->quasis.size(); ++i) {
    text += tpl->quasis[i];
    if (i >= tpl->expressions.size()) continue;

    const Segment seg = segment_from_expression(tpl->expressions[i], depth + 1);
    text += fmt::format("${{{}}}", seg.text);
    is_static = is_static && seg.isStatic;
  }
  return Segment{std::move(text), is_static};
}

Segment KeyNormalizer::segment_from_function(const FunctionExpr * fn, int depth)
{
  const Expr * returned = extract_function_return_expression(fn);
  if (returned == nullptr) return dynamic("expr");

  const Expr * resolved = resolve_key_expression(returned, depth + 1);
  if (resolved == nullptr) resolved = unwrap_expr(returned);

  if (const auto * array = dyn_cast<ArrayExpr>(resolved)) {
    if (array->elements.empty() || array->elements[0] == nullptr) return unresolved();
    const auto first = segments_from_array_element(array->elements[0], depth + 1);
    if (first.empty()) return unresolved();
    return normalize_segment(first.front());
  }
  return segment_from_expression(resolved, depth + 1);
}

Segment KeyNormalizer::segment_from_member(const MemberExpr * member, int depth)
{
  const auto property = infer_property_name(member->property, member->computed, depth + 1);

  if (member->optional) {
    const Segment object = segment_from_expression(member->object, depth + 1);
    if (!property) return dynamic(object.text + "?.?");
    const std::string text = member->computed
                               ? fmt::format("{}?.[{}]", object.text, property->value)
                               : fmt::format("{}?.{}", object.text, property->value);
    return Segment{text, object.isStatic && property->isStatic};
  }

  if (property) {
    const auto * object = unwrap_as<ObjectExpr>(member->object);
    if (object == nullptr) {
      object = dyn_cast<ObjectExpr>(resolve_key_expression(member->object, depth + 1));
    }
    if (object != nullptr) {
      const Expr * value =
        resolve_object_property_expression(object, property->value, depth + 1);
      if (value != nullptr) {
        return segment_from_expression(value, depth + 1);
      }
    }
  }

  const Segment object = segment_from_expression(member->object, depth + 1);
  if (!property) return dynamic(object.text + ".?");

  const std::string text = member->computed ? fmt::format("{}[{}]", object.text, property->value)
                                            : fmt::format("{}.{}", object.text, property->value);
  return Segment{text, object.isStatic && property->isStatic};
}

Segment KeyNormalizer::call_arguments_segment(gsl::span<Expr *> args, int depth)
{
  std::vector<std::string> texts;
  bool is_static = true;
  for (const Expr * arg : args) {
    Segment seg;
    if (arg == nullptr) {
      seg = unresolved();
    } else if (const auto * spread = dyn_cast<SpreadElement>(arg)) {
      const Segment inner = normalize_segment(segment_from_expression(spread->argument, depth + 1));
      seg = Segment{"..." + inner.text, inner.isStatic};
    } else {
      seg = normalize_segment(segment_from_expression(arg, depth + 1));
    }
    texts.push_back(seg.text);
    is_static = is_static && seg.isStatic;
  }
  return Segment{fmt::format("{}", fmt::join(texts, ", ")), is_static};
}

Segment KeyNormalizer::method_call_segment(
  const MemberExpr * callee, gsl::span<Expr *> args, int depth)
{
  const Segment object = segment_from_expression(callee->object, depth + 1);
  const auto property = infer_property_name(callee->property, callee->computed, depth + 1);

  // `ids.slice().sort()` and `tags?.join(',')` render as their receiver
  if (property && is_collection_transform(property->value)) return object;

  const Segment arguments = call_arguments_segment(args, depth + 1);
  const std::string property_text = property ? property->value : "?";
  const std::string_view dot = callee->optional ? "?." : ".";
  const std::string target =
    callee->computed
      ? fmt::format("{}{}[{}]", object.text, callee->optional ? "?." : "", property_text)
      : fmt::format("{}{}{}", object.text, dot, property_text);

  return Segment{
    fmt::format("{}({})", target, arguments.text),
    object.isStatic && property && property->isStatic && arguments.isStatic};
}

Segment KeyNormalizer::segment_from_call(const CallExpr * call, int depth)
{
  const Expr * callee = unwrap_expr(call->callee);
  const auto * member_callee = dyn_cast<MemberExpr>(callee);
  const bool optional_chain = call->optional || (member_callee && member_callee->optional);

  if (!optional_chain) {
    if (const Expr * memo = memo_return_expression(call)) {
      return segment_from_expression(memo, depth + 1);
    }

    if (const Expr * resolved = resolver_ ? resolver_->resolve_reference(callee) : nullptr) {
      if (const auto * fn = dyn_cast<FunctionExpr>(resolved)) {
        if (const Expr * returned = extract_function_return_expression(fn)) {
          return segment_from_expression(returned, depth + 1);
        }
      }
      Segment value = segment_from_expression(resolved, depth + 1);
      if (value.text != "expr") return value;
    }
  }

  if (const auto * id = dyn_cast<Identifier>(callee)) {
    return dynamic(fmt::format("call({})", id->name));
  }
  if (member_callee != nullptr) return method_call_segment(member_callee, call->arguments, depth);
  return dynamic("call(expr)");
}

Segment KeyNormalizer::object_key_segment(const Property * prop, int depth)
{
  const Expr * key = prop->key;
  if (const auto * id = dyn_cast<Identifier>(key); id != nullptr && !prop->computed) {
    return Segment{std::string(id->name), true};
  }
  if (key == nullptr) return unresolved();
  return normalize_segment(segment_from_expression(key, depth + 1));
}

Segment KeyNormalizer::segment_from_object(const ObjectExpr * object, int depth)
{
  std::vector<std::string> entries;
  std::vector<std::pair<std::string, Segment>> sortable;
  bool is_static = true;
  bool canonical_order = true;

  for (const AstNode * member : object->properties) {
    if (const auto * spread = dyn_cast<SpreadElement>(member)) {
      canonical_order = false;
      if (spread->argument == nullptr) {
        entries.emplace_back("...UNRESOLVED");
        is_static = false;
        continue;
      }

      const Expr * source = resolve_key_expression(spread->argument, depth + 1);
      if (source == nullptr) source = unwrap_expr(spread->argument);

      if (const auto * nested = dyn_cast<ObjectExpr>(source)) {
        const Segment seg = segment_from_object(nested, depth + 1);
        std::string_view text = seg.text;
        if (text.size() >= 2 && text.front() == '{' && text.back() == '}') {
          text = text.substr(1, text.size() - 2);
          if (!text.empty()) entries.emplace_back(text);
        } else {
          entries.push_back("..." + seg.text);
        }
        is_static = is_static && seg.isStatic;
        continue;
      }

      const Segment seg = normalize_segment(segment_from_expression(source, depth + 1));
      entries.push_back("..." + seg.text);
      is_static = false;
      continue;
    }

    const auto * prop = dyn_cast<Property>(member);
    if (prop == nullptr || prop->propKind != PropertyKind::Init) {
      canonical_order = false;
      entries.emplace_back("[method]");
      is_static = false;
      continue;
    }

    const Segment key = object_key_segment(prop, depth + 1);
    const Segment value = prop->value
                            ? normalize_segment(segment_from_expression(prop->value, depth + 1))
                            : unresolved();
    // Computed keys keep source order
    if (prop->computed) canonical_order = false;

    std::string key_text = prop->computed ? fmt::format("[{}]", key.text) : key.text;
    entries.push_back(fmt::format("{}: {}", key_text, value.text));
    sortable.emplace_back(std::move(key_text), value);
    is_static = is_static && key.isStatic && value.isStatic;
  }

  if (entries.empty()) return Segment{"{}", true};
  if (!canonical_order) return Segment{fmt::format("{{{}}}", fmt::join(entries, ", ")), is_static};

  // Sorted by key, later duplicates win, statically-undefined values dropped
  std::map<std::string, Segment> canonical;
  for (auto & [key, value] : sortable) {
    if (value.isStatic && value.text == "undefined") {
      canonical.erase(key);
      continue;
    }
    canonical[key] = value;
  }

  std::vector<std::string> sorted;
  for (const auto & [key, value] : canonical) {
    sorted.push_back(fmt::format("{}: {}", key, value.text));
  }
  if (sorted.empty()) return Segment{"{}", is_static};
  return Segment{fmt::format("{{{}}}", fmt::join(sorted, ", ")), is_static};
}

std::vector<Segment> KeyNormalizer::segments_from_array_element(const Expr * element, int depth)
{
  if (element == nullptr) return {unresolved()};

  const auto * spread = dyn_cast<SpreadElement>(element);
  if (spread == nullptr) return {normalize_segment(segment_from_expression(element, depth + 1))};
  if (spread->argument == nullptr) return {unresolved()};

  const Expr * source = resolve_key_expression(spread->argument, depth + 1);
  if (source == nullptr) source = unwrap_expr(spread->argument);

  if (const auto * array = dyn_cast<ArrayExpr>(source)) {
    std::vector<Segment> expanded;
    for (const Expr * nested : array->elements) {
      auto part = segments_from_array_element(nested, depth + 1);
      expanded.insert(expanded.end(), part.begin(), part.end());
    }
    if (expanded.empty()) return {unresolved()};
    return expanded;
  }

  // Spread of something that is not a known array
  Segment seg = normalize_segment(segment_from_expression(source, depth + 1));
  seg.isStatic = false;
  return {seg};
}

// ============================================================================
// normalize
// ============================================================================

NormalizedKey KeyNormalizer::normalize(const Expr * node, const NormalizeOptions & options)
{
  if (node == nullptr) {
    if (options.wildcardIfMissing) {
      return make_all_cache_key(
        Resolution::Dynamic, k_all_query_cache_segment,
        options.defaultMode.value_or(MatchMode::All));
    }
    return make_unknown_key(options.defaultMode.value_or(MatchMode::Unknown));
  }

  const Expr * resolved = resolve_key_expression(node);
  if (resolved == nullptr) resolved = unwrap_expr(node);

  // `[{ queryKey: k }]` stands for `k`
  for (int unwrapped = 0; unwrapped < k_max_normalize_depth; ++unwrapped) {
    const auto * wrapper = dyn_cast<ArrayExpr>(resolved);
    const Expr * embedded = wrapper != nullptr ? embedded_query_key(wrapper) : nullptr;
    if (embedded == nullptr) break;
    resolved = resolve_key_expression(embedded);
    if (resolved == nullptr) resolved = unwrap_expr(embedded);
  }

  if (const auto * array = dyn_cast<ArrayExpr>(resolved)) {
    std::vector<Segment> segments;
    for (const Expr * element : array->elements) {
      auto part = segments_from_array_element(element, 0);
      segments.insert(segments.end(), part.begin(), part.end());
    }
    return make_array_key(segments, options.defaultMode.value_or(MatchMode::Prefix));
  }

  const Segment segment = normalize_segment(segment_from_expression(resolved));
  return make_scalar_key(segment, options.defaultMode.value_or(MatchMode::Exact));
}

}  // namespace qk_graph
