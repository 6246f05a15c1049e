// qk_graph/sema/keys/key_inference.cpp - Hook, mutation and predicate key inference
//
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_set>

#include "qk_graph/sema/keys/key_normalizer.hpp"

namespace qk_graph
{

namespace
{

constexpr std::string_view k_collection_passthrough_methods[] = {
  "filter", "slice", "sort", "reverse", "toSorted", "flat"};

bool is_collection_passthrough(std::string_view name)
{
  return std::find(
           std::begin(k_collection_passthrough_methods),
           std::end(k_collection_passthrough_methods), name) !=
         std::end(k_collection_passthrough_methods);
}

std::string to_lower(std::string_view text)
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

/// `parseInt(text, 10)` for a non-negative integer prefix
std::optional<double> parse_int_prefix(std::string_view text)
{
  size_t i = 0;
  while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }
  const size_t digits_begin = i;
  double value = 0;
  while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
    value = value * 10 + (text[i] - '0');
    ++i;
  }
  if (i == digits_begin) return std::nullopt;
  return negative ? -value : value;
}

bool is_inline_query_key_collection(const Expr * expr, int depth);

bool is_inline_query_key_object(const Expr * expr, int depth)
{
  if (depth >= k_max_direct_check_depth) return false;

  const auto * object = unwrap_as<ObjectExpr>(expr);
  if (object == nullptr) return false;
  if (object_property_value(object, "queryKey") != nullptr) return true;

  const Expr * queries = object_property_value(object, "queries");
  return queries != nullptr && is_inline_query_key_collection(queries, depth + 1);
}

bool is_inline_query_key_collection(const Expr * expr, int depth)
{
  if (depth >= k_max_direct_check_depth || expr == nullptr) return false;

  const Expr * u = unwrap_expr(expr);
  if (const auto * cond = dyn_cast<ConditionalExpr>(u)) {
    return is_inline_query_key_collection(cond->consequent, depth + 1) ||
           is_inline_query_key_collection(cond->alternate, depth + 1);
  }
  if (const auto * logical = dyn_cast<LogicalExpr>(u)) {
    return is_inline_query_key_collection(logical->left, depth + 1) ||
           is_inline_query_key_collection(logical->right, depth + 1);
  }

  const auto * array = dyn_cast<ArrayExpr>(u);
  if (array == nullptr) return is_inline_query_key_object(u, depth + 1);

  return std::any_of(array->elements.begin(), array->elements.end(), [depth](const Expr * element) {
    return element != nullptr && !isa<SpreadElement>(element) &&
           is_inline_query_key_object(element, depth + 1);
  });
}

}  // namespace

bool is_query_collection_hook(std::string_view hook_name)
{
  const std::string lower = to_lower(hook_name);
  return lower == "usequeries" || lower == "usesuspensequeries";
}

bool is_direct_hook_declaration(gsl::span<Expr *> args, std::string_view hook_name)
{
  const Expr * first = first_argument(args);
  if (first == nullptr) return false;

  const Expr * u = unwrap_expr(first);
  if (const auto * object = dyn_cast<ObjectExpr>(u)) {
    if (object_property_value(object, "queryKey") != nullptr) return true;
    const Expr * queries = object_property_value(object, "queries");
    return queries != nullptr && is_inline_query_key_collection(queries, 0);
  }

  if (isa<ArrayExpr>(u)) {
    if (to_lower(hook_name) == "usequeries") return is_inline_query_key_collection(u, 0);
    return true;
  }

  return isa<StringLiteral, TemplateLiteral>(u);
}

// ============================================================================
// Hooks
// ============================================================================

NormalizedKey KeyNormalizer::infer_hook_key(gsl::span<Expr *> args)
{
  const Expr * first = first_argument(args);
  if (first == nullptr) return normalize(nullptr, {MatchMode::Unknown});

  const Expr * resolved = resolve_key_expression(first);
  if (resolved == nullptr) resolved = unwrap_expr(first);

  if (const auto * object = dyn_cast<ObjectExpr>(resolved)) {
    return normalize(object_property_value(object, "queryKey"), {MatchMode::Exact});
  }
  return normalize(resolved, {MatchMode::Exact});
}

std::vector<const Expr *> KeyNormalizer::collect_from_option_entry(const Expr * expr, int depth)
{
  if (depth >= k_max_resolve_depth || expr == nullptr) return {};

  const Expr * resolved = resolve_key_expression(expr, depth + 1);
  if (resolved == nullptr) resolved = unwrap_expr(expr);

  std::vector<const Expr *> out;
  auto append = [&out](std::vector<const Expr *> more) {
    out.insert(out.end(), more.begin(), more.end());
  };

  if (const auto * cond = dyn_cast<ConditionalExpr>(resolved)) {
    append(collect_from_option_entry(cond->consequent, depth + 1));
    append(collect_from_option_entry(cond->alternate, depth + 1));
    return out;
  }

  if (const auto * logical = dyn_cast<LogicalExpr>(resolved)) {
    // `enabled && {...}` contributes only its right side
    if (logical->op == "&&") return collect_from_option_entry(logical->right, depth + 1);
    append(collect_from_option_entry(logical->left, depth + 1));
    append(collect_from_option_entry(logical->right, depth + 1));
    return out;
  }

  if (const auto * object = dyn_cast<ObjectExpr>(resolved)) {
    if (const Expr * key = object_property_value(object, "queryKey")) return {key};
    if (const Expr * queries = object_property_value(object, "queries")) {
      return collect_from_collection(queries, depth + 1);
    }
    return {};
  }

  // queryOptions(...) resolved straight to its key array
  if (isa<ArrayExpr>(resolved)) return {resolved};

  if (const auto * call = dyn_cast<CallExpr>(resolved)) {
    return collect_from_collection_call(call, depth + 1);
  }
  return {};
}

std::vector<const Expr *> KeyNormalizer::collect_from_collection(const Expr * expr, int depth)
{
  if (depth >= k_max_resolve_depth || expr == nullptr) return {};

  const Expr * resolved = resolve_key_expression(expr, depth + 1);
  if (resolved == nullptr) resolved = unwrap_expr(expr);

  std::vector<const Expr *> out;
  auto append = [&out](std::vector<const Expr *> more) {
    out.insert(out.end(), more.begin(), more.end());
  };

  if (const auto * cond = dyn_cast<ConditionalExpr>(resolved)) {
    append(collect_from_collection(cond->consequent, depth + 1));
    append(collect_from_collection(cond->alternate, depth + 1));
    return out;
  }

  if (const auto * logical = dyn_cast<LogicalExpr>(resolved)) {
    if (logical->op == "&&") return collect_from_collection(logical->right, depth + 1);
    append(collect_from_collection(logical->left, depth + 1));
    append(collect_from_collection(logical->right, depth + 1));
    return out;
  }

  if (const auto * call = dyn_cast<CallExpr>(resolved)) {
    return collect_from_collection_call(call, depth + 1);
  }

  const auto * array = dyn_cast<ArrayExpr>(resolved);
  if (array == nullptr) return collect_from_option_entry(resolved, depth + 1);

  for (const Expr * element : array->elements) {
    if (element == nullptr) continue;
    if (const auto * spread = dyn_cast<SpreadElement>(element)) {
      if (spread->argument != nullptr) append(collect_from_collection(spread->argument, depth + 1));
      continue;
    }
    append(collect_from_option_entry(element, depth + 1));
  }
  return out;
}

const Expr * KeyNormalizer::resolve_collection_mapper(const Expr * mapper, int depth)
{
  if (depth >= k_max_resolve_depth || mapper == nullptr) return nullptr;

  if (const auto * fn = dyn_cast<FunctionExpr>(mapper)) {
    return extract_function_return_expression(fn);
  }
  if (!isa<Identifier, MemberExpr>(mapper) || resolver_ == nullptr) return nullptr;

  const Expr * resolved = resolver_->resolve_reference(mapper);
  if (const auto * fn = dyn_cast<FunctionExpr>(resolved)) {
    return extract_function_return_expression(fn);
  }
  return resolved;
}

std::vector<const Expr *> KeyNormalizer::collect_from_collection_call(
  const CallExpr * call, int depth)
{
  if (depth >= k_max_resolve_depth) return {};

  const auto * callee = unwrap_as<MemberExpr>(call->callee);
  if (callee == nullptr || callee->computed) return {};
  const auto * property = dyn_cast<Identifier>(callee->property);
  if (property == nullptr) return {};

  const std::string_view method = property->name;
  std::vector<const Expr *> source = collect_from_collection(callee->object, depth + 1);

  if (method == "map" || method == "flatMap") {
    const Expr * mapper = first_expression_argument(call);
    const Expr * result = resolve_collection_mapper(mapper, depth + 1);
    if (result == nullptr) return source;
    return method == "map" ? collect_from_option_entry(result, depth + 1)
                           : collect_from_collection(result, depth + 1);
  }

  if (is_collection_passthrough(method)) return source;

  if (method == "concat") {
    for (const Expr * arg : call->arguments) {
      if (arg == nullptr || isa<SpreadElement>(arg)) continue;
      auto more = collect_from_collection(arg, depth + 1);
      source.insert(source.end(), more.begin(), more.end());
    }
    return source;
  }
  return {};
}

std::vector<NormalizedKey> KeyNormalizer::infer_hook_keys(
  std::string_view hook_name, gsl::span<Expr *> args)
{
  if (!is_query_collection_hook(hook_name)) return {infer_hook_key(args)};

  const Expr * first = first_argument(args);
  if (first == nullptr) return {normalize(nullptr, {MatchMode::Unknown})};

  const Expr * resolved = resolve_key_expression(first);
  if (resolved == nullptr) resolved = unwrap_expr(first);

  std::vector<const Expr *> key_expressions;
  if (const auto * object = dyn_cast<ObjectExpr>(resolved)) {
    if (const Expr * queries = object_property_value(object, "queries")) {
      key_expressions = collect_from_collection(queries, 0);
    }
  } else if (isa<ArrayExpr>(resolved)) {
    key_expressions = collect_from_collection(resolved, 0);
  }

  std::vector<NormalizedKey> keys;
  std::unordered_set<std::string> seen;
  for (const Expr * expr : key_expressions) {
    NormalizedKey key = normalize(expr, {MatchMode::Exact});
    if (seen.insert(dedupe_key(key)).second) keys.push_back(std::move(key));
  }

  if (keys.empty()) return {infer_hook_key(args)};
  return keys;
}

// ============================================================================
// Predicates
// ============================================================================

std::optional<size_t> KeyNormalizer::query_key_index_of(const Expr * expr, int depth)
{
  if (depth >= k_max_resolve_depth) return std::nullopt;

  const auto * access = unwrap_as<MemberExpr>(expr);
  if (access == nullptr || !access->computed) return std::nullopt;

  const auto * holder = unwrap_as<MemberExpr>(access->object);
  if (holder == nullptr || holder->computed) return std::nullopt;

  const auto property = infer_property_name(holder->property, false, depth + 1);
  if (!property || property->value != "queryKey") return std::nullopt;

  auto index_of_literal = [](const Expr * e) -> std::optional<double> {
    if (const auto * num = dyn_cast<NumberLiteral>(e)) return num->value;
    if (const auto * str = dyn_cast<StringLiteral>(e)) return parse_int_prefix(str->value);
    return std::nullopt;
  };

  const Expr * index_expr = access->property;
  std::optional<double> raw = index_of_literal(index_expr);
  if (!raw && index_expr != nullptr && !isa<NumberLiteral, StringLiteral>(index_expr)) {
    const Expr * resolved = resolve_key_expression(index_expr, depth + 1);
    if (resolved == nullptr) resolved = unwrap_expr(index_expr);
    raw = index_of_literal(resolved);
    if (!raw && !isa<NumberLiteral, StringLiteral>(resolved)) {
      raw = parse_int_prefix(normalize_segment(segment_from_expression(resolved, depth + 1)).text);
    }
  }

  if (!raw || !std::isfinite(*raw) || *raw < 0 || std::floor(*raw) != *raw) return std::nullopt;
  return static_cast<size_t>(*raw);
}

void KeyNormalizer::collect_predicate_constraints(
  const Expr * expr, int depth, std::map<size_t, Segment> & constraints)
{
  if (depth >= k_max_resolve_depth || expr == nullptr) return;

  const Expr * u = unwrap_expr(expr);
  if (const auto * unary = dyn_cast<UnaryExpr>(u)) {
    collect_predicate_constraints(unary->argument, depth + 1, constraints);
    return;
  }
  if (const auto * logical = dyn_cast<LogicalExpr>(u)) {
    if (logical->op == "&&") {
      collect_predicate_constraints(logical->left, depth + 1, constraints);
      collect_predicate_constraints(logical->right, depth + 1, constraints);
    }
    return;
  }

  const auto * binary = dyn_cast<BinaryExpr>(u);
  if (binary == nullptr || (binary->op != "===" && binary->op != "==")) return;

  const auto left_index = query_key_index_of(binary->left, depth + 1);
  const auto right_index = query_key_index_of(binary->right, depth + 1);
  if (left_index.has_value() == right_index.has_value()) return;

  const size_t index = left_index ? *left_index : *right_index;
  const Expr * value = left_index ? binary->right : binary->left;
  const Expr * resolved = resolve_key_expression(value, depth + 1);
  if (resolved == nullptr) resolved = unwrap_expr(value);

  const Segment segment = normalize_segment(segment_from_expression(resolved, depth + 1));
  if (segment.text == k_unresolved_segment) return;

  auto it = constraints.find(index);
  if (it == constraints.end()) {
    constraints.emplace(index, segment);
  } else if (it->second.text == segment.text) {
    it->second.isStatic = it->second.isStatic && segment.isStatic;
  }
}

std::optional<NormalizedKey> KeyNormalizer::infer_key_from_predicate(const Expr * predicate)
{
  const Expr * resolved = resolve_key_expression(predicate);
  if (resolved == nullptr) resolved = unwrap_expr(predicate);

  const Expr * condition = resolved;
  if (const auto * fn = dyn_cast<FunctionExpr>(resolved)) {
    condition = extract_function_return_expression(fn);
  }
  if (condition == nullptr) return std::nullopt;

  std::map<size_t, Segment> constraints;
  collect_predicate_constraints(condition, 0, constraints);

  // Only a run starting at index 0 pins down a prefix
  std::vector<Segment> segments;
  for (size_t i = 0;; ++i) {
    auto it = constraints.find(i);
    if (it == constraints.end()) break;
    segments.push_back(normalize_segment(it->second));
  }
  if (segments.empty()) return std::nullopt;

  return make_array_key(segments, MatchMode::Prefix);
}

// ============================================================================
// Mutations
// ============================================================================

NormalizedKey KeyNormalizer::normalize_action_key_or_wildcard(
  const Expr * node, const NormalizeOptions & options)
{
  NormalizedKey normalized = normalize(node, options);
  const MatchMode mode = options.defaultMode.value_or(normalized.matchMode);

  const bool pass_through = is_pass_through_query_key_reference(node);
  const bool unresolved_reference = pass_through && normalized.source == KeySource::Expression &&
                                    normalized.segments.size() == 1 &&
                                    (normalized.display.empty() || normalized.display[0] != '[');
  if (unresolved_reference) return make_pass_through_key(mode);

  if (should_treat_as_wildcard_action_key(normalized)) {
    if (pass_through) return make_pass_through_key(mode);
    return make_all_cache_key(Resolution::Dynamic, "ALL_QUERY_CACHE (unresolved key)");
  }
  return normalized;
}

NormalizedKey KeyNormalizer::infer_action_key(std::string_view method, gsl::span<Expr *> args)
{
  if (method == "clear") {
    return make_all_cache_key(Resolution::Static, "ALL_QUERY_CACHE (clear all)");
  }

  if (args.empty()) return normalize(nullptr, {MatchMode::All, true});

  const Expr * first = first_argument(args);
  if (first == nullptr) return normalize(nullptr, {MatchMode::Unknown});

  if (method == "setQueryData") {
    const Expr * resolved = resolve_key_expression(first);
    if (resolved == nullptr) resolved = unwrap_expr(first);

    NormalizedKey normalized = normalize(resolved, {MatchMode::Exact});
    const bool unresolved_reference =
      is_pass_through_query_key_reference(first) && normalized.source == KeySource::Expression &&
      normalized.segments.size() == 1 &&
      (normalized.display.empty() || normalized.display[0] != '[');
    if (should_treat_as_wildcard_action_key(normalized) || unresolved_reference) {
      return make_pass_through_key(MatchMode::Exact);
    }
    return normalized;
  }

  const ObjectExpr * options = resolve_action_options(first);
  if (options == nullptr) {
    const Expr * resolved = resolve_key_expression(first);
    if (resolved == nullptr) resolved = unwrap_expr(first);
    options = dyn_cast<ObjectExpr>(resolved);
    if (options == nullptr) return normalize_action_key_or_wildcard(resolved, {MatchMode::Prefix});
  }

  const bool exact = read_boolean_property(options, "exact").value_or(false);
  const MatchMode mode = exact ? MatchMode::Exact : MatchMode::Prefix;

  if (const Expr * key = object_property_value(options, "queryKey")) {
    return normalize_action_key_or_wildcard(key, {mode});
  }

  const Expr * predicate = object_property_value(options, "predicate");
  if (predicate != nullptr) {
    if (auto inferred = infer_key_from_predicate(predicate)) {
      if (exact) inferred->matchMode = MatchMode::Exact;
      return *inferred;
    }
  }

  return normalize(nullptr, {predicate ? MatchMode::Predicate : MatchMode::All, true});
}

}  // namespace qk_graph
