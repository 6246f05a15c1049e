// qk_graph/sema/analysis/call_site_classifier.cpp - Query call-site classification
//
#include "qk_graph/sema/analysis/call_site_classifier.hpp"

#include <unordered_set>

#include "qk_graph/ast/visitor.hpp"
#include "qk_graph/sema/analysis/client_context.hpp"
#include "qk_graph/sema/analysis/local_argument_resolver.hpp"
#include "qk_graph/sema/resolution/binding.hpp"

namespace qk_graph
{

namespace
{

/// Expression of a `queryKeysToInvalidate` entry and the node its location comes from
struct PropKeyCandidate
{
  const Expr * expression;
  const AstNode * locNode;
};

bool is_param_identifier(const Expr * expr)
{
  const auto * id = dyn_cast<Identifier>(expr);
  return id != nullptr && id->binding != nullptr && id->binding->is_param();
}

/// `undefined` / `null` entries in the prop list
bool is_ignorable_prop_key(const NormalizedKey & key)
{
  if (key.segments.size() != 1) return false;
  const std::string & segment = key.segments.front();
  return segment == "undefined" || segment == "$undefined" || segment == "null" ||
         segment == "$null";
}

/// Call belongs to an optional chain (`a?.b()`, `a?.b.c()`, `f?.()`)
bool is_optional_call(const CallExpr * call)
{
  if (call->optional) return true;
  const Expr * callee = unwrap_expr(call->callee);
  while (const auto * member = dyn_cast<MemberExpr>(callee)) {
    if (member->optional) return true;
    callee = unwrap_expr(member->object);
  }
  return false;
}

std::optional<std::string_view> member_method(const Expr * callee, const Expr ** object)
{
  const auto * member = unwrap_as<MemberExpr>(callee);
  if (member == nullptr) return std::nullopt;
  const auto * property = dyn_cast<Identifier>(member->property);
  if (property == nullptr) return std::nullopt;
  *object = member->object;
  return property->name;
}

// ============================================================================
// Call scanner
// ============================================================================

class CallScanner : public ConstRecursiveAstVisitor<CallScanner>
{
public:
  CallScanner(
    const ClientContext & context, KeyNormalizer & normalizer, std::string file,
    const SourceRegistry & sources, std::vector<CallSiteRecord> & records)
  : context_(context),
    normalizer_(normalizer),
    locals_(normalizer),
    file_(std::move(file)),
    sources_(sources),
    records_(records)
  {
  }

  bool visit_call_expr(const CallExpr * node)
  {
    if (is_optional_call(node)) {
      handle_member_client_call(node);
    } else if (!handle_hook_call(node) && !handle_refetch_function_call(node)) {
      handle_member_client_call(node);
    }
    return ConstRecursiveAstVisitor::visit_call_expr(node);
  }

  bool visit_jsx_element(const JsxElement * node)
  {
    for (const AstNode * attribute : node->attributes) {
      const auto * attr = dyn_cast<JsxAttribute>(attribute);
      if (attr == nullptr || attr->name != k_invalidate_prop_name) continue;
      handle_invalidate_prop(attr);
      break;
    }
    return ConstRecursiveAstVisitor::visit_jsx_element(node);
  }

private:
  void add_record(
    Relation relation, std::string_view operation, const AstNode * at, NormalizedKey key,
    Resolution resolution, bool declares_directly = false)
  {
    CallSiteRecord record;
    record.relation = relation;
    record.operation = std::string(operation);
    record.file = file_;
    const LineColumn lc = sources_.get_line_column(get_range(at).get_begin());
    if (lc.is_valid()) {
      record.line = lc.line;
      record.column = lc.column;
    }
    record.queryKey = std::move(key);
    record.resolution = resolution;
    record.declaresDirectly = declares_directly;
    records_.push_back(std::move(record));
  }

  bool handle_hook_call(const CallExpr * node)
  {
    const auto hook = hook_call_info(node->callee, context_);
    if (!hook) return false;

    const gsl::span<Expr *> hook_args = locals_.resolve_arguments(node->arguments);
    std::vector<NormalizedKey> keys = normalizer_.infer_hook_keys(hook->hook, hook_args);

    auto by_iterator = locals_.expand_hook_keys_by_iterator(hook->hook, hook_args);
    if (!by_iterator.empty()) {
      keys = std::move(by_iterator);
    } else {
      auto by_collection = locals_.expand_hook_keys_by_collection(hook->hook, hook_args);
      if (!by_collection.empty()) keys = std::move(by_collection);
    }

    const bool declares_directly = is_direct_hook_declaration(node->arguments, hook->hook);
    for (NormalizedKey & key : keys) {
      const Resolution resolution = merge(key.resolution, hook->resolution);
      add_record(
        Relation::Declares, hook->operation, node, std::move(key), resolution, declares_directly);
    }
    return true;
  }

  bool handle_refetch_function_call(const CallExpr * node)
  {
    const auto * callee = dyn_cast<Identifier>(node->callee);
    if (callee == nullptr) return false;
    auto it = context_.refetchFunctions.find(callee->name);
    if (it == context_.refetchFunctions.end()) return false;

    add_record(Relation::Refetches, "refetch", node, it->second, Resolution::Dynamic);
    return true;
  }

  bool handle_member_client_call(const CallExpr * node)
  {
    const Expr * object = nullptr;
    const auto method = member_method(node->callee, &object);
    if (!method) return false;

    if (*method == "refetch") {
      if (const auto leaf = leaf_identifier_name(object)) {
        auto it = context_.refetchObjects.find(*leaf);
        if (it != context_.refetchObjects.end()) {
          add_record(Relation::Refetches, "refetch", node, it->second, Resolution::Dynamic);
          return true;
        }
      }
    }

    if (is_client_declare_method(*method)) {
      const auto certainty = client_object_certainty(object, context_);
      if (!certainty) return false;

      const gsl::span<Expr *> args = locals_.resolve_arguments(node->arguments);
      NormalizedKey key = normalizer_.infer_action_key(*method, args);
      const bool declares_directly = is_direct_hook_declaration(node->arguments, *method);
      const Resolution resolution = merge(*certainty, key.resolution);
      add_record(Relation::Declares, *method, node, std::move(key), resolution, declares_directly);
      return true;
    }

    const auto relation = relation_for_client_method(*method);
    if (!relation) return false;
    const auto certainty = client_object_certainty(object, context_);
    if (!certainty) return false;

    const gsl::span<Expr *> args = locals_.resolve_arguments(node->arguments);
    std::vector<NormalizedKey> keys = locals_.expand_action_keys(*method, args);
    if (keys.empty()) keys.push_back(normalizer_.infer_action_key(*method, args));

    for (NormalizedKey & key : keys) {
      if (should_skip_pass_through(node, key)) continue;
      const Resolution resolution = merge(*certainty, key.resolution);
      add_record(*relation, *method, node, std::move(key), resolution);
    }
    return true;
  }

  /**
   * Unresolved mutations that forward a `queryKey` read from a local
   * object are dropped; forwarding a parameter is kept.
   */
  static bool should_skip_pass_through(const CallExpr * node, const NormalizedKey & key)
  {
    const bool unknown = is_unresolved_key(key) || key.is_wildcard() ||
                         key.id == k_all_query_cache_id;
    if (!unknown || node->arguments.empty()) return false;

    const Expr * first = node->arguments[0];
    if (first == nullptr || isa<SpreadElement>(first)) return false;
    const auto * options = unwrap_as<ObjectExpr>(first);
    const Expr * value = unwrap_expr(object_property_value(options, "queryKey"));
    if (value == nullptr) return false;

    if (isa<Identifier>(value)) return !is_param_identifier(value);

    const auto * member = dyn_cast<MemberExpr>(value);
    if (member != nullptr && !member->computed && isa<Identifier>(member->property)) {
      return !is_param_identifier(member->object);
    }
    return false;
  }

  // ==========================================================================
  // queryKeysToInvalidate
  // ==========================================================================

  void handle_invalidate_prop(const JsxAttribute * attr)
  {
    // `prop="text"` carries no key expression
    if (attr->value == nullptr || isa<StringLiteral>(attr->value)) return;

    std::unordered_set<std::string> emitted;
    for (const PropKeyCandidate & candidate : collect_prop_keys(attr->value, 0)) {
      NormalizedKey key = normalizer_.normalize(candidate.expression, {MatchMode::Prefix});
      if (key.is_wildcard() || is_unresolved_key(key) || is_ignorable_prop_key(key)) continue;

      const LineColumn lc = sources_.get_line_column(get_range(candidate.locNode).get_begin());
      const std::string dedupe = key.id + ":" + key.display + ":" + std::to_string(lc.line) +
                                 ":" + std::to_string(lc.column);
      if (!emitted.insert(dedupe).second) continue;

      add_record(
        Relation::Invalidates, "invalidateQueries", candidate.locNode, std::move(key),
        Resolution::Dynamic);
    }
  }

  const Expr * resolve_prop_expression(const Expr * expr, int depth)
  {
    const Expr * u = unwrap_expr(expr);
    ReferenceResolver * resolver = normalizer_.resolver();
    if (depth >= k_max_jsx_prop_depth || resolver == nullptr) return u;

    if (isa<Identifier, MemberExpr>(u)) {
      const Expr * resolved = resolver->resolve_reference(u);
      return resolved != nullptr ? resolve_prop_expression(resolved, depth + 1) : u;
    }

    if (const auto * call = dyn_cast<CallExpr>(u)) {
      if (const Expr * callee = resolver->resolve_reference(call->callee)) {
        return resolve_prop_expression(callee, depth + 1);
      }
      if (const Expr * result = resolver->resolve_call_result(call->callee)) {
        return resolve_prop_expression(result, depth + 1);
      }
    }
    return u;
  }

  bool looks_like_array_key(const Expr * expr, int depth)
  {
    if (depth >= k_max_jsx_prop_depth) return false;
    if (isa<ArrayExpr>(resolve_prop_expression(expr, depth + 1))) return true;

    const NormalizedKey key = normalizer_.normalize(expr, {MatchMode::Prefix});
    if (is_unresolved_key(key) || key.is_wildcard()) return false;
    return key.display.size() >= 2 && key.display.front() == '[' && key.display.back() == ']';
  }

  /// An array of keys rather than a single key
  bool is_likely_key_collection(const ArrayExpr * array, int depth)
  {
    if (depth >= k_max_jsx_prop_depth) return false;

    size_t comparable = 0;
    for (const Expr * element : array->elements) {
      if (element == nullptr || isa<SpreadElement>(element)) continue;
      ++comparable;
      if (looks_like_array_key(element, depth + 1)) return true;
    }
    return comparable == 0;
  }

  const ArrayExpr * as_key_collection(const Expr * expr, int depth)
  {
    const auto * array = dyn_cast<ArrayExpr>(resolve_prop_expression(expr, depth));
    return array != nullptr && is_likely_key_collection(array, depth) ? array : nullptr;
  }

  std::vector<PropKeyCandidate> collect_prop_keys(const Expr * expr, int depth)
  {
    if (depth >= k_max_jsx_prop_depth) return {{expr, expr}};

    std::vector<PropKeyCandidate> out;
    auto append = [&out](std::vector<PropKeyCandidate> more) {
      out.insert(out.end(), more.begin(), more.end());
    };

    if (const auto * cond = dyn_cast<ConditionalExpr>(expr)) {
      append(collect_prop_keys(cond->consequent, depth + 1));
      append(collect_prop_keys(cond->alternate, depth + 1));
      return out;
    }
    if (const auto * logical = dyn_cast<LogicalExpr>(expr)) {
      if (logical->op == "&&") return collect_prop_keys(logical->right, depth + 1);
      append(collect_prop_keys(logical->left, depth + 1));
      append(collect_prop_keys(logical->right, depth + 1));
      return out;
    }

    const ArrayExpr * collection = as_key_collection(expr, depth + 1);
    if (collection == nullptr) return {{expr, expr}};

    // Elements reached through a reference are reported at the prop value
    const bool use_original_loc = collection != expr;

    for (const Expr * element : collection->elements) {
      if (element == nullptr) continue;
      const Expr * item = element;
      if (const auto * spread = dyn_cast<SpreadElement>(element)) item = spread->argument;
      if (item == nullptr) continue;

      const AstNode * loc = use_original_loc ? static_cast<const AstNode *>(expr) : item;
      if (const ArrayExpr * nested = as_key_collection(item, depth + 1)) {
        for (const PropKeyCandidate & candidate : collect_prop_keys(nested, depth + 1)) {
          out.push_back({candidate.expression, loc});
        }
        continue;
      }
      out.push_back({item, loc});
    }
    return out;
  }

  const ClientContext & context_;
  KeyNormalizer & normalizer_;
  LocalArgumentResolver locals_;
  std::string file_;
  const SourceRegistry & sources_;
  std::vector<CallSiteRecord> & records_;
};

}  // namespace

std::vector<CallSiteRecord> CallSiteClassifier::classify(const Program & program, FileId file)
{
  ClientContext context;
  scan_client_imports(program, context);
  scan_client_bindings(program, context, normalizer_);

  std::vector<CallSiteRecord> records;
  CallScanner scanner(
    context, normalizer_, sources_.get_path(file).generic_string(), sources_, records);
  scanner.visit(&program);
  return records;
}

}  // namespace qk_graph
