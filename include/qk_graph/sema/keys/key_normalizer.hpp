// qk_graph/sema/keys/key_normalizer.hpp - Expression to NormalizedKey folding
//
// The normalizer reduces arbitrary key expressions to canonical segments.
// It resolves identifiers, factory calls and spreads through a
// ReferenceResolver, specialises factory return expressions with the call
// site's arguments, and reads hook/mutation option objects.
//
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qk_graph/ast/ast_context.hpp"
#include "qk_graph/sema/keys/normalized_key.hpp"
#include "qk_graph/sema/resolution/reference_resolver.hpp"

namespace qk_graph
{

/// Recursion cap of one normalization
inline constexpr int k_max_normalize_depth = 25;

/// Recursion cap of the inline-declaration check
inline constexpr int k_max_direct_check_depth = 16;

struct NormalizeOptions
{
  std::optional<MatchMode> defaultMode;
  bool wildcardIfMissing = false;
};

/// Property name with its certainty
struct PropertyName
{
  std::string value;
  bool isStatic = true;
};

// ============================================================================
// Free helpers
// ============================================================================

/// `exact: true` style literal flag of an options object
[[nodiscard]] std::optional<bool> read_boolean_property(
  const ObjectExpr * object, std::string_view name);

/// `queryKey`, `querykeys`, `query_key`, ... (case-insensitive)
[[nodiscard]] bool is_query_key_like_name(std::string_view name);

/// Identifier or non-computed member named `queryKey`/`queryKeys`
[[nodiscard]] bool is_pass_through_query_key_reference(const Expr * expr);

/// Empty / unresolved keys of a mutation
[[nodiscard]] bool should_treat_as_wildcard_action_key(const NormalizedKey & key);

/// True if the hook's first argument spells the key out at the call site
[[nodiscard]] bool is_direct_hook_declaration(gsl::span<Expr *> args, std::string_view hook_name);

/// `useQueries` / `useSuspenseQueries`
[[nodiscard]] bool is_query_collection_hook(std::string_view hook_name);

// ============================================================================
// KeyNormalizer
// ============================================================================

/**
 * Folds expressions into NormalizedKeys.
 *
 * @code
 *   AstContext scratch;
 *   KeyNormalizer normalizer(&resolver, scratch);
 *   NormalizedKey key = normalizer.normalize(expr, {MatchMode::Prefix});
 * @endcode
 *
 * The resolver may be nullptr, in which case identifiers stay `$name`.
 * Expressions synthesised while applying call-site arguments are
 * allocated in `scratch`, which must outlive every key computation.
 */
class KeyNormalizer
{
public:
  KeyNormalizer(ReferenceResolver * resolver, AstContext & scratch)
  : resolver_(resolver), scratch_(scratch)
  {
  }

  // ===========================================================================
  // Key entry points
  // ===========================================================================

  /// Canonical key of an expression (nullptr: missing key)
  [[nodiscard]] NormalizedKey normalize(const Expr * node, const NormalizeOptions & options = {});

  /// Key declared by a single-query hook or client fetch method
  [[nodiscard]] NormalizedKey infer_hook_key(gsl::span<Expr *> args);

  /// Keys declared by a hook; `useQueries` yields one per distinct entry
  [[nodiscard]] std::vector<NormalizedKey> infer_hook_keys(
    std::string_view hook_name, gsl::span<Expr *> args);

  /// Key affected by a client mutation method
  [[nodiscard]] NormalizedKey infer_action_key(std::string_view method, gsl::span<Expr *> args);

  /// Mutation key with pass-through/wildcard handling
  [[nodiscard]] NormalizedKey normalize_action_key_or_wildcard(
    const Expr * node, const NormalizeOptions & options);

  // ===========================================================================
  // Building blocks
  // ===========================================================================

  /// Text and certainty of one expression
  [[nodiscard]] Segment segment_from_expression(const Expr * node, int depth = 0);

  /**
   * Follow references, identity wrappers and factory calls to the
   * expression that holds the key.
   *
   * @return The furthest expression reached; nullptr only past the depth cap
   */
  [[nodiscard]] const Expr * resolve_key_expression(const Expr * node, int depth = 0);

  /// Options object passed to a mutation, through references and factories
  [[nodiscard]] const ObjectExpr * resolve_action_options(const Expr * node, int depth = 0);

  /// Specialise a factory return expression with the call's first argument
  [[nodiscard]] const Expr * apply_call_argument_hints(
    const CallExpr * call, const Expr * resolved_call, int depth);

  /// Prefix key inferred from `predicate: q => q.queryKey[0] === 'x'`
  [[nodiscard]] std::optional<NormalizedKey> infer_key_from_predicate(const Expr * predicate);

  [[nodiscard]] ReferenceResolver * resolver() const noexcept { return resolver_; }
  [[nodiscard]] AstContext & scratch() noexcept { return scratch_; }

private:
  std::vector<Segment> segments_from_array_element(const Expr * element, int depth);
  Segment segment_from_object(const ObjectExpr * object, int depth);
  Segment segment_from_member(const MemberExpr * member, int depth);
  Segment segment_from_call(const CallExpr * call, int depth);
  Segment segment_from_template(const TemplateLiteral * tpl, int depth);
  Segment segment_from_function(const FunctionExpr * fn, int depth);
  Segment object_key_segment(const Property * prop, int depth);
  Segment call_arguments_segment(gsl::span<Expr *> args, int depth);
  Segment method_call_segment(const MemberExpr * callee, gsl::span<Expr *> args, int depth);

  std::optional<PropertyName> infer_property_name(const Expr * property, bool computed, int depth);
  std::optional<std::string> property_name_of(const Expr * property, bool computed, int depth);

  const Expr * resolve_with_resolver(const Expr * node, int depth);
  const Expr * resolve_object_property_expression(
    const ObjectExpr * object, std::string_view name, int depth);

  void collect_object_substitutions(
    const ObjectExpr * object, int depth, std::map<std::string, const Expr *> & out);
  const Expr * apply_object_argument_hints(const Expr * expr, const ObjectExpr * object, int depth);

  // useQueries collections
  std::vector<const Expr *> collect_from_option_entry(const Expr * expr, int depth);
  std::vector<const Expr *> collect_from_collection(const Expr * expr, int depth);
  std::vector<const Expr *> collect_from_collection_call(const CallExpr * call, int depth);
  const Expr * resolve_collection_mapper(const Expr * mapper, int depth);

  // predicates
  std::optional<size_t> query_key_index_of(const Expr * expr, int depth);
  void collect_predicate_constraints(
    const Expr * expr, int depth, std::map<size_t, Segment> & constraints);

  ReferenceResolver * resolver_;
  AstContext & scratch_;
};

}  // namespace qk_graph
