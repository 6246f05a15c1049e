// qk_graph/sema/analysis/local_argument_resolver.hpp - Call-site argument resolution
//
// Hook and client-method arguments are often built from locals of the
// enclosing component: constants, small helper functions, typed
// parameters and `.map` callback parameters. This resolver follows those
// through the local Binding of each identifier before the cross-file
// ReferenceResolver is consulted, and expands keys that depend on an
// iterator parameter over a statically known collection.
//
#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/sema/keys/key_normalizer.hpp"

namespace qk_graph
{

/// Recursion cap of local argument resolution
inline constexpr int k_max_local_resolve_depth = 12;

/**
 * Value of `name` in an object literal.
 *
 * The last matching property wins; spreads of object literals are searched
 * in place.
 */
[[nodiscard]] const Expr * literal_property_value(const ObjectExpr * object, std::string_view name);

/// Name of a non-computed identifier/string/number key of a destructuring property
[[nodiscard]] std::optional<std::string> pattern_property_key(const PatternProperty * prop);

/// Lower-cased name contains `querykey` or `rqkey`
[[nodiscard]] bool is_likely_key_factory_name(std::string_view name);

/**
 * Resolves call-site arguments through local bindings.
 *
 * All results are borrowed from the AST or allocated in the normalizer's
 * scratch context.
 */
class LocalArgumentResolver
{
public:
  explicit LocalArgumentResolver(KeyNormalizer & normalizer) : normalizer_(normalizer) {}

  /// Expression an argument stands for, or nullptr
  [[nodiscard]] const Expr * resolve(const Expr * expr, int depth = 0);

  /**
   * Arguments with the first one resolved locally.
   *
   * An options object keeps its shape; only its `queryKey` value is
   * replaced.
   */
  [[nodiscard]] gsl::span<Expr *> resolve_arguments(gsl::span<Expr *> args);

  /// Elements of a collection whose contents are known statically
  [[nodiscard]] std::optional<std::vector<const Expr *>> static_iterable_values(
    const Expr * expr, int depth = 0);

  /// Per-element keys of a mutation inside `items.forEach(item => ...)`
  [[nodiscard]] std::vector<NormalizedKey> expand_action_keys(
    std::string_view method, gsl::span<Expr *> args);

  /// Per-element keys of `useQueries({ queries: items.map(item => ...) })`
  [[nodiscard]] std::vector<NormalizedKey> expand_hook_keys_by_iterator(
    std::string_view hook_name, gsl::span<Expr *> args);

  /// Keys of a `useQueries` collection resolved through locals
  [[nodiscard]] std::vector<NormalizedKey> expand_hook_keys_by_collection(
    std::string_view hook_name, gsl::span<Expr *> args);

private:
  using SeenNames = std::set<std::string_view>;

  struct IteratorTemplate
  {
    const Expr * iterable;
    std::string_view param;
    const Expr * keyTemplate;
  };

  const Expr * resolve(const Expr * expr, int depth, SeenNames & seen);
  const Expr * resolve_member(const MemberExpr * member, int depth, SeenNames & seen);
  const Expr * resolve_call(const CallExpr * call, int depth, SeenNames & seen);
  const Expr * resolve_identifier(const Identifier * id, int depth, SeenNames & seen);

  /// Return expression of `fn` with its identifier parameters replaced by `call`'s arguments
  const Expr * inline_call(const CallExpr * call, const FunctionExpr * fn);
  /// Local result, or the expression itself when nothing resolves
  const Expr * chain(const Expr * expr, int depth, SeenNames & seen);

  const Expr * param_type_hint(const Binding * binding, FileId file);
  const Expr * factory_hint_for_member(std::string_view property, FileId file);

  std::optional<std::vector<const Expr *>> iterator_param_values(const Binding * binding);

  // useQueries templates
  const Expr * resolve_collection_expression(const Expr * expr, int depth);
  std::vector<const Expr *> option_entry_templates(const Expr * expr, int depth);
  std::vector<const Expr *> collection_templates(const Expr * expr, int depth);
  const Expr * mapper_return(const Expr * mapper, int depth);
  std::vector<IteratorTemplate> iterator_templates(const Expr * expr, int depth);

  KeyNormalizer & normalizer_;
};

}  // namespace qk_graph
