// qk_graph/sema/resolution/reference_resolver.hpp - Cross-file reference resolution
//
// Follows identifiers, member chains and call results through the
// SymbolIndex until a concrete expression is found. Every recursive path
// carries a depth counter and a per-query seen set, so cyclic aliasing ends
// in "unresolved" (nullptr) instead of looping.
//
#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>

#include "qk_graph/sema/resolution/module_resolver.hpp"
#include "qk_graph/sema/resolution/symbol_table.hpp"

namespace qk_graph
{

/// Recursion cap of one resolution query
inline constexpr int k_max_resolve_depth = 24;

// ============================================================================
// Expression helpers
// ============================================================================

/// `queryOptions(...)`, `x.infiniteQueryOptions(...)`, `Object.freeze(...)`
[[nodiscard]] bool is_identity_wrapper_call(const Expr * callee);

/// Name of a non-computed identifier/string/number property key
[[nodiscard]] std::optional<std::string> static_property_key(const Property * prop);

/// Value of the first `name: value` property of an object literal (casts stripped)
[[nodiscard]] const Expr * object_property_value(const ObjectExpr * object, std::string_view name);

/// `fn({ queryKey: X })` -> X
[[nodiscard]] const Expr * query_key_property_from_call(const CallExpr * call);

/// First argument (casts stripped), or nullptr when absent or a spread
[[nodiscard]] const Expr * first_expression_argument(const CallExpr * call);

/// JavaScript `String(number)`
[[nodiscard]] std::string js_number_to_string(double value);

// ============================================================================
// ReferenceResolver
// ============================================================================

/**
 * Resolves references against a read-only SymbolIndex.
 *
 * The file an expression belongs to is taken from its source range, so an
 * expression returned from one query can be fed back into the next one and
 * resolution continues in the file that expression came from.
 *
 * All failures (missing bindings, unresolvable modules, ambiguity, depth)
 * return nullptr.
 */
class ReferenceResolver
{
public:
  ReferenceResolver(const SymbolIndex & index, ModuleResolver & modules)
  : index_(index), modules_(modules)
  {
  }

  /// Resolve an identifier or member chain to the expression it names
  [[nodiscard]] const Expr * resolve_reference(const Expr * expr);

  /// Resolve a callee to the expression its call returns
  [[nodiscard]] const Expr * resolve_call_result(const Expr * callee);

  /// Resolve a call of `name()` as if written at top level of `file`
  [[nodiscard]] const Expr * resolve_call_result_by_name(FileId file, std::string_view name);

  [[nodiscard]] const SymbolIndex & index() const noexcept { return index_; }

private:
  enum class SeenKind : uint8_t { ExportValue, ExportFunction, LocalValue, LocalFunction };
  using SeenKey = std::tuple<SeenKind, const FileSymbolTable *, std::string>;
  using SeenSet = std::set<SeenKey>;

  const Expr * resolve_reference(
    const FileSymbolTable & file, const Expr * expr, int depth, SeenSet & seen);
  const Expr * resolve_call_result(
    const FileSymbolTable & file, const Expr * callee, int depth, SeenSet & seen);

  const Expr * resolve_local_value(
    const FileSymbolTable & file, std::string_view name, int depth, SeenSet & seen);
  const Expr * resolve_local_function_return(
    const FileSymbolTable & file, std::string_view name, int depth, SeenSet & seen);

  const Expr * resolve_export(
    const FileSymbolTable & file, std::string_view export_name, bool function_return, int depth,
    SeenSet & seen);
  const Expr * resolve_import(
    const FileSymbolTable & file, const ImportBinding & binding, bool function_return, int depth,
    SeenSet & seen);
  const Expr * resolve_namespace_member(
    const FileSymbolTable & file, std::string_view ns, std::string_view member, int depth,
    SeenSet & seen);

  const Expr * resolve_object_property(
    const FileSymbolTable & file, const ObjectExpr * object, std::string_view name, int depth,
    SeenSet & seen);
  const Expr * resolve_wrapped_property(
    const FileSymbolTable & file, const CallExpr * call, std::string_view name, int depth,
    SeenSet & seen, bool & handled);

  std::optional<std::string> member_property_name(
    const FileSymbolTable & file, const MemberExpr * member, int depth, SeenSet & seen);

  /// Whole-index search for a uniquely-ranked key factory of that name
  const Expr * resolve_workspace_factory(const FileSymbolTable & file, std::string_view name);

  const FileSymbolTable * module_table(const FileSymbolTable & from, std::string_view source);

  const SymbolIndex & index_;
  ModuleResolver & modules_;
};

}  // namespace qk_graph
