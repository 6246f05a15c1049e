// qk_graph/sema/analysis/client_context.hpp - Per-file query-client certainty tracking
//
// Before call sites are classified, two scans fill a ClientContext for the
// file: the import scan records which local names are query hooks, client
// constructors, client types and library namespaces; the binding scan
// records which variables hold a query client and which names are refetch
// handles of a hook. Every entry carries the certainty of its origin.
//
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "qk_graph/ast/ast.hpp"
#include "qk_graph/sema/analysis/call_site.hpp"
#include "qk_graph/sema/keys/key_normalizer.hpp"

namespace qk_graph
{

/// Package whose imports are trusted statically
inline constexpr std::string_view k_tanstack_package = "@tanstack/react-query";

using CertaintyMap = std::map<std::string, Resolution, std::less<>>;

/// Record a certainty; static entries are never downgraded
void set_certainty(CertaintyMap & map, std::string_view name, Resolution certainty);

[[nodiscard]] std::optional<Resolution> get_certainty(
  const CertaintyMap & map, std::string_view name);

/// `react-query`, `tanstack`, or a `query` path/dash segment
[[nodiscard]] bool is_query_like_module(std::string_view source);

[[nodiscard]] bool is_query_hook_name(std::string_view name);

/// Client methods that declare a key (`fetchQuery`, `ensureQueryData`, ...)
[[nodiscard]] bool is_client_declare_method(std::string_view name);

/// Relation of a client mutation method, if it is one
[[nodiscard]] std::optional<Relation> relation_for_client_method(std::string_view name);

/**
 * Everything the classifier knows about query-client names in one file.
 */
struct ClientContext
{
  CertaintyMap queryHooks;
  std::map<std::string, std::string, std::less<>> queryHookKinds;  ///< local name -> hook
  CertaintyMap queryNamespaces;
  CertaintyMap useQueryClientNames;
  CertaintyMap queryClientCtorNames;
  CertaintyMap queryClientTypeNames;
  CertaintyMap queryClientVars;

  /// `const { refetch: r } = useQuery(...)` -> r
  std::map<std::string, NormalizedKey, std::less<>> refetchFunctions;
  /// `const q = useQuery(...)` -> q (for `q.refetch()`)
  std::map<std::string, NormalizedKey, std::less<>> refetchObjects;
};

/// Hook recognized at a callee
struct HookCallInfo
{
  std::string operation;  ///< Name as written at the call
  std::string hook;       ///< Library hook it stands for
  Resolution resolution;
};

// ============================================================================
// Certainty of callees, types and objects
// ============================================================================

[[nodiscard]] std::optional<HookCallInfo> hook_call_info(
  const Expr * callee, const ClientContext & context);

/// `useQueryClient()` / `ns.useQueryClient()`
[[nodiscard]] std::optional<Resolution> client_hook_call_certainty(
  const Expr * callee, const ClientContext & context);

/// `new QueryClient()` / `new ns.QueryClient()`
[[nodiscard]] std::optional<Resolution> client_ctor_certainty(
  const Expr * callee, const ClientContext & context);

/// Type annotation naming the client type (through unions and intersections)
[[nodiscard]] std::optional<Resolution> client_type_certainty(
  const TypeNode * type, const ClientContext & context);

/// Tracked client variable at the leaf of an identifier or member chain
[[nodiscard]] std::optional<Resolution> client_object_certainty(
  const Expr * object, const ClientContext & context);

/// `x` for an identifier, `prop` for `obj.prop`
[[nodiscard]] std::optional<std::string_view> leaf_identifier_name(const Expr * expr);

// ============================================================================
// Scans
// ============================================================================

/// Record hook, client and namespace imports
void scan_client_imports(const Program & program, ClientContext & context);

/**
 * Record variables that hold a query client and refetch handles of hooks.
 *
 * Requires scan_client_imports to have run on the same context.
 */
void scan_client_bindings(
  const Program & program, ClientContext & context, KeyNormalizer & normalizer);

}  // namespace qk_graph
