// qk_graph/sema/analysis/client_context.cpp - Certainty tables and import scan
//
#include "qk_graph/sema/analysis/client_context.hpp"

#include <algorithm>
#include <array>

#include "qk_graph/ast/visitor.hpp"

namespace qk_graph
{

namespace
{

constexpr std::array<std::string_view, 9> k_query_hooks = {
  "useQuery",
  "useInfiniteQuery",
  "useSuspenseQuery",
  "useSuspenseInfiniteQuery",
  "useQueries",
  "useSuspenseQueries",
  "queryOptions",
  "usePrefetchQuery",
  "usePrefetchInfiniteQuery",
};

constexpr std::array<std::string_view, 6> k_client_declare_methods = {
  "fetchQuery",
  "prefetchQuery",
  "ensureQueryData",
  "fetchInfiniteQuery",
  "prefetchInfiniteQuery",
  "ensureInfiniteQueryData",
};

struct MethodRelation
{
  std::string_view method;
  Relation relation;
};

constexpr std::array<MethodRelation, 8> k_client_mutation_methods = {{
  {"invalidateQueries", Relation::Invalidates},
  {"refetchQueries", Relation::Refetches},
  {"cancelQueries", Relation::Cancels},
  {"resetQueries", Relation::Resets},
  {"clear", Relation::Clears},
  {"removeQueries", Relation::Removes},
  {"setQueryData", Relation::Sets},
  {"setQueriesData", Relation::Sets},
}};

inline constexpr int k_max_type_depth = 8;
inline constexpr int k_max_type_name_depth = 6;

/// `a.b.QueryClient`: the prefix of `path` of length `size` names the client type
std::optional<Resolution> type_name_certainty(
  gsl::span<std::string_view> path, size_t size, const ClientContext & context, int depth)
{
  if (depth > k_max_type_name_depth || size == 0) return std::nullopt;
  if (size == 1) return get_certainty(context.queryClientTypeNames, path[0]);

  if (path[size - 1] != "QueryClient") return std::nullopt;
  if (size == 2) return get_certainty(context.queryNamespaces, path[0]);
  return type_name_certainty(path, size - 1, context, depth + 1);
}

std::optional<Resolution> type_node_certainty(
  const TypeNode * type, const ClientContext & context, int depth)
{
  if (type == nullptr || depth > k_max_type_depth) return std::nullopt;

  if (const auto * ref = dyn_cast<TypeReference>(type)) {
    return type_name_certainty(ref->path, ref->path.size(), context, depth + 1);
  }
  if (const auto * composite = dyn_cast<CompositeType>(type)) {
    for (const TypeNode * member : composite->types) {
      if (auto certainty = type_node_certainty(member, context, depth + 1)) return certainty;
    }
  }
  return std::nullopt;
}

/// Simple-identifier callee, or `ns.name` with both parts identifiers
struct CalleeParts
{
  std::string_view object;  ///< Empty for a plain identifier
  std::string_view name;
};

std::optional<CalleeParts> callee_parts(const Expr * callee)
{
  const Expr * u = unwrap_expr(callee);
  if (const auto * id = dyn_cast<Identifier>(u)) return CalleeParts{{}, id->name};

  const auto * member = dyn_cast<MemberExpr>(u);
  if (member == nullptr || member->computed) return std::nullopt;
  const auto * object = dyn_cast<Identifier>(member->object);
  const auto * property = dyn_cast<Identifier>(member->property);
  if (object == nullptr || property == nullptr) return std::nullopt;
  return CalleeParts{object->name, property->name};
}

// ============================================================================
// Import scan
// ============================================================================

class ImportScanner : public ConstRecursiveAstVisitor<ImportScanner>
{
public:
  explicit ImportScanner(ClientContext & context) : context_(context) {}

  bool visit_import_decl(const ImportDecl * node)
  {
    const bool is_tanstack = node->source == k_tanstack_package;
    const Resolution certainty = is_tanstack ? Resolution::Static : Resolution::Dynamic;

    for (const ImportSpecifier * spec : node->specifiers) {
      if (spec == nullptr || spec->local == nullptr) continue;
      const std::string_view local = spec->local->name;

      switch (spec->importKind) {
        case ImportKind::Named:
          if (is_query_hook_name(spec->imported)) {
            set_certainty(context_.queryHooks, local, certainty);
            context_.queryHookKinds.insert_or_assign(
              std::string(local), std::string(spec->imported));
          }
          if (spec->imported == "useQueryClient") {
            set_certainty(context_.useQueryClientNames, local, certainty);
          }
          if (spec->imported == "QueryClient") {
            set_certainty(context_.queryClientCtorNames, local, certainty);
            set_certainty(context_.queryClientTypeNames, local, certainty);
          }
          break;
        case ImportKind::Namespace:
          if (is_query_like_module(node->source)) {
            set_certainty(context_.queryNamespaces, local, certainty);
          }
          break;
        case ImportKind::Default:
          if (is_tanstack) set_certainty(context_.queryNamespaces, local, certainty);
          break;
      }
    }
    return true;
  }

private:
  ClientContext & context_;
};

}  // namespace

// ============================================================================
// Tables
// ============================================================================

void set_certainty(CertaintyMap & map, std::string_view name, Resolution certainty)
{
  auto it = map.find(name);
  if (it == map.end()) {
    map.emplace(std::string(name), certainty);
    return;
  }
  if (it->second == Resolution::Static) return;
  if (certainty == Resolution::Static) it->second = certainty;
}

std::optional<Resolution> get_certainty(const CertaintyMap & map, std::string_view name)
{
  auto it = map.find(name);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

bool is_query_like_module(std::string_view source)
{
  if (source.find("react-query") != std::string_view::npos) return true;
  if (source.find("tanstack") != std::string_view::npos) return true;

  // (^|[/-])query([/-]|$)
  constexpr std::string_view word = "query";
  for (size_t pos = source.find(word); pos != std::string_view::npos;
       pos = source.find(word, pos + 1)) {
    const bool starts = pos == 0 || source[pos - 1] == '/' || source[pos - 1] == '-';
    const size_t end = pos + word.size();
    const bool ends = end == source.size() || source[end] == '/' || source[end] == '-';
    if (starts && ends) return true;
  }
  return false;
}

bool is_query_hook_name(std::string_view name)
{
  return std::find(k_query_hooks.begin(), k_query_hooks.end(), name) != k_query_hooks.end();
}

bool is_client_declare_method(std::string_view name)
{
  return std::find(k_client_declare_methods.begin(), k_client_declare_methods.end(), name) !=
         k_client_declare_methods.end();
}

std::optional<Relation> relation_for_client_method(std::string_view name)
{
  for (const auto & entry : k_client_mutation_methods) {
    if (entry.method == name) return entry.relation;
  }
  return std::nullopt;
}

// ============================================================================
// Certainty helpers
// ============================================================================

std::optional<HookCallInfo> hook_call_info(const Expr * callee, const ClientContext & context)
{
  const auto parts = callee_parts(callee);
  if (!parts) return std::nullopt;

  if (parts->object.empty()) {
    const auto certainty = get_certainty(context.queryHooks, parts->name);
    if (!certainty) return std::nullopt;
    auto kind = context.queryHookKinds.find(parts->name);
    std::string hook =
      kind != context.queryHookKinds.end() ? kind->second : std::string(parts->name);
    return HookCallInfo{std::string(parts->name), std::move(hook), *certainty};
  }

  if (!is_query_hook_name(parts->name)) return std::nullopt;
  const auto certainty = get_certainty(context.queryNamespaces, parts->object);
  if (!certainty) return std::nullopt;
  return HookCallInfo{std::string(parts->name), std::string(parts->name), *certainty};
}

std::optional<Resolution> client_hook_call_certainty(
  const Expr * callee, const ClientContext & context)
{
  const auto parts = callee_parts(callee);
  if (!parts) return std::nullopt;
  if (parts->object.empty()) return get_certainty(context.useQueryClientNames, parts->name);
  if (parts->name != "useQueryClient") return std::nullopt;
  return get_certainty(context.queryNamespaces, parts->object);
}

std::optional<Resolution> client_ctor_certainty(const Expr * callee, const ClientContext & context)
{
  const auto parts = callee_parts(callee);
  if (!parts) return std::nullopt;
  if (parts->object.empty()) return get_certainty(context.queryClientCtorNames, parts->name);
  if (parts->name != "QueryClient") return std::nullopt;
  return get_certainty(context.queryNamespaces, parts->object);
}

std::optional<Resolution> client_type_certainty(
  const TypeNode * type, const ClientContext & context)
{
  return type_node_certainty(type, context, 0);
}

std::optional<std::string_view> leaf_identifier_name(const Expr * expr)
{
  const Expr * u = unwrap_expr(expr);
  if (const auto * id = dyn_cast<Identifier>(u)) return id->name;
  if (const auto * member = dyn_cast<MemberExpr>(u)) {
    if (const auto * property = dyn_cast<Identifier>(member->property)) return property->name;
  }
  return std::nullopt;
}

std::optional<Resolution> client_object_certainty(
  const Expr * object, const ClientContext & context)
{
  const auto leaf = leaf_identifier_name(object);
  if (!leaf) return std::nullopt;
  return get_certainty(context.queryClientVars, *leaf);
}

void scan_client_imports(const Program & program, ClientContext & context)
{
  ImportScanner scanner(context);
  scanner.visit(&program);
}

}  // namespace qk_graph
