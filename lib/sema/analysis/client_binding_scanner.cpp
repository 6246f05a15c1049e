// qk_graph/sema/analysis/client_binding_scanner.cpp - Query-client variable tracking
//
// Runs after the import scan. A variable is recorded as a query client when
// it is annotated with the client type, initialized from `useQueryClient()`
// or `new QueryClient()`, or destructured from a call whose result carries
// a client (custom hooks, React contexts).
//
#include <cctype>

#include "qk_graph/ast/visitor.hpp"
#include "qk_graph/sema/analysis/client_context.hpp"
#include "qk_graph/sema/analysis/local_argument_resolver.hpp"

namespace qk_graph
{

namespace
{

inline constexpr int k_max_certainty_depth = 8;

bool is_client_property_name(std::string_view name)
{
  constexpr std::string_view expected = "queryclient";
  if (name.size() != expected.size()) return false;
  for (size_t i = 0; i < name.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(name[i])) != expected[i]) return false;
  }
  return true;
}

/// Structural check: `QueryClient`, `ns.QueryClient`, or a union containing one
bool type_looks_like_client(const TypeNode * type, int depth = 0)
{
  if (type == nullptr || depth >= k_max_certainty_depth) return false;
  if (const auto * ref = dyn_cast<TypeReference>(type)) {
    return !ref->path.empty() && is_client_property_name(ref->path[ref->path.size() - 1]);
  }
  if (const auto * composite = dyn_cast<CompositeType>(type)) {
    for (const TypeNode * member : composite->types) {
      if (type_looks_like_client(member, depth + 1)) return true;
    }
  }
  return false;
}

/// Callee name for `f(...)` and `obj.f(...)`
std::string_view callee_name(const Expr * callee)
{
  const auto name = leaf_identifier_name(callee);
  return name ? *name : std::string_view{};
}

bool is_hook_like_name(std::string_view name)
{
  if (name.size() < 4 || name.substr(0, 3) != "use") return false;
  const auto next = static_cast<unsigned char>(name[3]);
  return std::isupper(next) || std::isdigit(next) || next == '_';
}

/// Local name bound by a destructuring property (`{ a }`, `{ k: a }`, `{ k: a = x }`)
std::optional<std::string_view> pattern_property_local_name(const PatternProperty * prop)
{
  const AstNode * value = prop->value;
  if (const auto * assign = dyn_cast<AssignmentPattern>(value)) value = assign->left;
  if (const auto * id = dyn_cast<BindingIdentifier>(value)) return id->name;
  return std::nullopt;
}

class ClientBindingScanner : public ConstRecursiveAstVisitor<ClientBindingScanner>
{
public:
  ClientBindingScanner(ClientContext & context, KeyNormalizer & normalizer)
  : context_(context), normalizer_(normalizer)
  {
  }

  bool visit_function_expr(const FunctionExpr * node)
  {
    for (const AstNode * param : node->params) {
      track_param(param);
    }
    return ConstRecursiveAstVisitor::visit_function_expr(node);
  }

  bool visit_variable_declarator(const VariableDeclarator * node)
  {
    const auto * id = dyn_cast<BindingIdentifier>(node->id);
    if (id != nullptr) track_typed_identifier(id);

    if (const auto * call = dyn_cast<CallExpr>(node->init)) {
      if (id != nullptr) {
        if (auto certainty = client_hook_call_certainty(call->callee, context_)) {
          set_certainty(context_.queryClientVars, id->name, *certainty);
        }
      }
      if (const auto * pattern = dyn_cast<ObjectPattern>(node->id)) {
        track_destructured(pattern, call);
      }
      track_refetch_handles(node, call);
    }

    if (const auto * ctor = dyn_cast<NewExpr>(node->init)) {
      if (id != nullptr) {
        if (auto certainty = client_ctor_certainty(ctor->callee, context_)) {
          set_certainty(context_.queryClientVars, id->name, *certainty);
        }
      }
    }

    return ConstRecursiveAstVisitor::visit_variable_declarator(node);
  }

private:
  void track_typed_identifier(const BindingIdentifier * id, const TypeNode * type = nullptr)
  {
    if (type == nullptr) type = id->type;
    if (auto certainty = client_type_certainty(type, context_)) {
      set_certainty(context_.queryClientVars, id->name, *certainty);
    }
  }

  void track_param(const AstNode * param)
  {
    if (const auto * id = dyn_cast<BindingIdentifier>(param)) {
      track_typed_identifier(id);
      return;
    }
    if (const auto * rest = dyn_cast<RestElement>(param)) {
      if (const auto * id = dyn_cast<BindingIdentifier>(rest->argument)) {
        track_typed_identifier(id, rest->type != nullptr ? rest->type : id->type);
      }
      return;
    }
    if (const auto * assign = dyn_cast<AssignmentPattern>(param)) {
      if (const auto * id = dyn_cast<BindingIdentifier>(assign->left)) {
        track_typed_identifier(id);
        return;
      }
      param = assign->left;
    }
    if (const auto * pattern = dyn_cast<ObjectPattern>(param)) track_typed_pattern(pattern);
  }

  /// `({ client }: { client: QueryClient })`
  void track_typed_pattern(const ObjectPattern * pattern)
  {
    const auto * literal = dyn_cast<TypeLiteral>(pattern->type);
    if (literal == nullptr) return;

    for (const TypeMember * member : literal->members) {
      if (member == nullptr || member->type == nullptr) continue;
      const auto certainty = client_type_certainty(member->type, context_);
      if (!certainty) continue;

      for (const AstNode * entry : pattern->properties) {
        const auto * prop = dyn_cast<PatternProperty>(entry);
        if (prop == nullptr) continue;
        const auto key = pattern_property_key(prop);
        if (!key || *key != member->name) continue;
        if (const auto local = pattern_property_local_name(prop)) {
          set_certainty(context_.queryClientVars, *local, *certainty);
        }
        break;
      }
    }
  }

  /// `const { queryClient } = useAppContext()`
  void track_destructured(const ObjectPattern * pattern, const CallExpr * call)
  {
    ReferenceResolver * resolver = normalizer_.resolver();
    const Expr * result =
      resolver != nullptr ? resolver->resolve_call_result(call->callee) : nullptr;
    const auto * result_object = unwrap_as<ObjectExpr>(result);

    for (const AstNode * entry : pattern->properties) {
      const auto * prop = dyn_cast<PatternProperty>(entry);
      if (prop == nullptr) continue;
      const auto local = pattern_property_local_name(prop);
      if (!local) continue;
      const auto key = pattern_property_key(prop);

      std::optional<Resolution> certainty;
      if (key && result_object != nullptr) {
        if (const Expr * value = literal_property_value(result_object, *key)) {
          certainty = certainty_from_expression(value);
        }
      }

      const bool client_like = (key && is_client_property_name(*key)) ||
                               is_client_property_name(*local);
      if (!certainty && client_like && result != nullptr) {
        certainty = certainty_from_expression(result);
      }
      if (!certainty && client_like && is_hook_like_name(callee_name(call->callee))) {
        certainty = Resolution::Dynamic;
      }

      if (certainty) set_certainty(context_.queryClientVars, *local, *certainty);
    }
  }

  /// `const { refetch } = useQuery(...)` and `const q = useQuery(...)`
  void track_refetch_handles(const VariableDeclarator * node, const CallExpr * call)
  {
    if (!hook_call_info(call->callee, context_)) return;
    const NormalizedKey key = normalizer_.infer_hook_key(call->arguments);

    if (const auto * pattern = dyn_cast<ObjectPattern>(node->id)) {
      for (const AstNode * entry : pattern->properties) {
        const auto * prop = dyn_cast<PatternProperty>(entry);
        if (prop == nullptr || prop->computed) continue;
        const auto * prop_key = dyn_cast<Identifier>(prop->key);
        const auto * value = dyn_cast<BindingIdentifier>(prop->value);
        if (prop_key == nullptr || value == nullptr || prop_key->name != "refetch") continue;
        context_.refetchFunctions.insert_or_assign(std::string(value->name), key);
      }
    }

    if (const auto * id = dyn_cast<BindingIdentifier>(node->id)) {
      context_.refetchObjects.insert_or_assign(std::string(id->name), key);
    }
  }

  std::optional<Resolution> create_context_certainty(const CallExpr * call)
  {
    if (!call->typeArguments.empty()) {
      const TypeNode * first = call->typeArguments[0];
      if (const auto * literal = dyn_cast<TypeLiteral>(first)) {
        for (const TypeMember * member : literal->members) {
          if (member == nullptr || member->type == nullptr) continue;
          if (!is_client_property_name(member->name)) continue;
          if (type_looks_like_client(member->type)) return Resolution::Static;
          if (auto certainty = client_type_certainty(member->type, context_)) return certainty;
        }
      }
      if (type_looks_like_client(first)) return Resolution::Static;
    }

    const auto * initial = unwrap_as<ObjectExpr>(first_expression_argument(call));
    const Expr * client = literal_property_value(initial, "queryClient");
    if (client == nullptr) return std::nullopt;
    return certainty_from_expression(client);
  }

  std::optional<Resolution> certainty_from_expression(const Expr * expr, int depth = 0)
  {
    if (expr == nullptr || depth >= k_max_certainty_depth) return std::nullopt;
    ReferenceResolver * resolver = normalizer_.resolver();
    const Expr * u = unwrap_expr(expr);

    if (const auto * call = dyn_cast<CallExpr>(u)) {
      const std::string_view name = callee_name(call->callee);
      if (name == "createContext") {
        if (auto certainty = create_context_certainty(call)) return certainty;
      }
      if (name == "useContext") {
        if (const Expr * arg = first_expression_argument(call)) {
          const Expr * context_ref =
            resolver != nullptr ? resolver->resolve_reference(arg) : nullptr;
          if (context_ref == nullptr) context_ref = unwrap_expr(arg);
          if (auto certainty = certainty_from_expression(context_ref, depth + 1)) return certainty;
        }
      }
      if (auto certainty = client_hook_call_certainty(call->callee, context_)) return certainty;
      if (resolver == nullptr) return std::nullopt;
      return certainty_from_expression(resolver->resolve_call_result(call->callee), depth + 1);
    }

    if (const auto * ctor = dyn_cast<NewExpr>(u)) {
      return client_ctor_certainty(ctor->callee, context_);
    }

    if (isa<Identifier, MemberExpr>(u)) {
      if (auto tracked = client_object_certainty(u, context_)) return tracked;
      if (resolver != nullptr) {
        if (const Expr * resolved = resolver->resolve_reference(u)) {
          return certainty_from_expression(resolved, depth + 1);
        }
      }
      return std::nullopt;
    }

    if (const auto * cond = dyn_cast<ConditionalExpr>(u)) {
      if (auto certainty = certainty_from_expression(cond->consequent, depth + 1)) return certainty;
      return certainty_from_expression(cond->alternate, depth + 1);
    }
    if (const auto * logical = dyn_cast<LogicalExpr>(u)) {
      if (auto certainty = certainty_from_expression(logical->left, depth + 1)) return certainty;
      return certainty_from_expression(logical->right, depth + 1);
    }
    return std::nullopt;
  }

  ClientContext & context_;
  KeyNormalizer & normalizer_;
};

}  // namespace

void scan_client_bindings(
  const Program & program, ClientContext & context, KeyNormalizer & normalizer)
{
  ClientBindingScanner scanner(context, normalizer);
  scanner.visit(&program);
}

}  // namespace qk_graph
