// qk_graph/sema/keys/expr_rewrite.cpp - Identifier substitution over expressions
//
#include "qk_graph/sema/keys/expr_rewrite.hpp"

#include <vector>

#include "qk_graph/ast/visitor.hpp"

namespace qk_graph
{

namespace
{

class IdentifierFinder : public ConstRecursiveAstVisitor<IdentifierFinder>
{
public:
  explicit IdentifierFinder(std::string_view name) : name_(name) {}

  bool visit_identifier(const Identifier * node)
  {
    if (node->name == name_) found = true;
    return !found;
  }

  // Parameters bind names, they do not reference them
  bool visit_function_expr(const FunctionExpr * node) { return visit(node->body); }

  bool found = false;

private:
  std::string_view name_;
};

// Rewritten nodes share unchanged children with the original tree. Nothing
// is ever mutated through these pointers.
Expr * share(const Expr * e) { return const_cast<Expr *>(e); }

class Substituter
{
public:
  Substituter(AstContext & scratch, std::string_view name, const Expr * replacement)
  : scratch_(scratch), name_(name), replacement_(replacement)
  {
  }

  const Expr * rewrite(const Expr * node)
  {
    if (node == nullptr) return nullptr;

    switch (node->get_kind()) {
      case NodeKind::Identifier:
        return cast<Identifier>(node)->name == name_ ? replacement_ : node;

      case NodeKind::ArrayExpr: {
        const auto * array = cast<ArrayExpr>(node);
        bool changed = false;
        auto elements = rewrite_list(array->elements, changed);
        if (!changed) return node;
        return scratch_.create<ArrayExpr>(elements, array->get_range());
      }

      case NodeKind::ObjectExpr:
        return rewrite_object(cast<ObjectExpr>(node));

      case NodeKind::SpreadElement: {
        const auto * spread = cast<SpreadElement>(node);
        const Expr * arg = rewrite(spread->argument);
        if (arg == spread->argument) return node;
        return scratch_.create<SpreadElement>(share(arg), spread->get_range());
      }

      case NodeKind::MemberExpr: {
        const auto * member = cast<MemberExpr>(node);
        const Expr * object = rewrite(member->object);
        const Expr * property = member->computed ? rewrite(member->property) : member->property;
        if (object == member->object && property == member->property) return node;
        return scratch_.create<MemberExpr>(
          share(object), share(property), member->computed, member->optional, member->get_range());
      }

      case NodeKind::CallExpr: {
        const auto * call = cast<CallExpr>(node);
        const Expr * callee = rewrite(call->callee);
        bool changed = callee != call->callee;
        auto args = rewrite_list(call->arguments, changed);
        if (!changed) return node;
        auto * out =
          scratch_.create<CallExpr>(share(callee), args, call->optional, call->get_range());
        out->typeArguments = call->typeArguments;
        return out;
      }

      case NodeKind::TemplateLiteral: {
        const auto * tpl = cast<TemplateLiteral>(node);
        bool changed = false;
        auto exprs = rewrite_list(tpl->expressions, changed);
        if (!changed) return node;
        return scratch_.create<TemplateLiteral>(tpl->quasis, exprs, tpl->get_range());
      }

      case NodeKind::UnaryExpr: {
        const auto * unary = cast<UnaryExpr>(node);
        const Expr * arg = rewrite(unary->argument);
        if (arg == unary->argument) return node;
        return scratch_.create<UnaryExpr>(unary->op, share(arg), unary->get_range());
      }

      case NodeKind::UpdateExpr: {
        const auto * update = cast<UpdateExpr>(node);
        const Expr * arg = rewrite(update->argument);
        if (arg == update->argument) return node;
        return scratch_.create<UpdateExpr>(
          update->op, update->prefix, share(arg), update->get_range());
      }

      case NodeKind::BinaryExpr: {
        const auto * bin = cast<BinaryExpr>(node);
        const Expr * l = rewrite(bin->left);
        const Expr * r = rewrite(bin->right);
        if (l == bin->left && r == bin->right) return node;
        return scratch_.create<BinaryExpr>(bin->op, share(l), share(r), bin->get_range());
      }

      case NodeKind::LogicalExpr: {
        const auto * logical = cast<LogicalExpr>(node);
        const Expr * l = rewrite(logical->left);
        const Expr * r = rewrite(logical->right);
        if (l == logical->left && r == logical->right) return node;
        return scratch_.create<LogicalExpr>(logical->op, share(l), share(r), logical->get_range());
      }

      case NodeKind::AssignmentExpr: {
        const auto * assign = cast<AssignmentExpr>(node);
        const auto * left_expr = dyn_cast<Expr>(assign->left);
        const Expr * l = left_expr ? rewrite(left_expr) : nullptr;
        const Expr * r = rewrite(assign->right);
        if (l == left_expr && r == assign->right) return node;
        AstNode * left = left_expr ? share(l) : assign->left;
        return scratch_.create<AssignmentExpr>(assign->op, left, share(r), assign->get_range());
      }

      case NodeKind::ConditionalExpr: {
        const auto * cond = cast<ConditionalExpr>(node);
        const Expr * t = rewrite(cond->test);
        const Expr * c = rewrite(cond->consequent);
        const Expr * a = rewrite(cond->alternate);
        if (t == cond->test && c == cond->consequent && a == cond->alternate) return node;
        return scratch_.create<ConditionalExpr>(share(t), share(c), share(a), cond->get_range());
      }

      case NodeKind::SequenceExpr: {
        const auto * seq = cast<SequenceExpr>(node);
        bool changed = false;
        auto exprs = rewrite_list(seq->expressions, changed);
        if (!changed) return node;
        return scratch_.create<SequenceExpr>(exprs, seq->get_range());
      }

      case NodeKind::TsCastExpr: {
        const auto * cast_expr = cast<TsCastExpr>(node);
        const Expr * inner = rewrite(cast_expr->expression);
        if (inner == cast_expr->expression) return node;
        return scratch_.create<TsCastExpr>(
          cast_expr->castKind, share(inner), cast_expr->type, cast_expr->get_range());
      }

      default:
        return node;
    }
  }

private:
  gsl::span<Expr *> rewrite_list(gsl::span<Expr *> list, bool & changed)
  {
    std::vector<Expr *> out;
    out.reserve(list.size());
    for (Expr * e : list) {
      const Expr * r = rewrite(e);
      changed = changed || r != e;
      out.push_back(share(r));
    }
    return changed ? scratch_.store(out) : list;
  }

  const Expr * rewrite_object(const ObjectExpr * object)
  {
    bool changed = false;
    std::vector<AstNode *> props;
    props.reserve(object->properties.size());

    for (AstNode * member : object->properties) {
      if (auto * spread = dyn_cast<SpreadElement>(member)) {
        const Expr * r = rewrite(spread);
        changed = changed || r != spread;
        props.push_back(share(r));
        continue;
      }

      auto * prop = dyn_cast<Property>(member);
      if (prop == nullptr || prop->propKind != PropertyKind::Init || prop->value == nullptr) {
        props.push_back(member);
        continue;
      }

      const Expr * key = prop->computed ? rewrite(prop->key) : prop->key;
      const Expr * value = rewrite(prop->value);
      if (key == prop->key && value == prop->value) {
        props.push_back(member);
        continue;
      }

      changed = true;
      auto * next = scratch_.create<Property>(
        prop->propKind, share(key), share(value), prop->get_range());
      next->computed = prop->computed;
      const auto * key_id = dyn_cast<Identifier>(key);
      const auto * value_id = dyn_cast<Identifier>(value);
      next->shorthand = prop->shorthand && key_id && value_id && key_id->name == value_id->name;
      props.push_back(next);
    }

    if (!changed) return object;
    return scratch_.create<ObjectExpr>(scratch_.store(props), object->get_range());
  }

  AstContext & scratch_;
  std::string_view name_;
  const Expr * replacement_;
};

}  // namespace

const ObjectExpr * replace_property_value(
  AstContext & scratch, const ObjectExpr * object, const Property * target, const Expr * value)
{
  if (object == nullptr || target == nullptr || target->value == value) return object;

  std::vector<AstNode *> props;
  props.reserve(object->properties.size());
  for (AstNode * member : object->properties) {
    if (member != target) {
      props.push_back(member);
      continue;
    }
    auto * next =
      scratch.create<Property>(target->propKind, target->key, share(value), target->get_range());
    next->computed = target->computed;
    const auto * key_id = dyn_cast<Identifier>(target->key);
    const auto * value_id = dyn_cast<Identifier>(value);
    next->shorthand = target->shorthand && key_id && value_id && key_id->name == value_id->name;
    props.push_back(next);
  }
  return scratch.create<ObjectExpr>(scratch.store(props), object->get_range());
}

gsl::span<Expr *> replace_first_argument(
  AstContext & scratch, gsl::span<Expr *> args, const Expr * first)
{
  if (args.empty() || args[0] == first) return args;

  std::vector<Expr *> out(args.begin(), args.end());
  out[0] = share(first);
  return scratch.store(out);
}

bool expression_contains_identifier(const Expr * expr, std::string_view name)
{
  if (expr == nullptr) return false;
  IdentifierFinder finder(name);
  (void)finder.visit(expr);
  return finder.found;
}

const Expr * substitute_identifier(
  AstContext & scratch, const Expr * expr, std::string_view name, const Expr * replacement)
{
  if (expr == nullptr || replacement == nullptr) return expr;
  Substituter substituter(scratch, name, replacement);
  return substituter.rewrite(expr);
}

}  // namespace qk_graph
