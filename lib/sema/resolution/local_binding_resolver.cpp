// qk_graph/sema/resolution/local_binding_resolver.cpp - Scope walk attaching local bindings
#include "qk_graph/sema/resolution/local_binding_resolver.hpp"

namespace qk_graph
{

std::string_view to_string(BindingKind kind) noexcept
{
  switch (kind) {
    case BindingKind::Var:
      return "var";
    case BindingKind::Let:
      return "let";
    case BindingKind::Const:
      return "const";
    case BindingKind::Param:
      return "param";
    case BindingKind::Function:
      return "hoisted";
    case BindingKind::Class:
      return "class";
    case BindingKind::Import:
      return "module";
    case BindingKind::Catch:
      return "catch";
  }
  return "unknown";
}

void collect_pattern_identifiers(AstNode * pattern, std::vector<BindingIdentifier *> & out)
{
  if (pattern == nullptr) return;

  if (auto * id = dyn_cast<BindingIdentifier>(pattern)) {
    out.push_back(id);
  } else if (auto * obj = dyn_cast<ObjectPattern>(pattern)) {
    for (AstNode * prop : obj->properties) {
      if (auto * pp = dyn_cast<PatternProperty>(prop)) {
        collect_pattern_identifiers(pp->value, out);
      } else {
        collect_pattern_identifiers(prop, out);
      }
    }
  } else if (auto * arr = dyn_cast<ArrayPattern>(pattern)) {
    for (AstNode * elem : arr->elements) {
      collect_pattern_identifiers(elem, out);
    }
  } else if (auto * assign = dyn_cast<AssignmentPattern>(pattern)) {
    collect_pattern_identifiers(assign->left, out);
  } else if (auto * rest = dyn_cast<RestElement>(pattern)) {
    collect_pattern_identifiers(rest->argument, out);
  }
}

// ============================================================================
// Entry Point
// ============================================================================

void LocalBindingResolver::resolve(Program & program)
{
  current_ = table_.create_scope(ScopeKind::Module, nullptr);
  owners_.clear();

  for (AstNode * stmt : program.body) {
    hoist_var_declarations(stmt);
  }
  hoist_lexical_declarations(program.body);

  (void)visit_all(program.body);
  current_ = nullptr;
}

void LocalBindingResolver::push_scope(ScopeKind kind)
{
  current_ = table_.create_scope(kind, current_);
}

void LocalBindingResolver::pop_scope()
{
  if (current_ != nullptr) current_ = current_->get_parent();
}

// ============================================================================
// Declarations
// ============================================================================

Binding * LocalBindingResolver::declare(
  BindingIdentifier * id, BindingKind kind, const AstNode * declarator, const Expr * init)
{
  const bool hoisted = kind == BindingKind::Var || kind == BindingKind::Param;
  Scope * target = hoisted ? current_->hoisting_scope() : current_;

  if (Binding * existing = target->lookup_local(id->name)) {
    // Redeclaration (`var x; var x;`, `function f(a) { var a; }`)
    if (existing->identifier != id) {
      existing->constant = false;
    }
    id->binding = existing;
    return existing;
  }

  Binding b;
  b.name = id->name;
  b.kind = kind;
  b.definitionRange = id->get_range();
  b.identifier = id;
  b.declarator = declarator;
  b.init = init;
  b.owner = current_owner();
  if (kind == BindingKind::Param) {
    b.function = param_function_;
    b.paramIndex = param_index_;
  }

  Binding * binding = table_.create_binding(b);
  target->define(binding);
  id->binding = binding;
  return binding;
}

void LocalBindingResolver::declare_pattern(
  AstNode * pattern, BindingKind kind, const AstNode * declarator, const Expr * init)
{
  // The initializer only describes the name when the pattern is a plain identifier
  const bool plain = isa<BindingIdentifier>(pattern);

  std::vector<BindingIdentifier *> ids;
  collect_pattern_identifiers(pattern, ids);
  for (BindingIdentifier * id : ids) {
    (void)declare(id, kind, declarator, plain ? init : nullptr);
  }
}

void LocalBindingResolver::declare_variable_decl(VariableDecl * decl)
{
  BindingKind kind = BindingKind::Var;
  if (decl->declKind == VariableKind::Let) kind = BindingKind::Let;
  if (decl->declKind == VariableKind::Const) kind = BindingKind::Const;

  for (VariableDeclarator * d : decl->declarators) {
    declare_pattern(d->id, kind, d, d->init);
  }
}

void LocalBindingResolver::declare_params(FunctionExpr * fn)
{
  param_function_ = fn;
  for (size_t i = 0; i < fn->params.size(); ++i) {
    param_index_ = static_cast<int>(i);
    declare_pattern(fn->params[i], BindingKind::Param, fn->params[i], nullptr);
  }
  param_function_ = nullptr;
  param_index_ = -1;
}

void LocalBindingResolver::hoist_var_declarations(AstNode * stmt)
{
  if (stmt == nullptr) return;

  if (auto * decl = dyn_cast<VariableDecl>(stmt)) {
    if (decl->declKind == VariableKind::Var) declare_variable_decl(decl);
  } else if (auto * block = dyn_cast<BlockStmt>(stmt)) {
    for (AstNode * s : block->body) hoist_var_declarations(s);
  } else if (auto * if_stmt = dyn_cast<IfStmt>(stmt)) {
    hoist_var_declarations(if_stmt->consequent);
    hoist_var_declarations(if_stmt->alternate);
  } else if (auto * for_stmt = dyn_cast<ForStmt>(stmt)) {
    hoist_var_declarations(for_stmt->init);
    hoist_var_declarations(for_stmt->body);
  } else if (auto * for_in = dyn_cast<ForInOfStmt>(stmt)) {
    hoist_var_declarations(for_in->left);
    hoist_var_declarations(for_in->body);
  } else if (auto * while_stmt = dyn_cast<WhileStmt>(stmt)) {
    hoist_var_declarations(while_stmt->body);
  } else if (auto * switch_stmt = dyn_cast<SwitchStmt>(stmt)) {
    for (SwitchCase * c : switch_stmt->cases) {
      for (AstNode * s : c->consequent) hoist_var_declarations(s);
    }
  } else if (auto * try_stmt = dyn_cast<TryStmt>(stmt)) {
    hoist_var_declarations(try_stmt->block);
    if (try_stmt->handler) hoist_var_declarations(try_stmt->handler->body);
    hoist_var_declarations(try_stmt->finalizer);
  } else if (auto * labeled = dyn_cast<LabeledStmt>(stmt)) {
    hoist_var_declarations(labeled->body);
  } else if (auto * exported = dyn_cast<ExportNamedDecl>(stmt)) {
    hoist_var_declarations(exported->declaration);
  }
}

void LocalBindingResolver::hoist_lexical_declarations(gsl::span<AstNode *> body)
{
  for (AstNode * stmt : body) {
    AstNode * decl = stmt;
    if (auto * exported = dyn_cast<ExportNamedDecl>(stmt)) {
      decl = exported->declaration;
    } else if (auto * default_export = dyn_cast<ExportDefaultDecl>(stmt)) {
      decl = default_export->declaration;
    }
    if (decl == nullptr) continue;

    if (auto * var = dyn_cast<VariableDecl>(decl)) {
      if (var->declKind != VariableKind::Var) declare_variable_decl(var);
    } else if (auto * fn = dyn_cast<FunctionDecl>(decl)) {
      if (fn->id) (void)declare(fn->id, BindingKind::Function, fn, nullptr);
    } else if (auto * klass = dyn_cast<ClassDecl>(decl)) {
      if (klass->id) (void)declare(klass->id, BindingKind::Class, klass, nullptr);
    } else if (auto * import = dyn_cast<ImportDecl>(decl)) {
      for (ImportSpecifier * spec : import->specifiers) {
        if (spec->local) (void)declare(spec->local, BindingKind::Import, spec, nullptr);
      }
    }
  }
}

// ============================================================================
// Reassignment tracking
// ============================================================================

void LocalBindingResolver::mark_reassigned(Identifier * id)
{
  Binding * b = current_->lookup(id->name);
  id->binding = b;
  if (b != nullptr) b->constant = false;
}

void LocalBindingResolver::mark_assignment_target(AstNode * target)
{
  if (target == nullptr) return;

  if (auto * id = dyn_cast<Identifier>(target)) {
    mark_reassigned(id);
    return;
  }
  if (auto * cast_expr = dyn_cast<TsCastExpr>(target)) {
    mark_assignment_target(cast_expr->expression);
    return;
  }
  if (isa<Pattern>(target)) {
    // Destructuring assignment: every named target is reassigned
    std::vector<BindingIdentifier *> ids;
    collect_pattern_identifiers(target, ids);
    for (BindingIdentifier * id : ids) {
      Binding * b = current_->lookup(id->name);
      id->binding = b;
      if (b != nullptr) b->constant = false;
    }
  }
  // Default values, computed keys and member targets are ordinary expressions
  (void)visit(target);
}

// ============================================================================
// Visitor Methods
// ============================================================================

bool LocalBindingResolver::visit_identifier(Identifier * node)
{
  if (node->binding == nullptr && current_ != nullptr) {
    node->binding = current_->lookup(node->name);
  }
  return true;
}

bool LocalBindingResolver::visit_function_expr(FunctionExpr * node)
{
  push_scope(ScopeKind::Function);
  owners_.push_back(node);

  declare_params(node);

  auto * block = dyn_cast<BlockStmt>(node->body);
  if (block != nullptr) {
    for (AstNode * stmt : block->body) hoist_var_declarations(stmt);
    hoist_lexical_declarations(block->body);
  }

  (void)visit_all(node->params);
  if (block != nullptr) {
    (void)visit_all(block->body);
  } else {
    (void)visit(node->body);
  }

  owners_.pop_back();
  pop_scope();
  return true;
}

bool LocalBindingResolver::visit_block_stmt(BlockStmt * node)
{
  push_scope(ScopeKind::Block);
  hoist_lexical_declarations(node->body);
  (void)visit_all(node->body);
  pop_scope();
  return true;
}

bool LocalBindingResolver::visit_for_stmt(ForStmt * node)
{
  push_scope(ScopeKind::Block);
  if (auto * decl = dyn_cast<VariableDecl>(node->init)) {
    if (decl->declKind != VariableKind::Var) declare_variable_decl(decl);
  }
  (void)RecursiveAstVisitor::visit_for_stmt(node);
  pop_scope();
  return true;
}

bool LocalBindingResolver::visit_for_in_of_stmt(ForInOfStmt * node)
{
  push_scope(ScopeKind::Block);
  if (auto * decl = dyn_cast<VariableDecl>(node->left)) {
    if (decl->declKind != VariableKind::Var) declare_variable_decl(decl);
    (void)visit(node->left);
  } else {
    mark_assignment_target(node->left);
  }
  (void)visit(node->right);
  (void)visit(node->body);
  pop_scope();
  return true;
}

bool LocalBindingResolver::visit_switch_stmt(SwitchStmt * node)
{
  (void)visit(node->discriminant);

  push_scope(ScopeKind::Block);
  for (SwitchCase * c : node->cases) {
    hoist_lexical_declarations(c->consequent);
  }
  (void)visit_all(node->cases);
  pop_scope();
  return true;
}

bool LocalBindingResolver::visit_catch_clause(CatchClause * node)
{
  push_scope(ScopeKind::Block);
  if (node->param != nullptr) {
    declare_pattern(node->param, BindingKind::Catch, node, nullptr);
  }
  (void)RecursiveAstVisitor::visit_catch_clause(node);
  pop_scope();
  return true;
}

bool LocalBindingResolver::visit_assignment_expr(AssignmentExpr * node)
{
  mark_assignment_target(node->left);
  (void)visit(node->right);
  return true;
}

bool LocalBindingResolver::visit_update_expr(UpdateExpr * node)
{
  mark_assignment_target(node->argument);
  return true;
}

bool LocalBindingResolver::visit_call_expr(CallExpr * node)
{
  for (Expr * arg : node->arguments) {
    if (auto * fn = dyn_cast<FunctionExpr>(arg)) {
      fn->enclosingCall = node;
    }
  }
  return RecursiveAstVisitor::visit_call_expr(node);
}

bool LocalBindingResolver::visit_import_decl(ImportDecl * /*node*/)
{
  // Import bindings are declared while hoisting the module scope
  return true;
}

bool LocalBindingResolver::visit_export_named_decl(ExportNamedDecl * node)
{
  (void)visit(node->declaration);
  return true;
}

}  // namespace qk_graph
