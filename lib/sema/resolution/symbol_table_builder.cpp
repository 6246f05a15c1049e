// qk_graph/sema/resolution/symbol_table_builder.cpp - FileSymbolTable construction
//
#include "qk_graph/sema/resolution/symbol_table_builder.hpp"

namespace qk_graph
{

FileSymbolTable build_file_symbols(
  const std::string & path, FileId file_id, const Program & program)
{
  FileSymbolTable table;
  table.path = path;
  table.file_id = file_id;

  SymbolTableBuilder builder(table);
  builder.build(program);
  return table;
}

void SymbolTableBuilder::build(const Program & program)
{
  top_level_.clear();
  for (const AstNode * stmt : program.body) {
    top_level_.insert(stmt);
    if (const auto * named = dyn_cast<ExportNamedDecl>(stmt)) {
      top_level_.insert(named->declaration);
    } else if (const auto * def = dyn_cast<ExportDefaultDecl>(stmt)) {
      top_level_.insert(def->declaration);
    }
  }

  (void)visit(&program);
}

// ============================================================================
// Imports
// ============================================================================

bool SymbolTableBuilder::visit_import_decl(const ImportDecl * node)
{
  for (const ImportSpecifier * spec : node->specifiers) {
    if (spec->local == nullptr) continue;
    table_.imports.insert_or_assign(
      spec->local->name, ImportBinding{spec->importKind, node->source, spec->imported});
  }
  return true;
}

// ============================================================================
// Local bindings
// ============================================================================

void SymbolTableBuilder::collect_variable(const VariableDeclarator * declarator)
{
  const auto * id = dyn_cast<BindingIdentifier>(declarator->id);
  if (id == nullptr || declarator->init == nullptr) return;

  const Expr * value = unwrap_expr(declarator->init);
  table_.values.insert_or_assign(id->name, value);

  if (const auto * fn = dyn_cast<FunctionExpr>(value)) {
    if (const Expr * returned = extract_function_return_expression(fn)) {
      table_.functions.insert_or_assign(id->name, returned);
    }
  }
}

bool SymbolTableBuilder::visit_variable_decl(const VariableDecl * node)
{
  const bool top = is_top_level(node);
  for (const VariableDeclarator * d : node->declarators) {
    const auto * id = dyn_cast<BindingIdentifier>(d->id);
    if (top || (id != nullptr && is_query_key_symbol_name(id->name))) {
      collect_variable(d);
    }
  }
  return RecursiveAstVisitor::visit_variable_decl(node);
}

bool SymbolTableBuilder::visit_function_decl(const FunctionDecl * node)
{
  if (node->id != nullptr && (is_top_level(node) || is_query_key_symbol_name(node->id->name))) {
    if (const Expr * returned = extract_function_return_expression(node->function)) {
      table_.functions.insert_or_assign(node->id->name, returned);
    }
  }
  return RecursiveAstVisitor::visit_function_decl(node);
}

// ============================================================================
// Exports
// ============================================================================

bool SymbolTableBuilder::visit_export_named_decl(const ExportNamedDecl * node)
{
  if (const auto * var = dyn_cast<VariableDecl>(node->declaration)) {
    for (const VariableDeclarator * d : var->declarators) {
      if (const auto * id = dyn_cast<BindingIdentifier>(d->id)) {
        table_.exports.insert_or_assign(id->name, id->name);
      }
    }
  } else if (const auto * fn = dyn_cast<FunctionDecl>(node->declaration)) {
    if (fn->id) table_.exports.insert_or_assign(fn->id->name, fn->id->name);
  }

  for (const ExportSpecifier * spec : node->specifiers) {
    if (!node->hasSource) {
      table_.exports.insert_or_assign(spec->exported, spec->local);
    } else {
      table_.reExports.push_back(ReExportBinding{node->source, spec->local, spec->exported, false});
    }
  }

  return RecursiveAstVisitor::visit_export_named_decl(node);
}

void SymbolTableBuilder::collect_default_export(const AstNode * declaration)
{
  if (const auto * id = dyn_cast<Identifier>(declaration)) {
    table_.exports.insert_or_assign("default", id->name);
    return;
  }

  if (const auto * fn = dyn_cast<FunctionDecl>(declaration)) {
    if (fn->id == nullptr) return;
    if (const Expr * returned = extract_function_return_expression(fn->function)) {
      table_.functions.insert_or_assign(fn->id->name, returned);
    }
    table_.exports.insert_or_assign("default", fn->id->name);
    return;
  }

  if (const auto * expr = dyn_cast<Expr>(declaration)) {
    const Expr * unwrapped = unwrap_expr(expr);
    table_.values.insert_or_assign(k_default_export_name, unwrapped);

    if (const auto * fn = dyn_cast<FunctionExpr>(unwrapped)) {
      if (const Expr * returned = extract_function_return_expression(fn)) {
        table_.functions.insert_or_assign(k_default_export_name, returned);
      }
    }
    table_.exports.insert_or_assign("default", k_default_export_name);
  }
}

bool SymbolTableBuilder::visit_export_default_decl(const ExportDefaultDecl * node)
{
  collect_default_export(node->declaration);
  return RecursiveAstVisitor::visit_export_default_decl(node);
}

bool SymbolTableBuilder::visit_export_all_decl(const ExportAllDecl * node)
{
  table_.reExports.push_back(ReExportBinding{node->source, {}, {}, true});
  return true;
}

}  // namespace qk_graph
