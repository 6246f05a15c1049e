// qk_graph/sema/resolution/symbol_table.cpp - Symbol index and return-expression extraction
#include "qk_graph/sema/resolution/symbol_table.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_set>

namespace qk_graph
{

// ============================================================================
// SymbolIndex
// ============================================================================

void SymbolIndex::add(FileSymbolTable table)
{
  auto it = by_path_.find(table.path);
  if (it != by_path_.end()) {
    by_file_.erase(it->second->file_id.value);
    *it->second = std::move(table);
    by_file_[it->second->file_id.value] = it->second;
    return;
  }
  files_.push_back(std::make_unique<FileSymbolTable>(std::move(table)));
  FileSymbolTable * added = files_.back().get();
  by_path_.emplace(added->path, added);
  by_file_[added->file_id.value] = added;
}

const FileSymbolTable * SymbolIndex::find(std::string_view path) const
{
  auto it = by_path_.find(std::string(path));
  return it != by_path_.end() ? it->second : nullptr;
}

const FileSymbolTable * SymbolIndex::find(FileId file_id) const
{
  if (!file_id.is_valid()) return nullptr;
  auto it = by_file_.find(file_id.value);
  return it != by_file_.end() ? it->second : nullptr;
}

// ============================================================================
// Helpers
// ============================================================================

std::string normalize_analyzer_path(const std::filesystem::path & path)
{
  std::error_code ec;
  std::filesystem::path abs = std::filesystem::absolute(path, ec);
  if (ec) abs = path;
  std::string out = abs.lexically_normal().generic_string();
  // lexically_normal keeps a trailing separator for directories
  if (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

bool is_query_key_symbol_name(std::string_view name)
{
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "querykey") return false;
  return lower.find("rqkey") != std::string::npos || lower.find("querykey") != std::string::npos;
}

namespace
{

const Expr * top_level_return(gsl::span<AstNode *> statements);

const Expr * first_return_from_statement(const AstNode * stmt)
{
  if (stmt == nullptr) return nullptr;

  if (const auto * ret = dyn_cast<ReturnStmt>(stmt)) {
    return ret->argument ? unwrap_expr(ret->argument) : nullptr;
  }
  if (const auto * block = dyn_cast<BlockStmt>(stmt)) {
    return top_level_return(block->body);
  }
  if (const auto * if_stmt = dyn_cast<IfStmt>(stmt)) {
    if (const Expr * e = first_return_from_statement(if_stmt->consequent)) return e;
    return first_return_from_statement(if_stmt->alternate);
  }
  if (const auto * labeled = dyn_cast<LabeledStmt>(stmt)) {
    return first_return_from_statement(labeled->body);
  }
  if (const auto * for_stmt = dyn_cast<ForStmt>(stmt)) {
    return first_return_from_statement(for_stmt->body);
  }
  if (const auto * for_in = dyn_cast<ForInOfStmt>(stmt)) {
    return first_return_from_statement(for_in->body);
  }
  if (const auto * while_stmt = dyn_cast<WhileStmt>(stmt)) {
    return first_return_from_statement(while_stmt->body);
  }
  if (const auto * switch_stmt = dyn_cast<SwitchStmt>(stmt)) {
    for (const SwitchCase * c : switch_stmt->cases) {
      for (const AstNode * s : c->consequent) {
        if (const Expr * e = first_return_from_statement(s)) return e;
      }
    }
    return nullptr;
  }
  if (const auto * try_stmt = dyn_cast<TryStmt>(stmt)) {
    if (const Expr * e = first_return_from_statement(try_stmt->block)) return e;
    if (try_stmt->handler) {
      if (const Expr * e = first_return_from_statement(try_stmt->handler->body)) return e;
    }
    return first_return_from_statement(try_stmt->finalizer);
  }
  return nullptr;
}

const Expr * top_level_return(gsl::span<AstNode *> statements)
{
  for (const AstNode * stmt : statements) {
    if (const Expr * e = first_return_from_statement(stmt)) return e;
  }
  return nullptr;
}

/// Initializer of the last top-level `name = ...` declarator (aliases followed)
const Expr * resolve_returned_identifier(
  std::string_view name, gsl::span<AstNode *> statements,
  std::unordered_set<std::string_view> & seen)
{
  if (!seen.insert(name).second) return nullptr;

  for (auto it = statements.rbegin(); it != statements.rend(); ++it) {
    const auto * decl = dyn_cast<VariableDecl>(*it);
    if (decl == nullptr) continue;

    for (auto d = decl->declarators.rbegin(); d != decl->declarators.rend(); ++d) {
      const auto * id = dyn_cast<BindingIdentifier>((*d)->id);
      if (id == nullptr || id->name != name) continue;
      if ((*d)->init == nullptr) return nullptr;

      const Expr * init = unwrap_expr((*d)->init);
      if (const auto * alias = dyn_cast<Identifier>(init); alias && alias->name != name) {
        const Expr * deeper = resolve_returned_identifier(alias->name, statements, seen);
        return deeper != nullptr ? deeper : init;
      }
      return init;
    }
  }
  return nullptr;
}

}  // namespace

const Expr * extract_function_return_expression(const FunctionExpr * fn)
{
  if (fn == nullptr || fn->body == nullptr) return nullptr;

  if (const auto * body_expr = dyn_cast<Expr>(fn->body)) {
    return unwrap_expr(body_expr);
  }

  const auto * block = dyn_cast<BlockStmt>(fn->body);
  if (block == nullptr) return nullptr;

  const Expr * returned = top_level_return(block->body);
  if (returned == nullptr) return nullptr;

  const auto * id = dyn_cast<Identifier>(returned);
  if (id == nullptr) return returned;

  std::unordered_set<std::string_view> seen;
  const Expr * resolved = resolve_returned_identifier(id->name, block->body, seen);
  return resolved != nullptr ? resolved : returned;
}

}  // namespace qk_graph
