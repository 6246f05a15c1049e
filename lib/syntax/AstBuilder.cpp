// qk_graph/syntax/AstBuilder.cpp - Program, declarations and shared lowering helpers
#include <cstdint>
#include <string>
#include <vector>

#include "qk_graph/syntax/ast_builder.hpp"

namespace qk_graph
{

namespace
{

bool is_hex_digit(char c)
{
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

uint32_t hex_value(char c)
{
  if (c >= '0' && c <= '9') return static_cast<uint32_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint32_t>(10 + (c - 'a'));
  return static_cast<uint32_t>(10 + (c - 'A'));
}

void append_utf8(uint32_t cp, std::string & out)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

/// Read exactly `count` hex digits at s[i..]; advances i on success
bool read_hex(std::string_view s, size_t & i, size_t count, uint32_t & out)
{
  if (i + count > s.size()) return false;
  uint32_t v = 0;
  for (size_t k = 0; k < count; ++k) {
    if (!is_hex_digit(s[i + k])) return false;
    v = (v << 4) | hex_value(s[i + k]);
  }
  out = v;
  i += count;
  return true;
}

bool is_trivia(ts_ll::Node n) { return n.is_extra() || n.kind() == "hash_bang_line"; }

}  // namespace

// ============================================================================
// String decoding
// ============================================================================

std::string unescape_js_string(std::string_view s)
{
  std::string out;
  out.reserve(s.size());

  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c != '\\' || i + 1 >= s.size()) {
      out.push_back(c);
      continue;
    }

    const char e = s[++i];
    switch (e) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'v':
        out.push_back('\v');
        break;
      case '0':
        out.push_back('\0');
        break;
      case '\r':
        // Line continuation (\r\n or \r)
        if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
        break;
      case '\n':
        break;
      case 'x': {
        size_t j = i + 1;
        uint32_t cp = 0;
        if (read_hex(s, j, 2, cp)) {
          append_utf8(cp, out);
          i = j - 1;
        } else {
          out.push_back('x');
        }
        break;
      }
      case 'u': {
        size_t j = i + 1;
        uint32_t cp = 0;
        if (j < s.size() && s[j] == '{') {
          ++j;
          cp = 0;
          size_t digits = 0;
          while (j < s.size() && is_hex_digit(s[j]) && digits < 6) {
            cp = (cp << 4) | hex_value(s[j]);
            ++j;
            ++digits;
          }
          if (digits > 0 && j < s.size() && s[j] == '}' && cp <= 0x10FFFF) {
            append_utf8(cp, out);
            i = j;
          } else {
            out.push_back('u');
          }
          break;
        }
        if (!read_hex(s, j, 4, cp)) {
          out.push_back('u');
          break;
        }
        // Surrogate pair
        if (cp >= 0xD800 && cp <= 0xDBFF && j + 1 < s.size() && s[j] == '\\' && s[j + 1] == 'u') {
          size_t k = j + 2;
          uint32_t low = 0;
          if (read_hex(s, k, 4, low) && low >= 0xDC00 && low <= 0xDFFF) {
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            j = k;
          }
        }
        append_utf8(cp, out);
        i = j - 1;
        break;
      }
      default:
        out.push_back(e);
        break;
    }
  }

  return out;
}

// ============================================================================
// Utility
// ============================================================================

std::string_view AstBuilder::node_text(ts_ll::Node n) const { return n.text(source_); }

std::string_view AstBuilder::intern_text(ts_ll::Node n) { return ast_.intern(node_text(n)); }

std::string_view AstBuilder::cook(std::string_view raw)
{
  if (raw.find('\\') == std::string_view::npos) return ast_.intern(raw);
  return ast_.intern(unescape_js_string(raw));
}

// ============================================================================
// Program
// ============================================================================

Program * AstBuilder::build_program(ts_ll::Node program_node)
{
  std::vector<AstNode *> body;
  if (!program_node.is_null()) {
    build_statement_list(program_node, body);
  }
  return ast_.create<Program>(to_span(body), node_range(program_node));
}

void AstBuilder::build_statement_list(ts_ll::Node parent, std::vector<AstNode *> & out)
{
  for (uint32_t i = 0; i < parent.named_child_count(); ++i) {
    const ts_ll::Node child = parent.named_child(i);
    if (is_trivia(child)) continue;
    if (AstNode * stmt = build_statement(child)) {
      out.push_back(stmt);
    }
  }
}

// ============================================================================
// Imports / exports
// ============================================================================

ImportDecl * AstBuilder::build_import_decl(ts_ll::Node import_node)
{
  const ts_ll::Node source_node = import_node.child_by_field("source");
  std::string_view source;
  if (!source_node.is_null()) {
    const std::string_view raw = node_text(source_node);
    source = raw.size() >= 2 ? cook(raw.substr(1, raw.size() - 2)) : std::string_view{};
  }

  std::vector<ImportSpecifier *> specs;
  const ts_ll::Node clause = import_node.first_named_child_of_kind("import_clause");
  if (!clause.is_null()) {
    for (uint32_t i = 0; i < clause.named_child_count(); ++i) {
      const ts_ll::Node part = clause.named_child(i);
      const std::string_view k = part.kind();

      if (k == "identifier") {
        auto * local = ast_.create<BindingIdentifier>(intern_text(part), node_range(part));
        specs.push_back(ast_.create<ImportSpecifier>(
          ImportKind::Default, intern("default"), local, node_range(part)));
      } else if (k == "namespace_import") {
        const ts_ll::Node id = part.first_named_child_of_kind("identifier");
        if (id.is_null()) continue;
        auto * local = ast_.create<BindingIdentifier>(intern_text(id), node_range(id));
        specs.push_back(ast_.create<ImportSpecifier>(
          ImportKind::Namespace, std::string_view{}, local, node_range(part)));
      } else if (k == "named_imports") {
        for (uint32_t j = 0; j < part.named_child_count(); ++j) {
          const ts_ll::Node spec = part.named_child(j);
          if (spec.kind() != "import_specifier") continue;
          const ts_ll::Node name = spec.child_by_field("name");
          const ts_ll::Node alias = spec.child_by_field("alias");
          if (name.is_null()) continue;

          std::string_view imported = intern_text(name);
          if (name.kind() == "string" && imported.size() >= 2) {
            imported = cook(imported.substr(1, imported.size() - 2));
          }
          const ts_ll::Node local_node = alias.is_null() ? name : alias;
          auto * local =
            ast_.create<BindingIdentifier>(intern_text(local_node), node_range(local_node));
          specs.push_back(
            ast_.create<ImportSpecifier>(ImportKind::Named, imported, local, node_range(spec)));
        }
      }
    }
  }

  auto * decl = ast_.create<ImportDecl>(source, to_span(specs), node_range(import_node));
  decl->typeOnly = import_node.has_token("type");
  return decl;
}

namespace
{

std::string_view strip_quotes(std::string_view s)
{
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

}  // namespace

Decl * AstBuilder::build_export_decl(ts_ll::Node export_node)
{
  const SourceRange range = node_range(export_node);

  // export default ...
  if (export_node.has_token("default")) {
    const ts_ll::Node declaration = export_node.child_by_field("declaration");
    const ts_ll::Node value = export_node.child_by_field("value");
    AstNode * inner = nullptr;
    if (!declaration.is_null()) {
      inner = build_statement(declaration);
    } else if (!value.is_null()) {
      inner = build_expr(value);
    }
    return ast_.create<ExportDefaultDecl>(inner, range);
  }

  const ts_ll::Node source_node = export_node.child_by_field("source");
  std::string_view source;
  if (!source_node.is_null()) {
    source = cook(strip_quotes(node_text(source_node)));
  }

  // export * from 'x' / export * as ns from 'x'
  const ts_ll::Node ns_export = export_node.first_named_child_of_kind("namespace_export");
  if (!ns_export.is_null()) {
    std::string_view exported;
    for (uint32_t i = 0; i < ns_export.named_child_count(); ++i) {
      const ts_ll::Node n = ns_export.named_child(i);
      if (n.kind() == "identifier" || n.kind() == "string") {
        exported = intern(strip_quotes(node_text(n)));
      }
    }
    return ast_.create<ExportAllDecl>(source, exported, range);
  }
  if (export_node.has_token("*") && !source_node.is_null()) {
    return ast_.create<ExportAllDecl>(source, std::string_view{}, range);
  }

  auto * decl = ast_.create<ExportNamedDecl>(range);
  decl->source = source;
  decl->hasSource = !source_node.is_null();

  const ts_ll::Node declaration = export_node.child_by_field("declaration");
  if (!declaration.is_null()) {
    decl->declaration = build_statement(declaration);
    return decl;
  }

  std::vector<ExportSpecifier *> specs;
  const ts_ll::Node clause = export_node.first_named_child_of_kind("export_clause");
  if (!clause.is_null()) {
    for (uint32_t i = 0; i < clause.named_child_count(); ++i) {
      const ts_ll::Node spec = clause.named_child(i);
      if (spec.kind() != "export_specifier") continue;
      const ts_ll::Node name = spec.child_by_field("name");
      const ts_ll::Node alias = spec.child_by_field("alias");
      if (name.is_null()) continue;
      const std::string_view local = intern(strip_quotes(node_text(name)));
      const std::string_view exported =
        alias.is_null() ? local : intern(strip_quotes(node_text(alias)));
      specs.push_back(ast_.create<ExportSpecifier>(local, exported, node_range(spec)));
    }
  }
  decl->specifiers = to_span(specs);
  return decl;
}

// ============================================================================
// Variable / function / class declarations
// ============================================================================

VariableDecl * AstBuilder::build_variable_decl(ts_ll::Node decl_node)
{
  VariableKind kind = VariableKind::Var;
  const ts_ll::Node kind_node = decl_node.child_by_field("kind");
  const std::string_view kind_text =
    kind_node.is_null() ? node_text(decl_node.child(0)) : node_text(kind_node);
  if (kind_text == "let") {
    kind = VariableKind::Let;
  } else if (kind_text == "const") {
    kind = VariableKind::Const;
  }

  std::vector<VariableDeclarator *> declarators;
  for (uint32_t i = 0; i < decl_node.named_child_count(); ++i) {
    const ts_ll::Node child = decl_node.named_child(i);
    if (child.kind() != "variable_declarator") continue;
    if (auto * d = build_variable_declarator(child)) {
      declarators.push_back(d);
    }
  }

  return ast_.create<VariableDecl>(kind, to_span(declarators), node_range(decl_node));
}

VariableDeclarator * AstBuilder::build_variable_declarator(ts_ll::Node declarator_node)
{
  const ts_ll::Node name = declarator_node.child_by_field("name");
  if (name.is_null()) return nullptr;

  AstNode * id = build_pattern(name);
  TypeNode * type = build_type_annotation(declarator_node.child_by_field("type"));
  if (type != nullptr) {
    if (auto * bid = dyn_cast<BindingIdentifier>(id)) {
      bid->type = type;
    } else if (auto * op = dyn_cast<ObjectPattern>(id)) {
      op->type = type;
    } else if (auto * ap = dyn_cast<ArrayPattern>(id)) {
      ap->type = type;
    }
  }

  const ts_ll::Node value = declarator_node.child_by_field("value");
  Expr * init = value.is_null() ? nullptr : build_expr(value);
  return ast_.create<VariableDeclarator>(id, init, node_range(declarator_node));
}

FunctionDecl * AstBuilder::build_function_decl(ts_ll::Node fn_node)
{
  const ts_ll::Node name = fn_node.child_by_field("name");
  BindingIdentifier * id = nullptr;
  if (!name.is_null()) {
    id = ast_.create<BindingIdentifier>(intern_text(name), node_range(name));
  }
  FunctionExpr * fn = build_function(fn_node);
  return ast_.create<FunctionDecl>(id, fn, node_range(fn_node));
}

ClassDecl * AstBuilder::build_class_decl(ts_ll::Node class_node)
{
  const ts_ll::Node name = class_node.child_by_field("name");
  BindingIdentifier * id = nullptr;
  if (!name.is_null()) {
    id = ast_.create<BindingIdentifier>(intern_text(name), node_range(name));
  }
  ClassExpr * klass = build_class(class_node);
  return ast_.create<ClassDecl>(id, klass, node_range(class_node));
}

}  // namespace qk_graph
