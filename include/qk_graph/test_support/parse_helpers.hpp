// qk_graph/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parse unit for front-end tests and an in-memory project
// for resolution, normalization and classification tests. Paths are
// virtual: nothing is read from disk.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qk_graph/ast/ast_context.hpp"
#include "qk_graph/ast/visitor.hpp"
#include "qk_graph/basic/diagnostic.hpp"
#include "qk_graph/basic/source_manager.hpp"
#include "qk_graph/sema/analysis/call_site_classifier.hpp"
#include "qk_graph/sema/keys/key_normalizer.hpp"
#include "qk_graph/sema/resolution/local_binding_resolver.hpp"
#include "qk_graph/sema/resolution/module_resolver.hpp"
#include "qk_graph/sema/resolution/reference_resolver.hpp"
#include "qk_graph/sema/resolution/symbol_table_builder.hpp"
#include "qk_graph/syntax/frontend.hpp"

namespace qk_graph::test_support
{

/// Root every virtual test file lives under
inline constexpr const char * k_virtual_root = "/virtual";

// ============================================================================
// Single file
// ============================================================================

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  std::unique_ptr<BindingTable> bindings;
  DiagnosticBag diags;
  Program * program = nullptr;
  std::string error_message;

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }
};

/**
 * Parse and bind one source.
 *
 * Note: the path extension selects the grammar tried first.
 */
[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "/virtual/test.tsx")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();
  out.bindings = std::make_unique<BindingTable>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  out.error_message = parsed.error_message;
  if (out.program != nullptr) {
    LocalBindingResolver(*out.bindings).resolve(*out.program);
  }
  return out;
}

// ============================================================================
// AST lookups
// ============================================================================

/// First `name = <init>` declarator of a program (any depth)
class DeclaratorFinder : public ConstRecursiveAstVisitor<DeclaratorFinder>
{
public:
  explicit DeclaratorFinder(std::string_view name) : name_(name) {}

  bool visit_variable_declarator(const VariableDeclarator * node)
  {
    const auto * id = dyn_cast<BindingIdentifier>(node->id);
    if (found == nullptr && id != nullptr && id->name == name_) found = node;
    return ConstRecursiveAstVisitor::visit_variable_declarator(node);
  }

  const VariableDeclarator * found = nullptr;

private:
  std::string_view name_;
};

/// Initializer of the first declarator named `name`, or nullptr
[[nodiscard]] inline const Expr * find_initializer(const Program * program, std::string_view name)
{
  if (program == nullptr) return nullptr;
  DeclaratorFinder finder(name);
  finder.visit(program);
  return finder.found != nullptr ? finder.found->init : nullptr;
}

// ============================================================================
// In-memory project
// ============================================================================

/**
 * Several parsed files with the full resolution stack on top.
 *
 * @code
 *   auto project = make_project({{"src/keys.ts", "export const k = ['a'];"},
 *                                {"src/use.ts", "import { k } from './keys';"}});
 *   auto records = project->classify("src/use.ts");
 * @endcode
 */
struct TestProject
{
  struct File
  {
    std::string path;
    FileId id;
    Program * program = nullptr;
  };

  SourceRegistry sources;
  std::unique_ptr<AstContext> ast = std::make_unique<AstContext>();
  std::unique_ptr<AstContext> scratch = std::make_unique<AstContext>();
  DiagnosticBag diags;
  std::vector<std::unique_ptr<BindingTable>> bindings;
  std::vector<File> files;
  std::vector<std::pair<std::string, std::string>> failures;

  std::unique_ptr<SymbolIndex> index = std::make_unique<SymbolIndex>();
  std::unique_ptr<ModuleResolver> modules;
  std::unique_ptr<ReferenceResolver> resolver;
  std::unique_ptr<KeyNormalizer> normalizer;

  /// File by root-relative or absolute path
  [[nodiscard]] const File * file(std::string_view path) const
  {
    const std::string wanted = absolute_path(path);
    for (const File & f : files) {
      if (f.path == wanted) return &f;
    }
    return nullptr;
  }

  [[nodiscard]] const Expr * initializer(std::string_view path, std::string_view name) const
  {
    const File * f = file(path);
    return f != nullptr ? find_initializer(f->program, name) : nullptr;
  }

  /// Normalize the initializer of `name` in `path`
  [[nodiscard]] NormalizedKey normalize(
    std::string_view path, std::string_view name, NormalizeOptions options = {})
  {
    return normalizer->normalize(initializer(path, name), options);
  }

  [[nodiscard]] std::vector<CallSiteRecord> classify(std::string_view path)
  {
    const File * f = file(path);
    if (f == nullptr) return {};
    CallSiteClassifier classifier(sources, *normalizer);
    return classifier.classify(*f->program, f->id);
  }

  [[nodiscard]] std::vector<CallSiteRecord> classify_all()
  {
    std::vector<CallSiteRecord> out;
    for (const File & f : files) {
      CallSiteClassifier classifier(sources, *normalizer);
      for (CallSiteRecord & r : classifier.classify(*f.program, f.id)) out.push_back(std::move(r));
    }
    return out;
  }

  [[nodiscard]] static std::string absolute_path(std::string_view path)
  {
    if (!path.empty() && path.front() == '/') return std::string(path);
    return std::string(k_virtual_root) + "/" + std::string(path);
  }
};

/**
 * Parse and index `files` (root-relative path, source) under /virtual.
 *
 * Files that fail to parse are listed in TestProject::failures.
 */
[[nodiscard]] inline std::unique_ptr<TestProject> make_project(
  const std::vector<std::pair<std::string, std::string>> & files)
{
  auto project = std::make_unique<TestProject>();

  for (const auto & [rel, text] : files) {
    const std::string path = TestProject::absolute_path(rel);
    const ParseOutput parsed =
      parse_source(project->sources, path, text, *project->ast, project->diags);
    if (!parsed.ok()) {
      project->failures.emplace_back(path, parsed.error_message);
      continue;
    }
    project->bindings.push_back(std::make_unique<BindingTable>());
    LocalBindingResolver(*project->bindings.back()).resolve(*parsed.program);
    project->files.push_back({path, parsed.file_id, parsed.program});
  }

  for (const TestProject::File & f : project->files) {
    project->index->add(build_file_symbols(f.path, f.id, *f.program));
  }

  project->modules = std::make_unique<ModuleResolver>(
    *project->index, std::vector<std::string>{k_virtual_root});
  project->resolver = std::make_unique<ReferenceResolver>(*project->index, *project->modules);
  project->normalizer = std::make_unique<KeyNormalizer>(project->resolver.get(), *project->scratch);
  return project;
}

/// Single-file project
[[nodiscard]] inline std::unique_ptr<TestProject> make_single_file_project(std::string source)
{
  return make_project({{"src/test.tsx", std::move(source)}});
}

}  // namespace qk_graph::test_support
