// qk_graph/driver/analyzer.cpp - Analysis driver implementation
//
#include "qk_graph/driver/analyzer.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>

#include "qk_graph/ast/ast_context.hpp"
#include "qk_graph/sema/analysis/call_site_classifier.hpp"
#include "qk_graph/sema/keys/key_normalizer.hpp"
#include "qk_graph/sema/resolution/local_binding_resolver.hpp"
#include "qk_graph/sema/resolution/module_resolver.hpp"
#include "qk_graph/sema/resolution/reference_resolver.hpp"
#include "qk_graph/sema/resolution/symbol_table_builder.hpp"
#include "qk_graph/syntax/frontend.hpp"

namespace qk_graph
{

namespace
{

namespace fs = std::filesystem;

struct ParsedFile
{
  std::string path;
  FileId file_id;
  Program * program;
};

std::optional<std::string> read_source_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return std::nullopt;
  return ss.str();
}

/// Unreadable files are reported as parse errors
template <typename Paths>
std::vector<SourceInput> read_inputs(const Paths & files, AnalysisResult & result)
{
  std::vector<SourceInput> inputs;
  inputs.reserve(files.size());
  for (const fs::path & file : files) {
    auto text = read_source_file(file);
    if (!text) {
      const std::string path = normalize_analyzer_path(file);
      result.scannedFiles.push_back(path);
      result.parseErrors.push_back({path, "Cannot read file"});
      result.diagnostics.report_error(SourceRange{}, "cannot read file")
        .with_code("unreadable-file")
        .with_path(path);
      continue;
    }
    inputs.push_back({file, std::move(*text)});
  }
  return inputs;
}

void note(AnalysisResult & result, const AnalyzeOptions & options, std::string message)
{
  if (!options.verbose) return;
  result.diagnostics.report_note(std::move(message));
}

}  // namespace

// ============================================================================
// Roots
// ============================================================================

std::vector<WorkspaceRoot> make_workspace_roots(const std::vector<fs::path> & dirs)
{
  std::vector<WorkspaceRoot> roots;
  std::set<std::string> used;
  for (const fs::path & dir : dirs) {
    const fs::path normalized(normalize_analyzer_path(dir));
    std::string base = normalized.filename().string();
    if (base.empty()) base = "workspace";

    std::string name = base;
    for (int n = 2; used.count(name) > 0; ++n) {
      name = fmt::format("{}-{}", base, n);
    }
    used.insert(name);
    roots.push_back({std::move(name), normalized});
  }
  return roots;
}

std::vector<WorkspaceRoot> workspace_roots_from_config(const ProjectConfig & config)
{
  if (config.roots.empty()) {
    if (config.project_root.empty()) return {};
    return make_workspace_roots({config.project_root});
  }

  std::vector<WorkspaceRoot> roots;
  roots.reserve(config.roots.size());
  for (const RootConfig & root : config.roots) {
    roots.push_back({root.name, fs::path(normalize_analyzer_path(root.path))});
  }
  return roots;
}

// ============================================================================
// Analyzer
// ============================================================================

AnalysisResult Analyzer::analyze_project(const AnalyzeOptions & options)
{
  AnalysisResult result;

  if (options.roots.empty()) {
    result.diagnostics.report_error(SourceRange{}, "no analysis roots given")
      .with_help("pass a directory or list roots in qkg.yaml");
    return result;
  }

  std::set<fs::path> files;
  for (const WorkspaceRoot & root : options.roots) {
    CollectResult collected = collect_files(root.path, options.scan);
    for (const std::string & error : collected.errors) {
      result.diagnostics.report_warning(SourceRange{}, error)
        .with_note(fmt::format("while scanning root '{}'", root.name));
    }
    for (SkippedFile & skipped : collected.skipped) {
      note(
        result, options,
        fmt::format("skipped {}: {}", skipped.path.generic_string(), skipped.reason));
      result.skipped.push_back(std::move(skipped));
    }
    note(
      result, options,
      fmt::format("root '{}': {} files selected", root.name, collected.files.size()));
    files.insert(collected.files.begin(), collected.files.end());
  }

  run_pipeline(read_inputs(files, result), options, result);
  return result;
}

AnalysisResult Analyzer::analyze_files(
  const std::vector<fs::path> & files, const AnalyzeOptions & options)
{
  AnalysisResult result;
  run_pipeline(read_inputs(files, result), options, result);
  return result;
}

AnalysisResult Analyzer::analyze_sources(
  std::vector<SourceInput> inputs, const AnalyzeOptions & options)
{
  AnalysisResult result;
  run_pipeline(std::move(inputs), options, result);
  return result;
}

void Analyzer::run_pipeline(
  std::vector<SourceInput> inputs, const AnalyzeOptions & options, AnalysisResult & result)
{
  SourceRegistry & sources = *result.sources;

  // Phase 1: parse and bind every file. Programs live in one arena for the run.
  AstContext ast;
  std::vector<std::unique_ptr<BindingTable>> binding_tables;
  std::vector<ParsedFile> parsed;
  parsed.reserve(inputs.size());

  for (SourceInput & input : inputs) {
    const std::string path = normalize_analyzer_path(input.path);
    result.scannedFiles.push_back(path);

    const ParseOutput out =
      parse_source(sources, fs::path(path), std::move(input.text), ast, result.diagnostics);
    if (!out.ok()) {
      result.parseErrors.push_back({path, out.error_message});
      continue;
    }

    binding_tables.push_back(std::make_unique<BindingTable>());
    LocalBindingResolver(*binding_tables.back()).resolve(*out.program);
    parsed.push_back({path, out.file_id, out.program});
  }
  note(
    result, options,
    fmt::format(
      "parsed {} files ({} failed, {} AST nodes)", parsed.size(), result.parseErrors.size(),
      ast.node_count()));

  // Phase 2: symbol index over every parsed file
  SymbolIndex index;
  for (const ParsedFile & file : parsed) {
    index.add(build_file_symbols(file.path, file.file_id, *file.program));
  }

  // Phase 3: classification against the finished index
  std::vector<std::string> root_paths;
  root_paths.reserve(options.roots.size());
  for (const WorkspaceRoot & root : options.roots) {
    root_paths.push_back(normalize_analyzer_path(root.path));
  }

  ModuleResolver modules(index, std::move(root_paths));
  ReferenceResolver resolver(index, modules);
  AstContext scratch;
  KeyNormalizer normalizer(&resolver, scratch);
  CallSiteClassifier classifier(sources, normalizer);

  for (const ParsedFile & file : parsed) {
    std::vector<CallSiteRecord> records = classifier.classify(*file.program, file.file_id);
    std::move(records.begin(), records.end(), std::back_inserter(result.records));
  }
  note(result, options, fmt::format("classified {} call sites", result.records.size()));

  // Phase 4: graph
  result.graph = build_graph(options.roots, result.records, result.parseErrors);
  note(
    result, options,
    fmt::format(
      "graph: {} files, {} actions, {} query keys", result.graph.summary.files,
      result.graph.summary.actions, result.graph.summary.queryKeys));

  result.success = true;
}

}  // namespace qk_graph
