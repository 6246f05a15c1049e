// qkg - Query-key cache graph command line interface
//
// Usage:
//   qkg analyze [options] [roots...]
//   qkg keys [options] <file>
//
#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "qk_graph/basic/diagnostic_printer.hpp"
#include "qk_graph/driver/analyzer.hpp"
#include "qk_graph/graph/graph_json.hpp"
#include "qk_graph/project/project_config.hpp"
#include "qk_graph/sema/resolution/symbol_table.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr const char * k_version = "0.1.0";

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "qkg - query-key cache graph analyzer v" << k_version << "\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  analyze [roots...]       Analyze roots and write the graph as JSON\n"
            << "  keys <file>              List the classified call sites of one file\n\n"
            << "Options:\n"
            << "  -o, --output <file>      Output file (default: stdout)\n"
            << "  -c, --config <file>      Configuration file (default: nearest qkg.yaml)\n"
            << "  --root <dir>             Analysis root for 'keys' (repeatable)\n"
            << "  --include <globs>        Include globs, comma separated (repeatable)\n"
            << "  --exclude <globs>        Exclude globs, comma separated (repeatable)\n"
            << "  --no-gitignore           Do not apply .gitignore files\n"
            << "  --max-file-size <kb>     Skip files larger than this many KB\n"
            << "  --json                   'keys': print records as JSON\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n"
            << "  --version                Show the version\n";
}

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }

void print_diagnostics(const qk_graph::AnalysisResult & result)
{
  if (result.diagnostics.empty()) return;
  qk_graph::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print_all(result.diagnostics, *result.sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::vector<std::string> roots;
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::string output_path;
  std::string config_path;
  std::optional<uint32_t> max_file_size_kb;
  bool no_gitignore = false;
  bool json = false;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;

  /// Usage problem found while parsing
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }
  if (args.command == "--version") {
    args.show_version = true;
    return args;
  }

  const auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 >= argc) {
      args.error = fmt::format("missing value for {}", flag);
      return std::nullopt;
    }
    return std::string(argv[++i]);
  };

  for (int i = 2; i < argc && args.error.empty(); ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (auto value = take_value(i, arg)) args.output_path = *value;
    } else if (arg == "-c" || arg == "--config") {
      if (auto value = take_value(i, arg)) args.config_path = *value;
    } else if (arg == "--root") {
      if (auto value = take_value(i, arg)) args.roots.push_back(*value);
    } else if (arg == "--include") {
      if (auto value = take_value(i, arg)) args.include.push_back(*value);
    } else if (arg == "--exclude") {
      if (auto value = take_value(i, arg)) args.exclude.push_back(*value);
    } else if (arg == "--max-file-size") {
      auto value = take_value(i, arg);
      if (!value) break;
      try {
        const unsigned long kb = std::stoul(*value);
        if (kb == 0 || kb > UINT32_MAX) throw std::out_of_range("max-file-size");
        args.max_file_size_kb = static_cast<uint32_t>(kb);
      } catch (const std::exception &) {
        args.error = fmt::format("invalid value for --max-file-size: '{}'", *value);
      }
    } else if (arg == "--no-gitignore") {
      args.no_gitignore = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "--version") {
      args.show_version = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = fmt::format("unknown option '{}'", arg);
    } else {
      args.positional.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// Config named by --config, else the nearest qkg.yaml above `start`
std::optional<qk_graph::ProjectConfig> load_config(
  const CommandArgs & args, const fs::path & start, bool & failed)
{
  failed = false;

  fs::path config_path;
  if (!args.config_path.empty()) {
    config_path = args.config_path;
  } else if (auto found = qk_graph::find_project_config(start)) {
    config_path = *found;
  } else {
    return std::nullopt;
  }

  const auto loaded = qk_graph::load_project_config(config_path);
  if (!loaded) {
    std::cerr << "error: " << config_path.string() << ": " << loaded.error << "\n";
    failed = true;
    return std::nullopt;
  }
  if (args.verbose) {
    qk_graph::DiagnosticPrinter(std::cerr, stderr_is_tty())
      .print_status(fmt::format("using {}", config_path.string()));
  }
  return loaded.config;
}

/// Command-line flags applied on top of the configuration
qk_graph::AnalyzeOptions make_options(
  const CommandArgs & args, const std::optional<qk_graph::ProjectConfig> & config,
  const std::vector<std::string> & cli_roots)
{
  qk_graph::AnalyzeOptions options;
  options.verbose = args.verbose;

  if (config) options.scan = config->scan;
  if (!args.include.empty()) options.scan.include = args.include;
  if (!args.exclude.empty()) options.scan.exclude = args.exclude;
  if (args.no_gitignore) options.scan.respect_gitignore = false;
  if (args.max_file_size_kb) options.scan.max_file_size_kb = *args.max_file_size_kb;

  if (!cli_roots.empty()) {
    std::vector<fs::path> dirs(cli_roots.begin(), cli_roots.end());
    options.roots = qk_graph::make_workspace_roots(dirs);
  } else if (config) {
    options.roots = qk_graph::workspace_roots_from_config(*config);
  }
  if (options.roots.empty()) {
    std::error_code ec;
    options.roots = qk_graph::make_workspace_roots({fs::current_path(ec)});
  }
  return options;
}

bool write_output(const std::string & path, const std::string & content)
{
  if (path.empty()) {
    std::cout << content << "\n";
    return true;
  }
  std::ofstream out(path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << path << "\n";
    return false;
  }
  out << content << "\n";
  return static_cast<bool>(out);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_analyze(const CommandArgs & args)
{
  for (const std::string & root : args.positional) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
      std::cerr << "error: not a directory: " << root << "\n";
      return 1;
    }
  }

  std::vector<std::string> cli_roots = args.positional;
  cli_roots.insert(cli_roots.end(), args.roots.begin(), args.roots.end());

  std::error_code ec;
  const fs::path start = cli_roots.empty() ? fs::current_path(ec) : fs::path(cli_roots.front());
  bool config_failed = false;
  const auto config = load_config(args, start, config_failed);
  if (config_failed) return 1;

  const qk_graph::AnalyzeOptions options = make_options(args, config, cli_roots);
  const qk_graph::AnalysisResult result = qk_graph::Analyzer::analyze_project(options);
  print_diagnostics(result);
  if (!result.success) return 1;

  std::string output_path = args.output_path;
  if (output_path.empty() && config && !config->output.empty()) {
    output_path = config->output.string();
  }
  if (!write_output(output_path, qk_graph::to_json(result.graph).dump(2))) return 1;

  if (args.verbose) {
    qk_graph::DiagnosticPrinter(std::cerr, stderr_is_tty())
      .print_status(fmt::format(
        "{} files scanned, {} call sites, {} parse errors{}", result.files_scanned(),
        result.records.size(), result.parseErrors.size(),
        output_path.empty() ? std::string() : fmt::format(", wrote {}", output_path)));
  }
  return 0;
}

int cmd_keys(const CommandArgs & args)
{
  if (args.positional.size() != 1) {
    std::cerr << "error: exactly one source file required\n";
    std::cerr << "usage: qkg keys [--root <dir>] <file>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.positional.front());
  std::error_code ec;
  if (!fs::is_regular_file(input_path, ec)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  bool config_failed = false;
  const auto config = load_config(args, input_path.parent_path(), config_failed);
  if (config_failed) return 1;

  qk_graph::AnalyzeOptions options = make_options(args, config, args.roots);

  // The whole project is analysed so imports of the file resolve
  std::set<fs::path> files;
  files.insert(input_path.lexically_normal());
  for (const qk_graph::WorkspaceRoot & root : options.roots) {
    const qk_graph::CollectResult collected = qk_graph::collect_files(root.path, options.scan);
    files.insert(collected.files.begin(), collected.files.end());
  }

  const qk_graph::AnalysisResult result = qk_graph::Analyzer::analyze_files(
    std::vector<fs::path>(files.begin(), files.end()), options);
  print_diagnostics(result);
  if (!result.success) return 1;

  const std::string target = qk_graph::normalize_analyzer_path(input_path);

  if (args.json) {
    nlohmann::json records = nlohmann::json::array();
    for (const qk_graph::CallSiteRecord & record : result.records) {
      if (record.file == target) records.push_back(qk_graph::to_json(record));
    }
    return write_output(args.output_path, records.dump(2)) ? 0 : 1;
  }

  std::string text;
  for (const qk_graph::CallSiteRecord & record : result.records) {
    if (record.file != target) continue;
    text += fmt::format(
      "{}:{}  {:<11} {:<24} {}  [{}, {}]\n", record.line, record.column,
      qk_graph::to_string(record.relation), record.operation, record.queryKey.display,
      qk_graph::to_string(record.queryKey.matchMode), qk_graph::to_string(record.resolution));
  }
  if (!text.empty()) text.pop_back();
  return write_output(args.output_path, text) ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_version) {
    std::cout << "qkg " << k_version << "\n";
    return 0;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "analyze") {
    return cmd_analyze(args);
  }

  if (args.command == "keys") {
    return cmd_keys(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
