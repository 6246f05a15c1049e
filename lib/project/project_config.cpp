// qk_graph/project/project_config.cpp - qkg.yaml loading
//
#include "qk_graph/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace qk_graph
{

namespace
{

namespace fs = std::filesystem;

/// Validation failure inside the file; becomes ConfigLoadResult::error
struct InvalidConfig : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

const YAML::Node & expect(const YAML::Node & node, YAML::NodeType::value type, const char * what)
{
  if (node.Type() != type) {
    const char * shape = type == YAML::NodeType::Sequence ? "a list" : "a map";
    throw InvalidConfig(std::string(what) + " must be " + shape);
  }
  return node;
}

fs::path resolve_against(const fs::path & base, const std::string & raw)
{
  fs::path p(raw);
  if (p.is_relative()) p = base / p;
  p = p.lexically_normal();
  return p.has_filename() ? p : p.parent_path();
}

RootConfig read_root(const YAML::Node & entry, const fs::path & base)
{
  RootConfig root;
  if (entry.IsScalar()) {
    root.path = resolve_against(base, entry.as<std::string>());
  } else if (entry.IsMap()) {
    if (!entry["path"]) throw InvalidConfig("invalid root: root entry must have a 'path'");
    root.path = resolve_against(base, entry["path"].as<std::string>());
    if (entry["name"]) root.name = entry["name"].as<std::string>();
  } else {
    throw InvalidConfig("invalid root: root entry must be a path or a map");
  }

  if (root.name.empty()) root.name = root.path.filename().string();
  if (root.name.empty()) root.name = "workspace";
  return root;
}

std::vector<std::string> read_globs(const YAML::Node & node, const char * what)
{
  std::vector<std::string> globs;
  for (const auto & item : expect(node, YAML::NodeType::Sequence, what)) {
    globs.push_back(item.as<std::string>());
  }
  return globs;
}

void read_scan(const YAML::Node & node, ScanConfig & scan)
{
  expect(node, YAML::NodeType::Map, "scan");
  if (node["include"]) scan.include = read_globs(node["include"], "scan.include");
  if (node["exclude"]) scan.exclude = read_globs(node["exclude"], "scan.exclude");
  if (node["respect_gitignore"]) scan.respect_gitignore = node["respect_gitignore"].as<bool>();
  if (node["max_file_size_kb"]) {
    const auto kb = node["max_file_size_kb"].as<int64_t>();
    if (kb <= 0) throw InvalidConfig("scan.max_file_size_kb must be positive");
    scan.max_file_size_kb = static_cast<uint32_t>(kb);
  }
}

ProjectConfig read_config(const YAML::Node & doc, const fs::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;
  if (doc.IsNull()) return config;
  if (!doc.IsMap()) throw InvalidConfig("configuration root must be a map");

  if (doc["roots"]) {
    for (const auto & entry : expect(doc["roots"], YAML::NodeType::Sequence, "roots")) {
      config.roots.push_back(read_root(entry, project_root));
    }
  }
  if (doc["scan"]) read_scan(doc["scan"], config.scan);
  if (doc["output"]) config.output = resolve_against(project_root, doc["output"].as<std::string>());
  return config;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  ConfigLoadResult result;
  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    result.error = "configuration file not found: " + config_path.string();
    return result;
  }

  YAML::Node doc;
  try {
    doc = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    result.error = std::string("failed to parse YAML: ") + e.what();
    return result;
  }

  const fs::path project_root = fs::absolute(config_path, ec).parent_path();
  try {
    result.config = read_config(doc, project_root);
  } catch (const InvalidConfig & e) {
    result.error = e.what();
  } catch (const YAML::Exception & e) {
    // Mistyped scalars (`as<bool>`, `as<int64_t>`)
    result.error = std::string("invalid configuration value: ") + e.what();
  }
  return result;
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start)
{
  std::error_code ec;
  fs::path dir = fs::absolute(start, ec);
  if (ec) return std::nullopt;
  if (fs::is_regular_file(dir, ec)) dir = dir.parent_path();

  for (;;) {
    fs::path candidate = dir / k_project_config_file_name;
    if (fs::exists(candidate, ec)) return candidate;
    if (dir.parent_path() == dir) return std::nullopt;
    dir = dir.parent_path();
  }
}

}  // namespace qk_graph
