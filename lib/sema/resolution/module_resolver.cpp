// qk_graph/sema/resolution/module_resolver.cpp - Module specifier resolution
//
#include "qk_graph/sema/resolution/module_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace qk_graph
{

namespace fs = std::filesystem;

namespace
{

std::string parent_dir(std::string_view path)
{
  return fs::path(std::string(path)).parent_path().generic_string();
}

bool is_regular_file(const fs::path & path)
{
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

bool has_resolve_extension(std::string_view path)
{
  return std::any_of(
    std::begin(k_resolve_extensions), std::end(k_resolve_extensions), [&](std::string_view ext) {
      return path.size() >= ext.size() && path.substr(path.size() - ext.size()) == ext;
    });
}

/// `base+ext` for every extension, then `base/index+ext`
std::vector<std::string> module_candidates(const std::string & base)
{
  std::vector<std::string> out;
  if (has_resolve_extension(base)) {
    out.push_back(base);
    return out;
  }
  for (std::string_view ext : k_resolve_extensions) {
    out.push_back(base + std::string(ext));
  }
  for (std::string_view ext : k_resolve_extensions) {
    out.push_back(base + "/index" + std::string(ext));
  }
  return out;
}

std::optional<std::string> read_text_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return std::nullopt;
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool is_relative_specifier(std::string_view s)
{
  return s.substr(0, 2) == "./" || s.substr(0, 3) == "../";
}

std::vector<std::string_view> split_segments(std::string_view path)
{
  std::vector<std::string_view> out;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string_view::npos) next = path.size();
    if (next > pos) out.push_back(path.substr(pos, next - pos));
    pos = next + 1;
  }
  return out;
}

}  // namespace

// ============================================================================
// JSON with comments
// ============================================================================

std::string strip_trailing_commas(std::string_view text)
{
  std::string out;
  out.reserve(text.size());

  // Skips whitespace and comments starting at `i`
  auto skip_trivia = [&](size_t i) {
    while (i < text.size()) {
      if (std::isspace(static_cast<unsigned char>(text[i]))) {
        ++i;
      } else if (text.compare(i, 2, "//") == 0) {
        i = text.find('\n', i);
        if (i == std::string_view::npos) return text.size();
      } else if (text.compare(i, 2, "/*") == 0) {
        i = text.find("*/", i + 2);
        if (i == std::string_view::npos) return text.size();
        i += 2;
      } else {
        break;
      }
    }
    return i;
  };

  bool in_string = false;
  bool escaped = false;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (in_string) {
      out += c;
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }

    if (c == '"') {
      in_string = true;
      out += c;
      continue;
    }

    // Copy comments verbatim so that commas inside them are left alone
    if (text.compare(i, 2, "//") == 0 || text.compare(i, 2, "/*") == 0) {
      const size_t end = skip_trivia(i);
      out.append(text.substr(i, end - i));
      i = end - 1;
      continue;
    }

    if (c == ',') {
      const size_t next = skip_trivia(i + 1);
      if (next < text.size() && (text[next] == '}' || text[next] == ']')) {
        continue;
      }
    }
    out += c;
  }
  return out;
}

std::optional<nlohmann::json> parse_jsonc_object(std::string_view text)
{
  const std::string clean = strip_trailing_commas(text);
  if (clean.find_first_not_of(" \t\r\n") == std::string::npos) return std::nullopt;

  nlohmann::json parsed = nlohmann::json::parse(
    clean, /*cb=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
  if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
  return parsed;
}

// ============================================================================
// Alias matching
// ============================================================================

std::optional<std::string> alias_capture(std::string_view pattern, std::string_view source)
{
  const size_t star = pattern.find('*');
  if (star == std::string_view::npos) {
    if (pattern == source) return std::string();
    return std::nullopt;
  }

  const std::string_view prefix = pattern.substr(0, star);
  const std::string_view suffix = pattern.substr(star + 1);
  if (source.size() < prefix.size() + suffix.size()) return std::nullopt;
  if (source.substr(0, prefix.size()) != prefix) return std::nullopt;
  if (source.substr(source.size() - suffix.size()) != suffix) return std::nullopt;

  return std::string(source.substr(prefix.size(), source.size() - prefix.size() - suffix.size()));
}

size_t common_path_prefix_length(std::string_view left, std::string_view right)
{
  const auto l = split_segments(left);
  const auto r = split_segments(right);
  const size_t limit = std::min(l.size(), r.size());
  size_t count = 0;
  while (count < limit && l[count] == r[count]) ++count;
  return count;
}

// ============================================================================
// ModuleResolver
// ============================================================================

ModuleResolver::ModuleResolver(const SymbolIndex & index, std::vector<std::string> workspace_roots)
: index_(index)
{
  for (const auto & root : workspace_roots) {
    roots_.push_back(normalize_analyzer_path(root));
  }
}

std::string ModuleResolver::workspace_root_for(std::string_view file) const
{
  const std::string * best = nullptr;
  for (const auto & root : roots_) {
    const bool inside = file.size() > root.size() && file.substr(0, root.size()) == root &&
                        (file[root.size()] == '/' || root.back() == '/');
    if (inside && (best == nullptr || root.size() > best->size())) best = &root;
  }
  return best ? *best : parent_dir(file);
}

std::optional<std::string> ModuleResolver::resolve(
  std::string_view from_file, std::string_view specifier)
{
  std::string key = parent_dir(from_file);
  key += '\n';
  key.append(specifier);

  auto it = resolved_.find(key);
  if (it != resolved_.end()) return it->second;

  std::optional<std::string> result;
  if (is_relative_specifier(specifier) || fs::path(std::string(specifier)).is_absolute()) {
    result = resolve_relative(from_file, specifier);
  } else {
    result = resolve_alias(from_file, specifier);
  }

  resolved_.emplace(std::move(key), result);
  return result;
}

std::optional<std::string> ModuleResolver::resolve_relative(
  std::string_view from_file, std::string_view specifier) const
{
  const fs::path spec{std::string(specifier)};
  const fs::path base = spec.is_absolute() ? spec : fs::path(parent_dir(from_file)) / spec;

  for (const auto & candidate : module_candidates(base.generic_string())) {
    std::string normalized = normalize_analyzer_path(candidate);
    if (has_file(normalized)) return normalized;
  }
  return std::nullopt;
}

std::optional<std::string> ModuleResolver::resolve_alias(
  std::string_view from_file, std::string_view specifier)
{
  std::vector<std::string> matches;
  for (const auto & entry : alias_entries(from_file)) {
    const auto captured = alias_capture(entry.pattern, specifier);
    if (!captured) continue;

    for (const auto & target_pattern : entry.targets) {
      std::string target;
      for (char c : target_pattern) {
        if (c == '*') {
          target += *captured;
        } else {
          target += c;
        }
      }

      for (const auto & candidate : module_candidates(target)) {
        std::string normalized = normalize_analyzer_path(candidate);
        if (has_file(normalized) &&
            std::find(matches.begin(), matches.end(), normalized) == matches.end()) {
          matches.push_back(std::move(normalized));
        }
      }
    }
  }

  if (matches.empty()) return std::nullopt;

  // Rank by proximity to the importing file
  struct Ranked
  {
    const std::string * path;
    size_t common;
    size_t up;
    size_t distance;
  };

  const std::string from_dir = parent_dir(normalize_analyzer_path(std::string(from_file)));
  std::vector<Ranked> ranked;
  for (const auto & m : matches) {
    const std::string dir = parent_dir(m);
    const fs::path rel = fs::path(dir).lexically_relative(from_dir);
    size_t up = 0;
    size_t distance = 0;
    for (const auto & part : rel) {
      const std::string s = part.generic_string();
      if (s.empty() || s == ".") continue;
      if (s == "..") ++up;
      ++distance;
    }
    ranked.push_back(Ranked{&m, common_path_prefix_length(from_dir, dir), up, distance});
  }

  std::sort(ranked.begin(), ranked.end(), [](const Ranked & a, const Ranked & b) {
    if (a.common != b.common) return a.common > b.common;
    if (a.up != b.up) return a.up < b.up;
    if (a.distance != b.distance) return a.distance < b.distance;
    if (a.path->size() != b.path->size()) return a.path->size() < b.path->size();
    return *a.path < *b.path;
  });

  return *ranked.front().path;
}

// ============================================================================
// tsconfig / jsconfig
// ============================================================================

std::optional<std::string> ModuleResolver::find_nearest_config(std::string_view from_file)
{
  const std::string file = normalize_analyzer_path(std::string(from_file));
  const std::string root = workspace_root_for(file);
  const std::string start = parent_dir(file);

  std::string key = root;
  key += "::";
  key += start;
  auto it = nearest_config_.find(key);
  if (it != nearest_config_.end()) return it->second;

  std::optional<std::string> found;
  fs::path cursor = start;
  while (true) {
    for (const char * name : {"tsconfig.json", "jsconfig.json"}) {
      if (is_regular_file(cursor / name)) {
        found = normalize_analyzer_path(cursor / name);
        break;
      }
    }
    if (found || cursor.generic_string() == root) break;

    fs::path parent = cursor.parent_path();
    if (parent == cursor) break;
    cursor = parent;
  }

  nearest_config_.emplace(std::move(key), found);
  return found;
}

std::optional<std::string> ModuleResolver::resolve_extends(
  const std::string & config_dir, const std::string & extends_value) const
{
  std::string value = extends_value;
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);
  if (value.empty()) return std::nullopt;

  const bool ends_with_json = value.size() >= 5 && value.compare(value.size() - 5, 5, ".json") == 0;

  if (is_relative_specifier(value) || fs::path(value).is_absolute()) {
    const fs::path base =
      fs::path(value).is_absolute() ? fs::path(value) : fs::path(config_dir) / value;
    std::vector<fs::path> candidates{base};
    if (!ends_with_json) candidates.emplace_back(base.string() + ".json");
    for (const auto & c : candidates) {
      if (is_regular_file(c)) return normalize_analyzer_path(c);
    }
    return std::nullopt;
  }

  // Package reference: look through node_modules of every ancestor
  const std::vector<std::string> package_candidates{
    value, value + ".json", value + "/tsconfig.json"};
  for (fs::path dir = config_dir;; dir = dir.parent_path()) {
    for (const auto & candidate : package_candidates) {
      const fs::path p = dir / "node_modules" / candidate;
      if (is_regular_file(p)) return normalize_analyzer_path(p);
    }
    if (dir.parent_path() == dir || dir.empty()) break;
  }
  return std::nullopt;
}

const PathAliasConfig & ModuleResolver::load_alias_config(
  const std::string & config_path, std::unordered_set<std::string> & seen)
{
  static const PathAliasConfig k_empty;

  const std::string normalized = normalize_analyzer_path(config_path);
  if (auto it = parsed_configs_.find(normalized); it != parsed_configs_.end()) {
    return it->second;
  }
  if (!seen.insert(normalized).second) return k_empty;

  std::optional<nlohmann::json> raw;
  if (auto text = read_text_file(normalized)) raw = parse_jsonc_object(*text);

  const std::string config_dir = parent_dir(normalized);
  PathAliasConfig merged;

  if (raw && raw->contains("extends") && (*raw)["extends"].is_string()) {
    if (auto parent = resolve_extends(config_dir, (*raw)["extends"].get<std::string>())) {
      merged = load_alias_config(*parent, seen);
    }
  }

  const nlohmann::json * options = nullptr;
  if (raw) {
    auto it = raw->find("compilerOptions");
    if (it != raw->end() && it->is_object()) options = &*it;
  }

  if (options != nullptr) {
    auto base_url = options->find("baseUrl");
    if (base_url != options->end() && base_url->is_string()) {
      merged.baseUrl =
        normalize_analyzer_path(fs::path(config_dir) / base_url->get<std::string>());
    }

    auto paths = options->find("paths");
    if (paths != options->end() && paths->is_object()) {
      const std::string base_path = merged.baseUrl.value_or(config_dir);
      for (const auto & [pattern, value] : paths->items()) {
        if (pattern.empty() || !value.is_array()) continue;

        std::vector<std::string> targets;
        for (const auto & item : value) {
          if (!item.is_string()) continue;
          const fs::path target = item.get<std::string>();
          targets.push_back(
            normalize_analyzer_path(target.is_absolute() ? target : fs::path(base_path) / target));
        }
        if (!targets.empty()) merged.paths[pattern] = std::move(targets);
      }
    }
  }

  return parsed_configs_.emplace(normalized, std::move(merged)).first->second;
}

const std::vector<PathAliasEntry> & ModuleResolver::alias_entries(std::string_view from_file)
{
  static const std::vector<PathAliasEntry> k_none;

  const auto config = find_nearest_config(from_file);
  if (!config) return k_none;

  if (auto it = alias_entries_.find(*config); it != alias_entries_.end()) {
    return it->second;
  }

  std::unordered_set<std::string> seen;
  const PathAliasConfig & resolved = load_alias_config(*config, seen);

  std::vector<PathAliasEntry> entries;
  for (const auto & [pattern, targets] : resolved.paths) {
    entries.push_back(PathAliasEntry{pattern, targets});
  }
  std::sort(entries.begin(), entries.end(), [](const PathAliasEntry & a, const PathAliasEntry & b) {
    const bool a_wild = a.pattern.find('*') != std::string::npos;
    const bool b_wild = b.pattern.find('*') != std::string::npos;
    if (a_wild != b_wild) return !a_wild;
    if (a.pattern.size() != b.pattern.size()) return a.pattern.size() > b.pattern.size();
    return a.pattern < b.pattern;
  });

  return alias_entries_.emplace(*config, std::move(entries)).first->second;
}

}  // namespace qk_graph
