// qk_graph/driver/file_collector.cpp - Source file discovery
//
#include "qk_graph/driver/file_collector.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

namespace qk_graph
{

namespace fs = std::filesystem;

namespace
{

std::string_view trim(std::string_view text)
{
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_path(std::string_view path)
{
  std::vector<std::string_view> out;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string_view::npos) next = path.size();
    const std::string_view segment = path.substr(pos, next - pos);
    if (!segment.empty() && segment != ".") out.push_back(segment);
    pos = next + 1;
  }
  return out;
}

/// `[...]` at `p`; advances `p` past the class. Returns false on a malformed class.
bool match_class(std::string_view pattern, size_t & p, char c, bool & matched)
{
  size_t i = p + 1;
  bool negate = false;
  if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
    negate = true;
    ++i;
  }

  bool hit = false;
  bool first = true;
  for (; i < pattern.size(); ++i) {
    if (pattern[i] == ']' && !first) break;
    first = false;
    if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
      if (c >= pattern[i] && c <= pattern[i + 2]) hit = true;
      i += 2;
    } else if (pattern[i] == c) {
      hit = true;
    }
  }
  if (i >= pattern.size()) return false;

  p = i + 1;
  matched = hit != negate;
  return true;
}

bool match_segment(std::string_view pattern, std::string_view text)
{
  size_t p = 0;
  size_t t = 0;
  size_t star_p = std::string_view::npos;
  size_t star_t = 0;

  while (t < text.size()) {
    if (p < pattern.size()) {
      const char pc = pattern[p];
      if (pc == '*') {
        star_p = p++;
        star_t = t;
        continue;
      }
      if (pc == '?') {
        ++p;
        ++t;
        continue;
      }
      if (pc == '[') {
        size_t next = p;
        bool matched = false;
        if (match_class(pattern, next, text[t], matched)) {
          if (matched) {
            p = next;
            ++t;
            continue;
          }
        } else if (text[t] == '[') {
          ++p;
          ++t;
          continue;
        }
      } else {
        const size_t literal = pc == '\\' && p + 1 < pattern.size() ? p + 1 : p;
        if (pattern[literal] == text[t]) {
          p = literal + 1;
          ++t;
          continue;
        }
      }
    }
    if (star_p == std::string_view::npos) return false;
    p = star_p + 1;
    t = ++star_t;
  }

  while (p < pattern.size() && pattern[p] == '*') ++p;
  return p == pattern.size();
}

bool is_hidden(std::string_view segment) { return !segment.empty() && segment.front() == '.'; }

bool match_segments(
  const std::vector<std::string_view> & pattern, size_t pi,
  const std::vector<std::string_view> & path, size_t si, bool dot)
{
  while (pi < pattern.size()) {
    const std::string_view seg = pattern[pi];
    if (seg == "**") {
      // Collapse consecutive globstars
      while (pi + 1 < pattern.size() && pattern[pi + 1] == "**") ++pi;
      for (size_t k = si; k <= path.size(); ++k) {
        if (match_segments(pattern, pi + 1, path, k, dot)) return true;
        if (k < path.size() && !dot && is_hidden(path[k])) return false;
      }
      return false;
    }

    if (si >= path.size()) return false;
    if (!dot && is_hidden(path[si]) && !is_hidden(seg)) return false;
    if (!match_segment(seg, path[si])) return false;
    ++pi;
    ++si;
  }
  return si == path.size();
}

/// Position of the `}` closing the group opened at `open`
size_t find_group_end(std::string_view pattern, size_t open)
{
  int depth = 0;
  for (size_t i = open; i < pattern.size(); ++i) {
    if (pattern[i] == '{') ++depth;
    if (pattern[i] == '}' && --depth == 0) return i;
  }
  return std::string_view::npos;
}

std::vector<std::string_view> split_alternatives(std::string_view body)
{
  std::vector<std::string_view> out;
  int depth = 0;
  size_t start = 0;
  for (size_t i = 0; i < body.size(); ++i) {
    if (body[i] == '{') ++depth;
    if (body[i] == '}') --depth;
    if (body[i] == ',' && depth == 0) {
      out.push_back(body.substr(start, i - start));
      start = i + 1;
    }
  }
  out.push_back(body.substr(start));
  return out;
}

void expand_into(std::string prefix, std::string_view rest, std::vector<std::string> & out)
{
  size_t search = 0;
  while (true) {
    const size_t open = rest.find('{', search);
    if (open == std::string_view::npos) {
      out.push_back(prefix + std::string(rest));
      return;
    }
    const size_t close = find_group_end(rest, open);
    if (close == std::string_view::npos) {
      out.push_back(prefix + std::string(rest));
      return;
    }

    const auto alternatives = split_alternatives(rest.substr(open + 1, close - open - 1));
    if (alternatives.size() < 2) {
      // A group without commas is literal text
      search = close + 1;
      continue;
    }

    const std::string head = prefix + std::string(rest.substr(0, open));
    const std::string_view tail = rest.substr(close + 1);
    for (const std::string_view alt : alternatives) {
      std::vector<std::string> expanded_alt;
      expand_into({}, alt, expanded_alt);
      for (const std::string & a : expanded_alt) {
        expand_into(head + a, tail, out);
      }
    }
    return;
  }
}

std::string strip_dot_slash(std::string_view pattern)
{
  while (pattern.substr(0, 2) == "./") pattern.remove_prefix(2);
  return std::string(pattern);
}

std::string relative_generic(const fs::path & root, const fs::path & path)
{
  const std::string rel = path.lexically_relative(root).generic_string();
  return rel == "." ? std::string() : rel;
}

}  // namespace

// ============================================================================
// Glob matching
// ============================================================================

std::vector<std::string> parse_glob_patterns(std::string_view input)
{
  std::vector<std::string> results;
  std::string current;
  int depth = 0;

  const auto flush = [&]() {
    const std::string_view trimmed = trim(current);
    if (!trimmed.empty()) results.emplace_back(trimmed);
    current.clear();
  };

  for (const char c : input) {
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      depth = std::max(0, depth - 1);
    } else if (c == ',' && depth == 0) {
      flush();
      continue;
    }
    current.push_back(c);
  }
  flush();
  return results;
}

std::vector<std::string> expand_braces(std::string_view pattern)
{
  std::vector<std::string> out;
  expand_into({}, pattern, out);
  std::vector<std::string> unique;
  for (std::string & p : out) {
    if (std::find(unique.begin(), unique.end(), p) == unique.end()) unique.push_back(std::move(p));
  }
  return unique;
}

bool glob_match(std::string_view pattern, std::string_view path, bool dot)
{
  const std::string cleaned = strip_dot_slash(pattern);
  return match_segments(split_path(cleaned), 0, split_path(path), 0, dot);
}

GlobSet::GlobSet(const std::vector<std::string> & patterns, bool dot) : dot_(dot)
{
  for (const std::string & p : patterns) add(p);
}

void GlobSet::add(std::string_view pattern)
{
  for (const std::string & list_entry : parse_glob_patterns(pattern)) {
    for (std::string & expanded : expand_braces(list_entry)) {
      patterns_.push_back(strip_dot_slash(expanded));
    }
  }
}

bool GlobSet::matches(std::string_view path) const
{
  return std::any_of(patterns_.begin(), patterns_.end(), [&](const std::string & p) {
    return glob_match(p, path, dot_);
  });
}

bool GlobSet::covers_directory(std::string_view dir) const
{
  for (const std::string & p : patterns_) {
    if (p == "**") return true;
    const std::string_view view(p);
    if (view.size() < 3 || view.substr(view.size() - 3) != "/**") continue;
    if (glob_match(view.substr(0, view.size() - 3), dir, dot_)) return true;
  }
  return false;
}

// ============================================================================
// .gitignore
// ============================================================================

std::vector<std::string> gitignore_line_to_globs(std::string_view line, std::string_view base_dir)
{
  std::string rule(trim(line));
  if (rule.empty() || rule.front() == '#' || rule.front() == '!') return {};
  std::replace(rule.begin(), rule.end(), '\\', '/');

  bool anchored = false;
  if (rule.front() == '/') {
    anchored = true;
    rule.erase(0, 1);
  }
  bool directory_only = false;
  while (!rule.empty() && rule.back() == '/') {
    directory_only = true;
    rule.pop_back();
  }
  if (rule.empty()) return {};
  if (rule.find('/') != std::string::npos) anchored = true;

  std::string body = base_dir.empty() ? std::string() : std::string(base_dir) + "/";
  if (!anchored && rule.substr(0, 3) != "**/") body += "**/";
  body += rule;

  std::vector<std::string> globs;
  if (!directory_only) globs.push_back(body);
  globs.push_back(body + "/**");
  return globs;
}

std::vector<std::string> read_gitignore_patterns(const fs::path & root, const GlobSet & exclude)
{
  std::vector<std::string> patterns;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) return patterns;

  std::vector<fs::path> ignore_files;
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const fs::directory_entry & entry = *it;
    const std::string rel = relative_generic(root, entry.path());

    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      if (exclude.covers_directory(rel)) it.disable_recursion_pending();
      continue;
    }
    if (entry.path().filename() == ".gitignore" && entry.is_regular_file(type_ec)) {
      ignore_files.push_back(entry.path());
    }
  }
  std::sort(ignore_files.begin(), ignore_files.end());

  for (const fs::path & file : ignore_files) {
    std::ifstream in(file, std::ios::binary);
    if (!in) continue;

    const std::string base_dir = relative_generic(root, file.parent_path());
    std::string line;
    while (std::getline(in, line)) {
      for (std::string & glob : gitignore_line_to_globs(line, base_dir)) {
        patterns.push_back(std::move(glob));
      }
    }
  }
  return patterns;
}

// ============================================================================
// Collection
// ============================================================================

CollectResult collect_files(const fs::path & root, const ScanConfig & scan)
{
  CollectResult result;

  std::error_code ec;
  fs::path base = fs::absolute(root, ec);
  if (ec) base = root;
  base = base.lexically_normal();

  if (!fs::is_directory(base, ec)) {
    result.errors.push_back(fmt::format("not a directory: {}", base.generic_string()));
    return result;
  }

  const GlobSet include(scan.include);
  GlobSet ignore(scan.exclude, /*dot=*/true);
  if (scan.respect_gitignore) {
    for (const std::string & p : read_gitignore_patterns(base, ignore)) ignore.add(p);
  }

  const uintmax_t max_bytes = static_cast<uintmax_t>(scan.max_file_size_kb) * 1024U;

  fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    result.errors.push_back(fmt::format("cannot read {}: {}", base.generic_string(), ec.message()));
    return result;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      result.errors.push_back(
        fmt::format("walk of {} stopped: {}", base.generic_string(), ec.message()));
      break;
    }

    const fs::directory_entry & entry = *it;
    const std::string rel = relative_generic(base, entry.path());

    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      if (ignore.covers_directory(rel)) it.disable_recursion_pending();
      continue;
    }
    if (!entry.is_regular_file(type_ec)) continue;
    if (!include.matches(rel) || ignore.matches(rel)) continue;

    std::error_code size_ec;
    const uintmax_t size = entry.file_size(size_ec);
    if (size_ec) {
      result.skipped.push_back({entry.path(), fmt::format("unreadable: {}", size_ec.message())});
      continue;
    }
    if (size > max_bytes) {
      result.skipped.push_back(
        {entry.path(), fmt::format("larger than {} KB", scan.max_file_size_kb)});
      continue;
    }
    result.files.push_back(entry.path().lexically_normal());
  }

  std::sort(result.files.begin(), result.files.end());
  result.files.erase(std::unique(result.files.begin(), result.files.end()), result.files.end());
  return result;
}

}  // namespace qk_graph
