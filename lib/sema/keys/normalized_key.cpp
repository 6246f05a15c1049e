// qk_graph/sema/keys/normalized_key.cpp - Canonical cache-key representation
//
#include "qk_graph/sema/keys/normalized_key.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace qk_graph
{

std::string key_id(const std::vector<std::string> & segments)
{
  if (segments.empty()) return std::string(k_empty_key_id);
  return fmt::format("{}", fmt::join(segments, "|"));
}

std::string key_display(const std::vector<std::string> & segments)
{
  return fmt::format("[{}]", fmt::join(segments, ", "));
}

NormalizedKey make_array_key(const std::vector<Segment> & segments, MatchMode mode)
{
  NormalizedKey key;
  key.resolution = Resolution::Static;
  for (const auto & seg : segments) {
    key.segments.push_back(seg.text.empty() ? std::string(k_unresolved_segment) : seg.text);
    key.resolution = merge(key.resolution, seg.resolution());
  }
  key.id = key_id(key.segments);
  key.display = key_display(key.segments);
  key.matchMode = mode;
  key.source = key.resolution == Resolution::Static ? KeySource::Literal : KeySource::Expression;
  return key;
}

NormalizedKey make_scalar_key(const Segment & segment, MatchMode mode)
{
  const std::string text = segment.text.empty() ? std::string(k_unresolved_segment) : segment.text;

  NormalizedKey key;
  key.id = text;
  key.display = text;
  key.segments = {text};
  key.matchMode = mode;
  key.resolution = segment.resolution();
  key.source = key.resolution == Resolution::Static ? KeySource::Literal : KeySource::Expression;
  return key;
}

NormalizedKey make_all_cache_key(Resolution resolution, std::string_view display, MatchMode mode)
{
  NormalizedKey key;
  key.id = std::string(k_all_query_cache_id);
  key.display = std::string(display);
  key.segments = {std::string(k_all_query_cache_segment)};
  key.matchMode = mode;
  key.resolution = resolution;
  key.source = KeySource::Wildcard;
  return key;
}

NormalizedKey make_unknown_key(MatchMode mode)
{
  NormalizedKey key;
  key.id = std::string(k_unresolved_key_id);
  key.display = std::string(k_unresolved_key_display);
  key.segments = {std::string(k_unresolved_segment)};
  key.matchMode = mode;
  key.resolution = Resolution::Dynamic;
  key.source = KeySource::Expression;
  return key;
}

NormalizedKey make_pass_through_key(MatchMode mode)
{
  NormalizedKey key;
  key.id = std::string(k_pass_through_key_id);
  key.display = std::string(k_pass_through_key_display);
  key.segments = {std::string(k_pass_through_key_display)};
  key.matchMode = mode;
  key.resolution = Resolution::Dynamic;
  key.source = KeySource::Expression;
  return key;
}

Segment normalize_segment(Segment segment)
{
  if (segment.text.empty() || segment.text == "...spread" || segment.text == "expr" ||
      segment.text == "call(expr)") {
    return Segment{std::string(k_unresolved_segment), false};
  }

  std::string lower = segment.text;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "$querykey" || lower == "$querykeys") {
    return Segment{std::string(k_unresolved_segment), false};
  }
  return segment;
}

bool is_unresolved_key(const NormalizedKey & key)
{
  if (key.segments.size() == 1 && key.segments[0] == k_unresolved_segment) return true;
  return key.id == k_unresolved_key_id;
}

std::string dedupe_key(const NormalizedKey & key)
{
  return fmt::format(
    "{}|{}|{}|{}", key.id, key.display, to_string(key.matchMode), to_string(key.resolution));
}

}  // namespace qk_graph
