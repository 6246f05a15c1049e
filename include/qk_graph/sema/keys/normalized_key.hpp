// qk_graph/sema/keys/normalized_key.hpp - Canonical cache-key representation
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace qk_graph
{

// ============================================================================
// Enums
// ============================================================================

/// How a mutation key selects declared keys
enum class MatchMode : uint8_t {
  Exact,
  Prefix,
  All,
  Predicate,
  Unknown,
};

/// Certainty that a key's full shape was statically determined
enum class Resolution : uint8_t {
  Static,
  Dynamic,
};

enum class KeySource : uint8_t {
  Literal,
  Expression,
  Wildcard,
};

[[nodiscard]] constexpr std::string_view to_string(MatchMode mode) noexcept
{
  switch (mode) {
    case MatchMode::Exact:
      return "exact";
    case MatchMode::Prefix:
      return "prefix";
    case MatchMode::All:
      return "all";
    case MatchMode::Predicate:
      return "predicate";
    case MatchMode::Unknown:
      return "unknown";
  }
  return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Resolution resolution) noexcept
{
  return resolution == Resolution::Static ? "static" : "dynamic";
}

[[nodiscard]] constexpr std::string_view to_string(KeySource source) noexcept
{
  switch (source) {
    case KeySource::Literal:
      return "literal";
    case KeySource::Expression:
      return "expression";
    case KeySource::Wildcard:
      return "wildcard";
  }
  return "expression";
}

/// Certainty lattice join: dynamic absorbs static
[[nodiscard]] constexpr Resolution merge(Resolution a, Resolution b) noexcept
{
  return (a == Resolution::Dynamic || b == Resolution::Dynamic) ? Resolution::Dynamic
                                                                : Resolution::Static;
}

// ============================================================================
// Sentinels
// ============================================================================

inline constexpr std::string_view k_unresolved_segment = "UNRESOLVED";
inline constexpr std::string_view k_all_query_cache_segment = "ALL_QUERY_CACHE";
inline constexpr std::string_view k_all_query_cache_id = "all-query-cache";
inline constexpr std::string_view k_unresolved_key_display = "UNRESOLVED_QUERY_KEY";
inline constexpr std::string_view k_unresolved_key_id = "unresolved_query_key";
inline constexpr std::string_view k_pass_through_key_id = "pass-through-query-key";
inline constexpr std::string_view k_pass_through_key_display = "$queryKey";
inline constexpr std::string_view k_empty_key_id = "empty";

// ============================================================================
// Segment / NormalizedKey
// ============================================================================

/// Text of one key element and whether it was statically determined
struct Segment
{
  std::string text;
  bool isStatic = true;

  [[nodiscard]] Resolution resolution() const noexcept
  {
    return isStatic ? Resolution::Static : Resolution::Dynamic;
  }

  bool operator==(const Segment & other) const
  {
    return text == other.text && isStatic == other.isStatic;
  }
};

/**
 * Canonical cache key.
 *
 * `id` is a pure function of `segments` (see key_id()); two keys with equal
 * segments always share an id. The sentinel keys built by make_all_cache_key(),
 * make_unknown_key() and make_pass_through_key() are the exception: their id is
 * a fixed constant that never collides with a segment-derived id.
 */
struct NormalizedKey
{
  std::string id;
  std::string display;
  std::vector<std::string> segments;
  MatchMode matchMode = MatchMode::Unknown;
  Resolution resolution = Resolution::Dynamic;
  KeySource source = KeySource::Expression;

  [[nodiscard]] bool is_wildcard() const noexcept { return source == KeySource::Wildcard; }

  bool operator==(const NormalizedKey & other) const
  {
    return id == other.id && display == other.display && segments == other.segments &&
           matchMode == other.matchMode && resolution == other.resolution &&
           source == other.source;
  }
  bool operator!=(const NormalizedKey & other) const { return !(*this == other); }
};

/// Segments joined by `|`, or `empty` when there are none
[[nodiscard]] std::string key_id(const std::vector<std::string> & segments);

/// `[a, b, c]`
[[nodiscard]] std::string key_display(const std::vector<std::string> & segments);

/// Key built from array elements; static iff every segment is static
[[nodiscard]] NormalizedKey make_array_key(const std::vector<Segment> & segments, MatchMode mode);

/// Key of a single non-array expression
[[nodiscard]] NormalizedKey make_scalar_key(const Segment & segment, MatchMode mode);

/**
 * Wildcard covering the whole cache.
 *
 * The id is always k_all_query_cache_id, not key_id(segments), so every
 * whole-cache action shares one id whatever its display text.
 */
[[nodiscard]] NormalizedKey make_all_cache_key(
  Resolution resolution, std::string_view display = k_all_query_cache_segment,
  MatchMode mode = MatchMode::All);

/**
 * Key whose expression is missing or could not be read.
 *
 * The id is always k_unresolved_key_id, not key_id(segments); a literal
 * `['UNRESOLVED']` array keeps the segment-derived id `UNRESOLVED`.
 */
[[nodiscard]] NormalizedKey make_unknown_key(MatchMode mode);

/// Mutation that forwards an ambient `queryKey` parameter; id is k_pass_through_key_id
[[nodiscard]] NormalizedKey make_pass_through_key(MatchMode mode);

/**
 * Replace sentinel-like text with UNRESOLVED.
 *
 * Empty text, `...spread`, `expr`, `call(expr)` and `$queryKey`/`$queryKeys`
 * (any case) become a dynamic UNRESOLVED segment.
 */
[[nodiscard]] Segment normalize_segment(Segment segment);

/// Single UNRESOLVED segment, or the unknown-key sentinel
[[nodiscard]] bool is_unresolved_key(const NormalizedKey & key);

/// Dedupe key used when one call yields several keys
[[nodiscard]] std::string dedupe_key(const NormalizedKey & key);

}  // namespace qk_graph
