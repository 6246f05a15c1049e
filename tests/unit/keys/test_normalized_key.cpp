// tests/unit/keys/test_normalized_key.cpp - Unit tests for NormalizedKey construction
//

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "qk_graph/sema/keys/normalized_key.hpp"

using namespace qk_graph;

// ============================================================================
// Resolution lattice
// ============================================================================

TEST(KeysResolution, MergeIsJoin)
{
  EXPECT_EQ(merge(Resolution::Static, Resolution::Static), Resolution::Static);
  EXPECT_EQ(merge(Resolution::Static, Resolution::Dynamic), Resolution::Dynamic);
  EXPECT_EQ(merge(Resolution::Dynamic, Resolution::Static), Resolution::Dynamic);
  EXPECT_EQ(merge(Resolution::Dynamic, Resolution::Dynamic), Resolution::Dynamic);
}

TEST(KeysResolution, MergeIsCommutativeAndIdempotent)
{
  const Resolution values[] = {Resolution::Static, Resolution::Dynamic};
  for (Resolution a : values) {
    EXPECT_EQ(merge(a, a), a);
    for (Resolution b : values) {
      EXPECT_EQ(merge(a, b), merge(b, a));
    }
  }
}

TEST(KeysResolution, EnumSpellings)
{
  EXPECT_EQ(to_string(Resolution::Static), "static");
  EXPECT_EQ(to_string(MatchMode::Exact), "exact");
  EXPECT_EQ(to_string(MatchMode::Prefix), "prefix");
  EXPECT_EQ(to_string(MatchMode::All), "all");
  EXPECT_EQ(to_string(MatchMode::Predicate), "predicate");
  EXPECT_EQ(to_string(KeySource::Wildcard), "wildcard");
}

// ============================================================================
// Builders
// ============================================================================

TEST(KeysBuilders, ArrayKeyJoinsSegments)
{
  const NormalizedKey key =
    make_array_key({Segment{"todos", true}, Segment{"$id", false}}, MatchMode::Prefix);

  EXPECT_EQ(key.id, "todos|$id");
  EXPECT_EQ(key.display, "[todos, $id]");
  ASSERT_EQ(key.segments.size(), 2U);
  EXPECT_EQ(key.matchMode, MatchMode::Prefix);
  EXPECT_EQ(key.resolution, Resolution::Dynamic);
  EXPECT_EQ(key.source, KeySource::Expression);
}

TEST(KeysBuilders, StaticArrayKeyIsLiteral)
{
  const NormalizedKey key =
    make_array_key({Segment{"todos", true}, Segment{"list", true}}, MatchMode::Exact);
  EXPECT_EQ(key.resolution, Resolution::Static);
  EXPECT_EQ(key.source, KeySource::Literal);
}

TEST(KeysBuilders, EmptyArrayKey)
{
  const NormalizedKey key = make_array_key({}, MatchMode::Prefix);
  EXPECT_EQ(key.id, "empty");
  EXPECT_EQ(key.display, "[]");
  EXPECT_TRUE(key.segments.empty());
}

TEST(KeysBuilders, EmptySegmentTextBecomesUnresolved)
{
  const NormalizedKey key = make_array_key({Segment{"", false}}, MatchMode::Prefix);
  ASSERT_EQ(key.segments.size(), 1U);
  EXPECT_EQ(key.segments[0], "UNRESOLVED");
  EXPECT_TRUE(is_unresolved_key(key));
}

TEST(KeysBuilders, IdDependsOnlyOnSegments)
{
  const NormalizedKey a =
    make_array_key({Segment{"a", true}, Segment{"b", true}}, MatchMode::Exact);
  const NormalizedKey b =
    make_array_key({Segment{"a", true}, Segment{"b", true}}, MatchMode::Prefix);
  EXPECT_EQ(a.id, b.id);
  EXPECT_NE(dedupe_key(a), dedupe_key(b));
}

TEST(KeysBuilders, SentinelKeys)
{
  const NormalizedKey all = make_all_cache_key(Resolution::Static);
  EXPECT_EQ(all.id, "all-query-cache");
  EXPECT_EQ(all.display, "ALL_QUERY_CACHE");
  EXPECT_TRUE(all.is_wildcard());
  EXPECT_EQ(all.matchMode, MatchMode::All);

  const NormalizedKey unknown = make_unknown_key(MatchMode::Unknown);
  EXPECT_EQ(unknown.id, "unresolved_query_key");
  EXPECT_TRUE(is_unresolved_key(unknown));
  EXPECT_FALSE(unknown.is_wildcard());

  const NormalizedKey pass = make_pass_through_key(MatchMode::Exact);
  EXPECT_EQ(pass.id, "pass-through-query-key");
  EXPECT_EQ(pass.display, "$queryKey");
  EXPECT_EQ(pass.resolution, Resolution::Dynamic);
}

TEST(KeysBuilders, SentinelIdsDoNotFollowSegments)
{
  const NormalizedKey all = make_all_cache_key(Resolution::Dynamic, "predicate");
  EXPECT_EQ(all.id, make_all_cache_key(Resolution::Static).id);
  EXPECT_NE(all.id, key_id(all.segments));

  const NormalizedKey unknown = make_unknown_key(MatchMode::Prefix);
  const NormalizedKey literal =
    make_array_key({{std::string(k_unresolved_segment), false}}, MatchMode::Prefix);
  EXPECT_EQ(unknown.segments, literal.segments);
  EXPECT_NE(unknown.id, literal.id);
  EXPECT_EQ(literal.id, key_id(literal.segments));

  const NormalizedKey pass = make_pass_through_key(MatchMode::Prefix);
  EXPECT_NE(pass.id, key_id(pass.segments));
}

// ============================================================================
// normalize_segment
// ============================================================================

TEST(KeysSegments, SentinelTextsBecomeUnresolved)
{
  for (const char * text : {"", "expr", "...spread", "call(expr)", "$queryKey", "$QUERYKEYS"}) {
    const Segment seg = normalize_segment(Segment{text, true});
    EXPECT_EQ(seg.text, "UNRESOLVED") << "text: '" << text << "'";
    EXPECT_FALSE(seg.isStatic);
  }
}

TEST(KeysSegments, OrdinaryTextIsKept)
{
  const Segment seg = normalize_segment(Segment{"todos", true});
  EXPECT_EQ(seg.text, "todos");
  EXPECT_TRUE(seg.isStatic);

  const Segment param = normalize_segment(Segment{"$id", false});
  EXPECT_EQ(param.text, "$id");
  EXPECT_FALSE(param.isStatic);
}
