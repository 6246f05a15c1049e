// tests/unit/basic/test_source_manager.cpp - Line tables, columns and file registration
//
#include <gtest/gtest.h>

#include <string>

#include "qk_graph/basic/source_manager.hpp"

using namespace qk_graph;

namespace
{

LineColumn at(const std::string & text, uint32_t offset)
{
  const SourceFile file("/virtual/a.ts", text);
  return file.get_line_column(offset);
}

}  // namespace

// ============================================================================
// Line terminators
// ============================================================================

TEST(SourceFile, LineFeed)
{
  const LineColumn lc = at("a\nbc\n", 3);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 2U);
}

TEST(SourceFile, CarriageReturnLineFeedIsOneTerminator)
{
  const SourceFile file("/virtual/a.ts", "ab\r\ncd");
  EXPECT_EQ(file.get_line_column(4).line, 2U);
  EXPECT_EQ(file.get_line_column(4).column, 1U);
  EXPECT_EQ(file.get_line(0), "ab");
  EXPECT_EQ(file.get_line(1), "cd");

  // Inside the terminator: still the end of line 1
  const LineColumn lc = file.get_line_column(3);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 3U);
}

TEST(SourceFile, LoneCarriageReturn)
{
  const LineColumn lc = at("a\rb", 2);
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 1U);
}

TEST(SourceFile, UnicodeLineAndParagraphSeparators)
{
  const SourceFile file("/virtual/a.ts", "a\xE2\x80\xA8" "b\xE2\x80\xA9" "c");
  EXPECT_EQ(file.get_line_column(4).line, 2U);
  EXPECT_EQ(file.get_line_column(8).line, 3U);
  EXPECT_EQ(file.get_line(0), "a");
  EXPECT_EQ(file.get_line(1), "b");
  EXPECT_EQ(file.get_line(2), "c");
}

// ============================================================================
// Columns
// ============================================================================

TEST(SourceFile, ByteOrderMarkIsNotAColumn)
{
  const SourceFile file("/virtual/a.ts", "\xEF\xBB\xBFx = 1");
  EXPECT_TRUE(file.has_bom());
  EXPECT_EQ(file.get_line_column(3).column, 1U);
  EXPECT_EQ(file.get_line(0), "x = 1");
}

TEST(SourceFile, ColumnsCountUtf16Units)
{
  // 'é' is one unit, the emoji is a surrogate pair
  const LineColumn lc = at("'\xC3\xA9\xF0\x9F\x98\x80x'", 7);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 5U);
}

TEST(SourceFile, OffsetsPastTheEndAreClamped)
{
  const LineColumn lc = at("ab", 100);
  EXPECT_EQ(lc.line, 1U);
  EXPECT_EQ(lc.column, 3U);
}

TEST(SourceFile, SliceAndFullRange)
{
  const SourceFile file("/virtual/a.ts", "const k = ['todos'];\n");
  const SourceRange range(FileId{0}, 10, 19);
  EXPECT_EQ(file.get_slice(range), "['todos']");

  const FullSourceRange full = file.get_full_range(range);
  EXPECT_EQ(full.start_line, 1U);
  EXPECT_EQ(full.start_column, 11U);
  EXPECT_EQ(full.end_column, 20U);
  EXPECT_TRUE(file.get_slice(SourceRange{}).empty());
}

// ============================================================================
// Registry
// ============================================================================

TEST(SourceRegistry, SamePathKeepsItsId)
{
  SourceRegistry registry;
  const FileId first = registry.register_file("/virtual/src/a.ts", "one");
  const FileId again = registry.register_file("/virtual/src/../src/a.ts", "two");
  const FileId other = registry.register_file("/virtual/src/b.ts", "three");

  EXPECT_EQ(first, again);
  EXPECT_NE(first, other);
  ASSERT_NE(registry.get_file(first), nullptr);
  EXPECT_EQ(registry.get_file(first)->content(), "one");
}

TEST(SourceRegistry, UnknownIdsAreEmpty)
{
  SourceRegistry registry;
  EXPECT_EQ(registry.get_file(FileId::invalid()), nullptr);
  EXPECT_TRUE(registry.get_path(FileId{3}).empty());
  EXPECT_FALSE(registry.get_line_column(SourceLocation{}).is_valid());
}
