// qk_graph/basic/source_manager.hpp - Source location and range management
//
// This header provides types for tracking source code locations and ranges
// across every file of an analysis run.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qk_graph
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Index of a registered source file
// ============================================================================

struct FileId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }
  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(FileId other) const noexcept
  {
    return value < other.value;
  }
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A compact representation of a source location.
 *
 * Stores the owning file and a byte offset into it. Line and column
 * information is computed on demand via SourceRegistry.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  /// Create an invalid location
  constexpr SourceLocation() noexcept = default;

  /// Create a location from file and byte offset
  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }

  /// Orders by file first, then by offset
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_ != other.file_) return file_ < other.file_;
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Start and end locations
// ============================================================================

/**
 * A half-open range [start, end) inside a single file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(file, start_offset), end_(file, end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return start_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Editor position (1-indexed).
 *
 * Columns count UTF-16 code units, the unit JavaScript tooling and editors
 * report, so a character outside the BMP advances the column by two.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed UTF-16 column (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// FullSourceRange - Complete range with line/column info
// ============================================================================

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceFile - One file's path, UTF-8 content and line table
// ============================================================================

/**
 * Lines are split on every ECMAScript line terminator: LF, CRLF, a lone CR,
 * U+2028 and U+2029. A leading byte order mark is not part of line 1.
 */
class SourceFile
{
public:
  SourceFile(fs::path path, std::string content);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  /// True when the content starts with a UTF-8 byte order mark
  [[nodiscard]] bool has_bom() const noexcept { return bom_size_ > 0; }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line (0-indexed), without its terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  /// Byte offset just past the text of line `line_index`
  [[nodiscard]] uint32_t line_text_end(uint32_t line_index) const noexcept;

  fs::path path_;
  std::string content_;
  uint32_t bom_size_ = 0;
  std::vector<uint32_t> line_offsets_;  ///< Byte offset of each line start
};

// ============================================================================
// SourceRegistry - All files of one run
// ============================================================================

/**
 * Owns every SourceFile of an analysis run and hands out FileIds.
 *
 * Paths are keyed lexically (absolute, normalized, generic separators), so
 * in-memory sources with virtual paths register without touching the disk.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;
  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) noexcept = default;
  SourceRegistry & operator=(SourceRegistry &&) noexcept = default;

  /**
   * Register a file and its content.
   *
   * @return The FileId of the file. A path registered before keeps its id
   *         and its first content.
   */
  FileId register_file(fs::path path, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] const fs::path & get_path(FileId id) const noexcept;

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  /// Absolute, lexically normalized, generic separators; no disk access
  [[nodiscard]] static std::string path_key(const fs::path & path);

  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> path_to_id_;
};

}  // namespace qk_graph
