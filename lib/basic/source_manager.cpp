// qk_graph/basic/source_manager.cpp - Source files, line tables and the registry
#include "qk_graph/basic/source_manager.hpp"

#include <algorithm>
#include <system_error>

namespace qk_graph
{

namespace
{

constexpr std::string_view k_utf8_bom = "\xEF\xBB\xBF";

/// Length of the UTF-8 encoded U+2028/U+2029 at `i`, or 0
size_t unicode_line_separator_at(std::string_view text, size_t i) noexcept
{
  if (i + 2 >= text.size()) return 0;
  const auto b0 = static_cast<unsigned char>(text[i]);
  const auto b1 = static_cast<unsigned char>(text[i + 1]);
  const auto b2 = static_cast<unsigned char>(text[i + 2]);
  return (b0 == 0xE2 && b1 == 0x80 && (b2 == 0xA8 || b2 == 0xA9)) ? 3 : 0;
}

/// UTF-16 code units of the UTF-8 text in [begin, end)
uint32_t utf16_length(std::string_view text, size_t begin, size_t end) noexcept
{
  uint32_t units = 0;
  for (size_t i = begin; i < end; ++i) {
    const auto b = static_cast<unsigned char>(text[i]);
    if ((b & 0xC0) == 0x80) continue;  // continuation byte
    units += b >= 0xF0 ? 2 : 1;
  }
  return units;
}

}  // namespace

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(fs::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  if (std::string_view(content_).substr(0, k_utf8_bom.size()) == k_utf8_bom) {
    bom_size_ = static_cast<uint32_t>(k_utf8_bom.size());
  }
  build_line_table();
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(bom_size_);

  const std::string_view text = content_;
  for (size_t i = bom_size_; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    } else if (c == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    } else if (const size_t sep = unicode_line_separator_at(text, i); sep > 0) {
      i += sep - 1;
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

uint32_t SourceFile::line_text_end(uint32_t line_index) const noexcept
{
  if (line_index + 1 >= line_offsets_.size()) {
    return static_cast<uint32_t>(content_.size());
  }

  const std::string_view text = content_;
  const uint32_t next = line_offsets_[line_index + 1];
  if (next >= 3 && unicode_line_separator_at(text, next - 3) == 3) return next - 3;
  if (next >= 2 && text[next - 2] == '\r' && text[next - 1] == '\n') return next - 2;
  return next - 1;
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  offset = std::max(offset, bom_size_);

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_[0] <= offset always holds

  const auto line_index = static_cast<uint32_t>(it - line_offsets_.begin());
  // Offsets inside a terminator stay on their line
  const uint32_t end = std::max(*it, std::min(offset, line_text_end(line_index)));
  return {line_index + 1, utf16_length(content_, *it, end) + 1};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }
  const uint32_t start = line_offsets_[line_index];
  const uint32_t end = line_text_end(line_index);
  return std::string_view(content_).substr(start, end > start ? end - start : 0);
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const auto start = range.get_begin().offset();
  const auto end = std::min(range.get_end().offset(), static_cast<uint32_t>(content_.size()));
  if (start >= end) {
    return {};
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().offset();
  result.end_byte = range.get_end().offset();

  const LineColumn start = get_line_column(result.start_byte);
  const LineColumn end = get_line_column(result.end_byte);
  result.start_line = start.line;
  result.start_column = start.column;
  result.end_line = end.line;
  result.end_column = end.column;
  return result;
}

// ============================================================================
// SourceRegistry
// ============================================================================

std::string SourceRegistry::path_key(const fs::path & path)
{
  std::error_code ec;
  fs::path abs = path.is_absolute() ? path : fs::absolute(path, ec);
  if (ec) abs = path;
  return abs.lexically_normal().generic_string();
}

FileId SourceRegistry::register_file(fs::path path, std::string content)
{
  std::string key = path_key(path);
  if (const auto it = path_to_id_.find(key); it != path_to_id_.end()) {
    return it->second;
  }

  if (files_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint32_t>(files_.size())};
  files_.push_back(std::make_unique<SourceFile>(std::move(path), std::move(content)));
  path_to_id_.emplace(std::move(key), id);
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || static_cast<size_t>(id.value) >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

const fs::path & SourceRegistry::get_path(FileId id) const noexcept
{
  static const fs::path k_empty;
  const SourceFile * f = get_file(id);
  return f != nullptr ? f->path() : k_empty;
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const SourceFile * f = get_file(loc.file_id());
  if (f == nullptr || !loc.is_valid()) {
    return {};
  }
  return f->get_line_column(loc.offset());
}

FullSourceRange SourceRegistry::get_full_range(SourceRange range) const noexcept
{
  const SourceFile * f = get_file(range.file_id());
  return f != nullptr ? f->get_full_range(range) : FullSourceRange{};
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const SourceFile * f = get_file(range.file_id());
  return f != nullptr ? f->get_slice(range) : std::string_view{};
}

}  // namespace qk_graph
