// qk_graph/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
// fmt does the formatting, rang the colors.
//
#include "qk_graph/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace qk_graph
{

namespace
{

struct SeverityStyle
{
  const char * name;
  rang::fg color;
};

SeverityStyle style_of(Severity s)
{
  switch (s) {
    case Severity::Error:
      return {"error", rang::fg::red};
    case Severity::Warning:
      return {"warning", rang::fg::yellow};
    case Severity::Note:
      return {"note", rang::fg::cyan};
  }
  return {"error", rang::fg::red};
}

/// Display cells taken by the line text before UTF-16 column `column`
std::string indent_to_column(std::string_view line, uint32_t column)
{
  std::string out;
  uint32_t at = 1;
  for (size_t i = 0; at < column && i < line.size(); ++i) {
    const auto b = static_cast<unsigned char>(line[i]);
    if ((b & 0xC0) == 0x80) continue;
    out += line[i] == '\t' ? "    " : " ";
    at += b >= 0xF0 ? 2 : 1;
  }
  return out;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Auto : rang::control::Off);
  std::error_code ec;
  cwd_ = std::filesystem::current_path(ec);
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  print_header(diag);
  print_location(diag, sources);
  for (const std::string & note : diag.notes) {
    print_trailer("note", note);
  }
  if (diag.help) {
    print_trailer("help", *diag.help);
  }
  if (diag.severity != Severity::Note) {
    fmt::print(os_, "\n");
  }
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const Diagnostic & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    if (a->range.is_valid() != b->range.is_valid()) return !a->range.is_valid();
    return a->range.get_begin() < b->range.get_begin();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_status(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << "  > " << rang::style::reset << rang::fg::reset;
  } else {
    os_ << "  > ";
  }
  fmt::print(os_, "{}\n", message);
}

// ============================================================================
// Pieces
// ============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const SeverityStyle style = style_of(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);
  if (use_color_) {
    os_ << rang::style::bold << style.color << style.name << code << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", style.name, code, diag.message);
  }
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceFile * file = sources.get_file(diag.range.file_id());
  if (file == nullptr) {
    if (!diag.path.empty()) {
      fmt::print(os_, "{} {}\n", gutter("-->"), relative_to_cwd(diag.path));
    }
    return;
  }

  const std::string shown = relative_to_cwd(file->path());
  const FullSourceRange range = file->get_full_range(diag.range);
  if (!range.is_valid()) {
    fmt::print(os_, "{} {}\n", gutter("-->"), shown);
    return;
  }
  fmt::print(os_, "{} {}:{}:{}\n", gutter("-->"), shown, range.start_line, range.start_column);
  print_snippet(*file, range);
}

void DiagnosticPrinter::print_snippet(const SourceFile & file, const FullSourceRange & range)
{
  const std::string_view line = file.get_line(range.start_line - 1);
  if (line.empty()) return;

  fmt::print(os_, "{}\n", gutter("|"));
  const std::string number = fmt::format("{:>5} |", range.start_line);
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << number << rang::style::reset << rang::fg::reset;
  } else {
    os_ << number;
  }
  fmt::print(os_, " {}\n", expand_tabs(line));

  // Multi-line ranges underline a single column on their first line
  const uint32_t width = range.end_line == range.start_line && range.end_column > range.start_column
                           ? range.end_column - range.start_column
                           : 1;
  const std::string carets(width, '^');
  fmt::print(os_, "{} {}", gutter("|"), indent_to_column(line, range.start_column));
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << carets << rang::style::reset << rang::fg::reset
        << "\n";
  } else {
    fmt::print(os_, "{}\n", carets);
  }
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{} {}: {}\n", gutter("="), kind, message);
}

std::string DiagnosticPrinter::relative_to_cwd(const std::filesystem::path & path) const
{
  std::error_code ec;
  const std::filesystem::path rel = std::filesystem::relative(path, cwd_, ec);
  if (ec || rel.empty() || *rel.begin() == "..") {
    return path.generic_string();
  }
  return rel.generic_string();
}

std::string DiagnosticPrinter::gutter(std::string_view mark) const
{
  const std::string cell = fmt::format("{:>7}", mark);
  return use_color_ ? fmt::format("\033[1;36m{}\033[0m", cell) : cell;
}

}  // namespace qk_graph
