// qk_graph/basic/diagnostic.cpp - Diagnostic bag and builder
#include "qk_graph/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace qk_graph
{

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) bag_->add(std::move(diagnostic_));
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_path(std::string path)
{
  diagnostic_.path = std::move(path);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help)
{
  diagnostic_.help = std::move(help);
  return *this;
}

DiagnosticBuilder DiagnosticBag::report(Severity severity, SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.range = range;
  return {*this, std::move(d)};
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

}  // namespace qk_graph
