// docgraph/basic/diagnostic.cpp - Diagnostic implementation
#include "docgraph/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace docgraph
{

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->range;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

template <typename Pred>
std::vector<Diagnostic> collect_if(const std::vector<Diagnostic> & all, Pred pred)
{
  std::vector<Diagnostic> result;
  std::copy_if(all.begin(), all.end(), std::back_inserter(result), pred);
  return result;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(d)};
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  if (diagnostics_.empty()) {
    diagnostics_ = std::move(other.diagnostics_);
  } else {
    diagnostics_.reserve(diagnostics_.size() + other.diagnostics_.size());
    std::move(other.diagnostics_.begin(), other.diagnostics_.end(), std::back_inserter(diagnostics_));
  }
  other.diagnostics_.clear();
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

std::vector<Diagnostic> DiagnosticBag::of_severity(Severity severity) const
{
  return collect_if(diagnostics_, [severity](const Diagnostic & d) { return d.severity == severity; });
}

std::vector<Diagnostic> DiagnosticBag::with_code(std::string_view code) const
{
  return collect_if(diagnostics_, [code](const Diagnostic & d) { return d.code == code; });
}

std::string summarize(const DiagnosticBag & diags)
{
  const auto plural = [](size_t n, const char * word) {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
  };

  const size_t errors = diags.count(Severity::Error);
  const size_t warnings = diags.count(Severity::Warning);
  if (errors > 0 && warnings > 0) {
    return plural(errors, "error") + ", " + plural(warnings, "warning");
  }
  if (errors > 0) {
    return plural(errors, "error");
  }
  if (warnings > 0) {
    return plural(warnings, "warning");
  }
  return {};
}

}  // namespace docgraph
