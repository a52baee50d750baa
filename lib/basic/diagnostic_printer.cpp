// docgraph/basic/diagnostic_printer.cpp - Diagnostic rendering with fmt and rang
#include "docgraph/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace docgraph
{

namespace
{

constexpr const char * k_gutter = "      |";

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color, PrintLayout layout)
: os_(os), use_color_(use_color), layout_(layout)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  if (layout_ == PrintLayout::Short) {
    const std::string where = location_text(diag.primary_range(), sources);
    if (!where.empty()) {
      fmt::print(os_, "{}: ", where);
    }
    print_header(diag);
    return;
  }

  print_header(diag);
  print_location(diag, sources);

  for (const auto & label : diag.labels) {
    print_snippet(label, sources);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }

  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    const SourceLocation la = a->primary_range().get_begin();
    const SourceLocation lb = b->primary_range().get_begin();
    if (la.is_valid() != lb.is_valid()) {
      return la.is_valid();
    }
    return la < lb;
  });

  for (const Diagnostic * d : ordered) {
    print(*d, sources);
  }
}

// ============================================================================
// Private helpers
// ============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << name << code << rang::fg::reset
        << ": " << diag.message << rang::style::reset << "\n";
    return;
  }
  fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceRegistry & sources)
{
  const std::string where = location_text(diag.primary_range(), sources);
  if (where.empty()) {
    return;
  }
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "  -->" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, " {}\n", where);
  } else {
    fmt::print(os_, "  --> {}\n", where);
  }
}

void DiagnosticPrinter::print_snippet(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * file = sources.get_file(label.range.file_id());
  if (file == nullptr || !label.range.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const LineColumn begin = file->get_line_column(label.range.get_begin().offset());
  const LineColumn end = file->get_line_column(label.range.get_end().offset());
  if (!begin.is_valid()) {
    return;
  }

  const std::string_view raw = file->get_line(begin.line - 1);
  const std::string line = expand_tabs(raw);

  // Multi-line ranges are underlined up to the end of their first line.
  uint32_t width = 1;
  if (end.line == begin.line && end.column > begin.column) {
    width = end.column - begin.column;
  } else if (raw.size() + 1 > begin.column) {
    width = static_cast<uint32_t>(raw.size() + 1 - begin.column);
  }

  std::string pad;
  for (uint32_t i = 0; i + 1 < begin.column && i < raw.size(); ++i) {
    pad += (raw[i] == '\t') ? "    " : " ";
  }

  const char mark = (label.style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{}\n", k_gutter);
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} |", begin.line);
    os_ << rang::fg::reset;
    fmt::print(os_, " {}\n{} {}", line, k_gutter, pad);
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
    fmt::print(os_, "{}", std::string(width, mark));
    if (!label.message.empty()) {
      fmt::print(os_, " {}", label.message);
    }
    os_ << rang::style::reset << rang::fg::reset << "\n";
    return;
  }

  fmt::print(os_, " {:>4} | {}\n", begin.line, line);
  fmt::print(os_, "{} {}{}", k_gutter, pad, std::string(width, mark));
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", k_gutter);
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << kind << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, ": {}\n", message);
  } else {
    fmt::print(os_, "      = {}: {}\n", kind, message);
  }
}

std::string_view DiagnosticPrinter::severity_name(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

std::string DiagnosticPrinter::location_text(SourceRange range, const SourceRegistry & sources)
{
  const SourceFile * file = sources.get_file(range.file_id());
  if (file == nullptr) {
    return {};
  }
  const LineColumn lc = file->get_line_column(range.get_begin().offset());
  if (!range.is_valid() || !lc.is_valid()) {
    return file->name();
  }
  return fmt::format("{}:{}:{}", file->name(), lc.line, lc.column);
}

}  // namespace docgraph
