// docgraph/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
//
// Two layouts are supported:
//
//   Full (default):
//     warning[W001]: method declaration has no name
//       --> src/app/Main.java:5:3
//        |
//      5 |   void (int x) {}
//        |   ^^^^^^^^^^^^^^^ recovered as '<init>'
//
//   Short (one line per diagnostic):
//     src/app/Main.java:5:3: warning[W001]: method declaration has no name
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "docgraph/basic/diagnostic.hpp"
#include "docgraph/basic/source_manager.hpp"

namespace docgraph
{

enum class PrintLayout {
  Full,
  Short,
};

class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(
    std::ostream & os, bool use_color = true, PrintLayout layout = PrintLayout::Full);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Prints every diagnostic ordered by file and offset. Diagnostics without
  /// a location keep their insertion order and come last.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, const SourceRegistry & sources);
  void print_snippet(const Label & label, const SourceRegistry & sources);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] static std::string_view severity_name(Severity severity) noexcept;
  [[nodiscard]] static std::string location_text(SourceRange range, const SourceRegistry & sources);

  std::ostream & os_;
  bool use_color_;
  PrintLayout layout_;
};

}  // namespace docgraph
