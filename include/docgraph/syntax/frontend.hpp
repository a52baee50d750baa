// docgraph/syntax/frontend.hpp - Parse entry point for one Java source unit
#pragma once

#include <cstddef>

#include "docgraph/basic/diagnostic.hpp"
#include "docgraph/basic/source_manager.hpp"
#include "docgraph/syntax/ts_ll.hpp"

namespace docgraph
{

/// Upper bound on W002 diagnostics reported for a single file.
inline constexpr size_t k_max_syntax_diagnostics = 64;

struct ParsedUnit
{
  FileId file_id = FileId::invalid();
  ts_ll::Tree tree;
  size_t syntax_errors = 0;

  [[nodiscard]] ts_ll::Node root() const noexcept { return tree.root_node(); }
};

/**
 * Parse a registered file with the Java grammar.
 *
 * Tree-sitter recovers from malformed input, so the returned tree is usable
 * even when it contains ERROR/MISSING nodes; each of those is reported as a
 * W002 warning. The tree is null only if the parser itself failed, which is
 * reported as an error.
 */
[[nodiscard]] ParsedUnit parse_java(
  const SourceRegistry & sources, FileId file, DiagnosticBag & diags);

}  // namespace docgraph
