// docgraph/syntax/frontend.cpp - Parse entry point
#include "docgraph/syntax/frontend.hpp"

#include <fmt/core.h>

namespace docgraph
{

namespace
{

void collect_syntax_diagnostics(
  const ts_ll::Node n, FileId file, DiagnosticBag & diags, size_t & count)
{
  if (count >= k_max_syntax_diagnostics) return;
  if (n.is_null()) return;

  if (n.is_error()) {
    diags.report_warning(n.range(file), "syntax error", "parser recovered here")
      .with_code(diag_codes::k_syntax_error);
    ++count;
    // Children of an ERROR node are part of the same recovery.
    return;
  }
  if (n.is_missing()) {
    diags.report_warning(n.range(file), "syntax error", fmt::format("missing '{}'", n.kind()))
      .with_code(diag_codes::k_syntax_error);
    ++count;
    return;
  }

  if (!n.has_error()) return;

  for (uint32_t i = 0; i < n.child_count(); ++i) {
    collect_syntax_diagnostics(n.child(i), file, diags, count);
    if (count >= k_max_syntax_diagnostics) return;
  }
}

}  // namespace

ParsedUnit parse_java(const SourceRegistry & sources, FileId file, DiagnosticBag & diags)
{
  ParsedUnit unit;
  unit.file_id = file;

  const SourceFile * src = sources.get_file(file);
  if (src == nullptr) {
    diags.report_error({}, "cannot parse an unregistered file");
    return unit;
  }

  const ts_ll::Parser parser;
  unit.tree.reset(parser.parse_string(src->content()));

  if (unit.tree.is_null()) {
    diags.report_error(SourceRange(file, 0, 0), "tree-sitter parse failed (null tree)");
    return unit;
  }

  const ts_ll::Node root = unit.root();
  if (root.has_error()) {
    collect_syntax_diagnostics(root, file, diags, unit.syntax_errors);
  }
  return unit;
}

}  // namespace docgraph
