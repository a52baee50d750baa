// docgraph/syntax/ts_ll.cpp - Low-level Tree-sitter wrapper implementation
#include "docgraph/syntax/ts_ll.hpp"

#include <fmt/core.h>

#include <memory>
#include <stdexcept>

namespace docgraph::ts_ll
{

namespace
{

const char * query_error_name(TSQueryError err)
{
  switch (err) {
    case TSQueryErrorSyntax:
      return "syntax error";
    case TSQueryErrorNodeType:
      return "unknown node type";
    case TSQueryErrorField:
      return "unknown field";
    case TSQueryErrorCapture:
      return "invalid capture";
    case TSQueryErrorStructure:
      return "impossible pattern";
    case TSQueryErrorLanguage:
      return "language mismatch";
    default:
      return "unknown error";
  }
}

struct CursorDeleter
{
  void operator()(TSQueryCursor * c) const { ts_query_cursor_delete(c); }
};

}  // namespace

// ============================================================================
// Parser
// ============================================================================

Parser::Parser()
{
  parser_ = ts_parser_new();
  if (parser_ == nullptr) {
    throw std::runtime_error("ts_parser_new() failed");
  }

  const TSLanguage * lang = tree_sitter_java();
  if (lang == nullptr || !ts_parser_set_language(parser_, lang)) {
    ts_parser_delete(parser_);
    parser_ = nullptr;
    throw std::runtime_error("tree-sitter-java grammar is incompatible with the runtime");
  }
}

Parser::~Parser()
{
  if (parser_) ts_parser_delete(parser_);
  parser_ = nullptr;
}

TSTree * Parser::parse_string(std::string_view source) const
{
  return ts_parser_parse_string(
    parser_, /*old_tree*/ nullptr, source.data(), static_cast<uint32_t>(source.size()));
}

// ============================================================================
// Query
// ============================================================================

Query::Query(std::string_view pattern)
{
  uint32_t error_offset = 0;
  TSQueryError error_type = TSQueryErrorNone;
  query_ = ts_query_new(
    tree_sitter_java(), pattern.data(), static_cast<uint32_t>(pattern.size()), &error_offset,
    &error_type);
  if (query_ == nullptr) {
    throw std::invalid_argument(fmt::format(
      "query compilation failed at offset {}: {}", error_offset, query_error_name(error_type)));
  }
}

Query::~Query()
{
  if (query_) ts_query_delete(query_);
  query_ = nullptr;
}

CaptureMap Query::captures(Node root) const
{
  CaptureMap out;
  if (root.is_null()) {
    return out;
  }

  std::unique_ptr<TSQueryCursor, CursorDeleter> cursor(ts_query_cursor_new());
  ts_query_cursor_exec(cursor.get(), query_, root.raw());

  TSQueryMatch match;
  while (ts_query_cursor_next_match(cursor.get(), &match)) {
    for (uint16_t i = 0; i < match.capture_count; ++i) {
      const TSQueryCapture & cap = match.captures[i];
      uint32_t len = 0;
      const char * name = ts_query_capture_name_for_id(query_, cap.index, &len);
      out[std::string(name, len)].emplace_back(cap.node);
    }
  }
  return out;
}

}  // namespace docgraph::ts_ll
