// docgraph/syntax/ts_ll.hpp - Low-level Tree-sitter wrapper (CST access)
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "docgraph/basic/source_manager.hpp"

namespace docgraph::ts_ll
{

// Provided by the tree-sitter-java grammar library (see CMakeLists.txt).
extern "C" const TSLanguage * tree_sitter_java();

//------------------------------------------------------------------------------
// Node - thin wrapper around TSNode
//------------------------------------------------------------------------------
class Node
{
public:
  Node() : node_{} {}
  explicit Node(TSNode n) : node_(n) {}

  [[nodiscard]] bool is_null() const noexcept { return ts_node_is_null(node_); }
  [[nodiscard]] bool has_error() const noexcept { return ts_node_has_error(node_); }
  [[nodiscard]] bool is_error() const noexcept { return ts_node_is_error(node_); }
  [[nodiscard]] bool is_missing() const noexcept { return ts_node_is_missing(node_); }

  [[nodiscard]] std::string_view kind() const noexcept
  {
    const char * t = ts_node_type(node_);
    return t ? std::string_view(t) : std::string_view();
  }

  [[nodiscard]] uint32_t start_byte() const noexcept { return ts_node_start_byte(node_); }
  [[nodiscard]] uint32_t end_byte() const noexcept { return ts_node_end_byte(node_); }

  /// 1-indexed line of the first byte
  [[nodiscard]] uint32_t start_line() const noexcept
  {
    return ts_node_start_point(node_).row + 1;
  }

  [[nodiscard]] SourceRange range(FileId file) const noexcept
  {
    return {file, start_byte(), end_byte()};
  }

  [[nodiscard]] std::string_view text(std::string_view source) const noexcept
  {
    if (is_null() || start_byte() > source.size()) {
      return {};
    }
    return source.substr(start_byte(), end_byte() - start_byte());
  }

  [[nodiscard]] uint32_t child_count() const noexcept { return ts_node_child_count(node_); }
  [[nodiscard]] uint32_t named_child_count() const noexcept
  {
    return ts_node_named_child_count(node_);
  }

  [[nodiscard]] Node child(uint32_t i) const noexcept { return Node(ts_node_child(node_, i)); }
  [[nodiscard]] Node named_child(uint32_t i) const noexcept
  {
    return Node(ts_node_named_child(node_, i));
  }

  [[nodiscard]] Node child_by_field(std::string_view field) const noexcept
  {
    return Node(
      ts_node_child_by_field_name(node_, field.data(), static_cast<uint32_t>(field.size())));
  }

  [[nodiscard]] Node parent() const noexcept { return Node(ts_node_parent(node_)); }

  [[nodiscard]] TSNode raw() const noexcept { return node_; }

private:
  TSNode node_;
};

//------------------------------------------------------------------------------
// Parser/Tree - RAII wrappers
//------------------------------------------------------------------------------
class Parser
{
public:
  /// @throws std::runtime_error if the Java grammar cannot be installed
  Parser();
  Parser(const Parser &) = delete;
  Parser & operator=(const Parser &) = delete;
  ~Parser();

  [[nodiscard]] TSTree * parse_string(std::string_view source) const;

private:
  TSParser * parser_ = nullptr;
};

class Tree
{
public:
  explicit Tree(TSTree * t = nullptr) : tree_(t) {}
  Tree(const Tree &) = delete;
  Tree & operator=(const Tree &) = delete;

  Tree(Tree && other) noexcept : tree_(other.tree_) { other.tree_ = nullptr; }
  Tree & operator=(Tree && other) noexcept
  {
    if (this != &other) {
      reset();
      tree_ = other.tree_;
      other.tree_ = nullptr;
    }
    return *this;
  }

  ~Tree() { reset(); }

  void reset(TSTree * t = nullptr)
  {
    if (tree_) ts_tree_delete(tree_);
    tree_ = t;
  }

  [[nodiscard]] bool is_null() const noexcept { return tree_ == nullptr; }

  [[nodiscard]] Node root_node() const noexcept
  {
    return tree_ ? Node(ts_tree_root_node(tree_)) : Node();
  }

private:
  TSTree * tree_ = nullptr;
};

//------------------------------------------------------------------------------
// Query - compiled tree-sitter query over the Java grammar
//------------------------------------------------------------------------------

/// Captured nodes grouped by capture label, each list in match order.
using CaptureMap = std::map<std::string, std::vector<Node>, std::less<>>;

class Query
{
public:
  /// @throws std::invalid_argument when the pattern does not compile
  explicit Query(std::string_view pattern);
  Query(const Query &) = delete;
  Query & operator=(const Query &) = delete;
  ~Query();

  /// Runs the query below `root` and groups every capture by its label.
  [[nodiscard]] CaptureMap captures(Node root) const;

private:
  TSQuery * query_ = nullptr;
};

}  // namespace docgraph::ts_ll
