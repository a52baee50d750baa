// docgraph/builder/entity_builder.hpp - Tree-sitter CST -> entity model builder
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "docgraph/basic/diagnostic.hpp"
#include "docgraph/basic/source_manager.hpp"
#include "docgraph/model/entity.hpp"
#include "docgraph/resolve/symbol_registry.hpp"
#include "docgraph/syntax/ts_ll.hpp"

namespace docgraph
{

/**
 * Modifier list of one declaration, split the way signatures need it.
 */
struct Modifiers
{
  std::string marker;                            // first annotation, e.g. "@Override"
  std::string visibility{"package-private"};     // public | protected | private | package-private
  std::vector<std::string> keywords;             // abstract, static, final, ... in source order
  std::vector<std::string> all;                  // annotations and keywords in source order

  [[nodiscard]] bool has(std::string_view keyword) const noexcept;
  [[nodiscard]] bool is_package_private() const noexcept;
};

/**
 * Builds one File from one parsed Java compilation unit.
 *
 * Every Class and Method is registered in the SymbolRegistry as soon as it is
 * created. A declaration whose id is already registered is reported (W003 for
 * classes, W004 for methods) and left out of the model. Malformed members
 * never abort the build: placeholders are used and W001 is reported.
 *
 * The builder owns nothing but the call-site query; it writes into the
 * returned File, the registry and the diagnostic bag.
 */
class EntityBuilder
{
public:
  /// @throws std::invalid_argument if the call-site query does not compile
  EntityBuilder(
    const SourceFile & source, FileId file_id, SymbolRegistry & registry, DiagnosticBag & diags);

  [[nodiscard]] std::unique_ptr<File> build_file(ts_ll::Node program_node);

private:
  // Declarations
  [[nodiscard]] std::unique_ptr<Class> build_class(ts_ll::Node decl, std::string_view scope);
  void build_package(ts_ll::Node package_node, File & file);
  [[nodiscard]] Import build_import(ts_ll::Node import_node) const;

  void build_class_members(ts_ll::Node body, Class & cls);
  void build_enum_body(ts_ll::Node body, Class & cls);
  void build_member(ts_ll::Node member, Class & cls);
  void adopt_class(std::unique_ptr<Class> cls, std::vector<std::unique_ptr<Class>> & out);
  void adopt_method(std::unique_ptr<Method> method, Class & cls);

  // Members (BuildMembers.cpp)
  [[nodiscard]] std::unique_ptr<Method> build_method(ts_ll::Node decl, const Class & owner);
  [[nodiscard]] std::unique_ptr<Field> build_field(ts_ll::Node decl, const Class & owner);
  [[nodiscard]] std::string build_enum_constant(ts_ll::Node constant);
  void build_parameters(ts_ll::Node params, Method & method);
  void collect_call_sites(ts_ll::Node body, Method & method) const;

  // Signatures (BuildSignature.cpp)
  [[nodiscard]] Modifiers read_modifiers(ts_ll::Node decl) const;
  [[nodiscard]] std::vector<std::string> read_type_parameters(ts_ll::Node decl) const;
  [[nodiscard]] std::vector<std::string> read_type_list(ts_ll::Node clause) const;
  [[nodiscard]] static std::string method_signature(const Method & method, const Modifiers & mods);
  [[nodiscard]] static std::string field_signature(
    const Modifiers & mods, std::string_view type, std::string_view name, std::string_view value);
  [[nodiscard]] static std::string class_signature(const Class & cls, const Modifiers & mods);

  // Utility
  [[nodiscard]] std::string_view node_text(ts_ll::Node n) const;
  [[nodiscard]] SourceRange node_range(ts_ll::Node n) const noexcept;
  [[nodiscard]] std::string name_or_placeholder(
    ts_ll::Node decl, std::string_view placeholder, std::string_view what);

  const SourceFile & source_;
  FileId file_id_;
  SymbolRegistry & registry_;
  DiagnosticBag & diags_;
  ts_ll::Query call_query_;
};

/// Whitespace runs collapsed to one space, ends trimmed.
[[nodiscard]] std::string collapse_whitespace(std::string_view text);

}  // namespace docgraph
