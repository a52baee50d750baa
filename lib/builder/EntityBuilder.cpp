// docgraph/builder/EntityBuilder.cpp - CST -> entity model for files and classes
#include <fmt/core.h>

#include <utility>

#include "docgraph/builder/entity_builder.hpp"
#include "docgraph/cache/body_hash.hpp"
#include "docgraph/model/ids.hpp"
#include "docgraph/syntax/java_queries.hpp"

namespace docgraph
{

namespace
{

bool is_type_declaration(std::string_view kind)
{
  return kind == "class_declaration" || kind == "interface_declaration" ||
         kind == "enum_declaration" || kind == "record_declaration";
}

ClassKind class_kind_of(std::string_view kind)
{
  if (kind == "interface_declaration") return ClassKind::Interface;
  if (kind == "enum_declaration") return ClassKind::Enum;
  if (kind == "record_declaration") return ClassKind::Record;
  return ClassKind::Class;
}

}  // namespace

EntityBuilder::EntityBuilder(
  const SourceFile & source, FileId file_id, SymbolRegistry & registry, DiagnosticBag & diags)
: source_(source),
  file_id_(file_id),
  registry_(registry),
  diags_(diags),
  call_query_(queries::k_call_sites)
{
}

// ============================================================================
// File
// ============================================================================

std::unique_ptr<File> EntityBuilder::build_file(ts_ll::Node program_node)
{
  auto file = std::make_unique<File>();
  file->ufid = source_.name();
  file->file_id = file_id_;

  if (program_node.is_null()) {
    return file;
  }

  // The package must be known before any class id is formed, so collect it
  // first even if declarations precede it in a malformed file.
  for (uint32_t i = 0; i < program_node.named_child_count(); ++i) {
    const ts_ll::Node child = program_node.named_child(i);
    if (child.kind() == "package_declaration") {
      build_package(child, *file);
      break;
    }
  }

  for (uint32_t i = 0; i < program_node.named_child_count(); ++i) {
    const ts_ll::Node child = program_node.named_child(i);
    const std::string_view kind = child.kind();

    if (kind == "import_declaration") {
      Import imp = build_import(child);
      if (!imp.name.empty()) {
        file->imports.push_back(std::move(imp));
      }
    } else if (is_type_declaration(kind)) {
      adopt_class(build_class(child, file->package), file->classes);
    }
  }

  return file;
}

void EntityBuilder::build_package(ts_ll::Node package_node, File & file)
{
  for (uint32_t i = 0; i < package_node.named_child_count(); ++i) {
    const ts_ll::Node c = package_node.named_child(i);
    if (c.kind() == "scoped_identifier" || c.kind() == "identifier") {
      file.package = collapse_whitespace(node_text(c));
      return;
    }
  }
  diags_.report_warning(node_range(package_node), "package declaration has no name")
    .with_code(diag_codes::k_missing_name);
}

Import EntityBuilder::build_import(ts_ll::Node import_node) const
{
  Import imp;
  for (uint32_t i = 0; i < import_node.child_count(); ++i) {
    const ts_ll::Node c = import_node.child(i);
    const std::string_view kind = c.kind();
    if (kind == "static") {
      imp.is_static = true;
    } else if (kind == "asterisk") {
      imp.is_wildcard = true;
    } else if (kind == "scoped_identifier" || kind == "identifier") {
      imp.name = collapse_whitespace(node_text(c));
    }
  }
  return imp;
}

// ============================================================================
// Classes
// ============================================================================

std::unique_ptr<Class> EntityBuilder::build_class(ts_ll::Node decl, std::string_view scope)
{
  auto cls = std::make_unique<Class>();
  cls->kind = class_kind_of(decl.kind());
  cls->identifier = name_or_placeholder(decl, k_unknown_identifier, keyword(cls->kind));
  cls->ucid = make_ucid(scope, cls->identifier);
  cls->line = decl.start_line();
  cls->range = node_range(decl);

  if (!registry_.register_class(*cls)) {
    diags_.report_warning(node_range(decl), fmt::format("duplicate class '{}'", cls->ucid))
      .with_code(diag_codes::k_duplicate_class)
      .with_help("the first declaration is kept and this one is ignored");
    return nullptr;
  }

  const Modifiers mods = read_modifiers(decl);
  cls->modifiers = mods.all;
  cls->type_parameters = read_type_parameters(decl);

  if (const ts_ll::Node sc = decl.child_by_field("superclass"); !sc.is_null()) {
    const auto types = read_type_list(sc);
    if (!types.empty()) cls->superclass = types.front();
  }
  if (const ts_ll::Node si = decl.child_by_field("interfaces"); !si.is_null()) {
    cls->interfaces = read_type_list(si);
  }
  // Interfaces list their super-interfaces in an unnamed extends_interfaces child.
  for (uint32_t i = 0; i < decl.named_child_count(); ++i) {
    const ts_ll::Node c = decl.named_child(i);
    if (c.kind() == "extends_interfaces") {
      cls->interfaces = read_type_list(c);
    }
  }
  if (cls->kind == ClassKind::Record) {
    const ts_ll::Node params = decl.child_by_field("parameters");
    for (uint32_t i = 0; !params.is_null() && i < params.named_child_count(); ++i) {
      cls->record_components.push_back(collapse_whitespace(node_text(params.named_child(i))));
    }
  }

  cls->signature = class_signature(*cls, mods);

  const ts_ll::Node body = decl.child_by_field("body");
  if (body.is_null()) {
    diags_
      .report_warning(
        node_range(decl), fmt::format("{} '{}' has no body", keyword(cls->kind), cls->ucid))
      .with_code(diag_codes::k_missing_name);
  } else {
    cls->body = std::string(node_text(body));
    if (cls->kind == ClassKind::Enum) {
      build_enum_body(body, *cls);
    } else {
      build_class_members(body, *cls);
    }
  }
  cls->body_hash = compute_hash(cls->body);

  return cls;
}

void EntityBuilder::build_enum_body(ts_ll::Node body, Class & cls)
{
  for (uint32_t i = 0; i < body.named_child_count(); ++i) {
    const ts_ll::Node c = body.named_child(i);
    if (c.kind() == "enum_constant") {
      cls.constants.push_back(build_enum_constant(c));
    } else if (c.kind() == "enum_body_declarations") {
      build_class_members(c, cls);
    }
  }
}

void EntityBuilder::build_class_members(ts_ll::Node body, Class & cls)
{
  for (uint32_t i = 0; i < body.named_child_count(); ++i) {
    build_member(body.named_child(i), cls);
  }
}

void EntityBuilder::build_member(ts_ll::Node member, Class & cls)
{
  const std::string_view kind = member.kind();

  if (
    kind == "method_declaration" || kind == "constructor_declaration" ||
    kind == "compact_constructor_declaration") {
    adopt_method(build_method(member, cls), cls);
  } else if (kind == "field_declaration" || kind == "constant_declaration") {
    if (auto field = build_field(member, cls)) {
      cls.fields.push_back(std::move(field));
    }
  } else if (is_type_declaration(kind)) {
    adopt_class(build_class(member, cls.ucid), cls.classes);
  }
  // Initializer blocks, annotation type declarations and stray tokens carry
  // no entities.
}

void EntityBuilder::adopt_class(std::unique_ptr<Class> cls, std::vector<std::unique_ptr<Class>> & out)
{
  if (cls) {
    out.push_back(std::move(cls));
  }
}

void EntityBuilder::adopt_method(std::unique_ptr<Method> method, Class & cls)
{
  if (!registry_.register_method(*method)) {
    diags_.report_warning(method->range, fmt::format("duplicate method '{}'", method->umid))
      .with_code(diag_codes::k_duplicate_method)
      .with_help("the first declaration is kept and this one is ignored");
    return;
  }
  cls.methods.push_back(std::move(method));
}

// ============================================================================
// Utility
// ============================================================================

std::string_view EntityBuilder::node_text(ts_ll::Node n) const { return n.text(source_.content()); }

SourceRange EntityBuilder::node_range(ts_ll::Node n) const noexcept
{
  if (n.is_null()) {
    return {};
  }
  return n.range(file_id_);
}

std::string EntityBuilder::name_or_placeholder(
  ts_ll::Node decl, std::string_view placeholder, std::string_view what)
{
  const ts_ll::Node name = decl.child_by_field("name");
  if (!name.is_null() && !name.is_missing() && name.end_byte() > name.start_byte()) {
    return std::string(node_text(name));
  }

  diags_
    .report_warning(
      node_range(decl), fmt::format("{} declaration has no name", what),
      fmt::format("recovered as '{}'", placeholder))
    .with_code(diag_codes::k_missing_name);
  return std::string(placeholder);
}

std::string collapse_whitespace(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char c : text) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out += ' ';
      pending_space = false;
    }
    out += c;
  }
  return out;
}

}  // namespace docgraph
