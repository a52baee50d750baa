// docgraph/builder/BuildMembers.cpp - CST -> entity model for methods, fields and enum constants
#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "docgraph/builder/entity_builder.hpp"
#include "docgraph/cache/body_hash.hpp"
#include "docgraph/model/ids.hpp"
#include "docgraph/syntax/java_queries.hpp"

namespace docgraph
{

namespace
{

bool is_constructor_kind(std::string_view kind)
{
  return kind == "constructor_declaration" || kind == "compact_constructor_declaration";
}

bool is_annotation_kind(std::string_view kind)
{
  return kind == "marker_annotation" || kind == "annotation";
}

}  // namespace

// ============================================================================
// Methods
// ============================================================================

std::unique_ptr<Method> EntityBuilder::build_method(ts_ll::Node decl, const Class & owner)
{
  auto method = std::make_unique<Method>();
  method->class_ucid = owner.ucid;
  method->line = decl.start_line();
  method->range = node_range(decl);

  if (is_constructor_kind(decl.kind())) {
    method->identifier = std::string(k_constructor_identifier);
    method->return_type = owner.identifier;
  } else {
    method->identifier = name_or_placeholder(decl, k_constructor_identifier, "method");
    const ts_ll::Node type = decl.child_by_field("type");
    method->return_type = type.is_null() ? "void" : collapse_whitespace(node_text(type));
  }

  const Modifiers mods = read_modifiers(decl);
  method->modifiers = mods.all;
  method->type_parameters = read_type_parameters(decl);

  if (decl.kind() == "compact_constructor_declaration") {
    // A compact constructor takes the record components: record_declaration > class_body > decl
    build_parameters(decl.parent().parent().child_by_field("parameters"), *method);
  } else {
    build_parameters(decl.child_by_field("parameters"), *method);
  }

  for (uint32_t i = 0; i < decl.named_child_count(); ++i) {
    const ts_ll::Node c = decl.named_child(i);
    if (c.kind() == "throws") {
      method->throws = read_type_list(c);
    }
  }

  const ts_ll::Node body = decl.child_by_field("body");
  if (!body.is_null()) {
    method->body = std::string(node_text(body));
    collect_call_sites(body, *method);
  }

  method->umid = make_umid(owner.ucid, method->identifier, method->parameter_types);
  method->scoped_identifier = make_scoped_identifier(owner.ucid, method->identifier);
  method->signature = method_signature(*method, mods);
  method->body_hash = compute_hash(method->body);
  return method;
}

void EntityBuilder::build_parameters(ts_ll::Node params, Method & method)
{
  if (params.is_null()) {
    diags_.report_warning(method.range, "method declaration has no parameter list")
      .with_code(diag_codes::k_missing_name);
    return;
  }

  for (uint32_t i = 0; i < params.named_child_count(); ++i) {
    const ts_ll::Node p = params.named_child(i);
    const std::string_view kind = p.kind();

    if (kind == "formal_parameter") {
      std::string type = collapse_whitespace(node_text(p.child_by_field("type")));
      if (const ts_ll::Node dims = p.child_by_field("dimensions"); !dims.is_null()) {
        type += collapse_whitespace(node_text(dims));
      }
      method.parameters.push_back(collapse_whitespace(node_text(p)));
      method.parameter_types.push_back(type.empty() ? std::string(k_unknown_identifier) : type);
    } else if (kind == "spread_parameter") {
      // spread_parameter has no field names: modifiers? type annotation* '...' declarator
      std::string type;
      for (uint32_t j = 0; j < p.named_child_count(); ++j) {
        const ts_ll::Node c = p.named_child(j);
        const std::string_view ck = c.kind();
        if (ck == "modifiers" || ck == "variable_declarator" || is_annotation_kind(ck)) continue;
        type = collapse_whitespace(node_text(c));
        break;
      }
      method.parameters.push_back(collapse_whitespace(node_text(p)));
      method.parameter_types.push_back(
        (type.empty() ? std::string(k_unknown_identifier) : type) + "...");
      method.is_variadic = true;
    }
    // receiver_parameter ("Foo this") is not an argument.
  }
}

void EntityBuilder::collect_call_sites(ts_ll::Node body, Method & method) const
{
  struct Found
  {
    uint32_t offset;
    CallSite site;
  };
  std::vector<Found> found;

  const ts_ll::CaptureMap caps = call_query_.captures(body);

  if (auto it = caps.find(queries::k_call_capture); it != caps.end()) {
    for (const ts_ll::Node & call : it->second) {
      CallSite site;
      site.name = std::string(node_text(call.child_by_field("name")));
      site.text = site.name + collapse_whitespace(node_text(call.child_by_field("arguments")));
      site.argument_count = count_call_arguments(site.text);
      site.line = call.start_line();
      found.push_back({call.start_byte(), std::move(site)});
    }
  }

  if (auto it = caps.find(queries::k_ctor_call_capture); it != caps.end()) {
    for (const ts_ll::Node & call : it->second) {
      CallSite site;
      site.name = std::string(k_constructor_identifier);
      site.text = site.name + collapse_whitespace(node_text(call.child_by_field("arguments")));
      site.argument_count = count_call_arguments(site.text);
      site.line = call.start_line();
      found.push_back({call.start_byte(), std::move(site)});
    }
  }

  std::stable_sort(found.begin(), found.end(), [](const Found & a, const Found & b) {
    return a.offset < b.offset;
  });

  for (auto & f : found) {
    if (f.site.name.empty()) continue;
    const bool seen = std::any_of(
      method.calls.begin(), method.calls.end(), [&](const CallSite & c) {
        return c.name == f.site.name && c.argument_count == f.site.argument_count;
      });
    if (!seen) {
      method.calls.push_back(std::move(f.site));
    }
  }
}

// ============================================================================
// Fields
// ============================================================================

std::unique_ptr<Field> EntityBuilder::build_field(ts_ll::Node decl, const Class & owner)
{
  auto field = std::make_unique<Field>();
  field->line = decl.start_line();
  field->range = node_range(decl);
  field->type = collapse_whitespace(node_text(decl.child_by_field("type")));
  if (field->type.empty()) {
    field->type = std::string(k_unknown_identifier);
  }

  // Only the first declarator of "int x, y;" is represented.
  std::string value;
  const ts_ll::Node declarator = decl.child_by_field("declarator");
  if (declarator.is_null()) {
    diags_
      .report_warning(
        node_range(decl), "field declaration has no declarator",
        fmt::format("recovered as '{}'", k_unknown_identifier))
      .with_code(diag_codes::k_missing_name);
    field->identifier = std::string(k_unknown_identifier);
  } else {
    field->identifier = name_or_placeholder(declarator, k_unknown_identifier, "field");
    if (const ts_ll::Node dims = declarator.child_by_field("dimensions"); !dims.is_null()) {
      field->type += collapse_whitespace(node_text(dims));
    }
    value = collapse_whitespace(node_text(declarator.child_by_field("value")));
  }

  field->id = make_field_id(owner.ucid, field->identifier);
  if (owner.find_field(field->id) != nullptr) {
    diags_.report_warning(field->range, fmt::format("duplicate field '{}'", field->id))
      .with_code(diag_codes::k_duplicate_field);
    return nullptr;
  }

  field->signature = field_signature(read_modifiers(decl), field->type, field->identifier, value);
  return field;
}

// ============================================================================
// Enum constants
// ============================================================================

std::string EntityBuilder::build_enum_constant(ts_ll::Node constant)
{
  std::string text = name_or_placeholder(constant, k_unknown_identifier, "enum constant");
  if (const ts_ll::Node args = constant.child_by_field("arguments"); !args.is_null()) {
    text += collapse_whitespace(node_text(args));
  }
  return text;
}

}  // namespace docgraph
