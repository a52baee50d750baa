// docgraph/builder/BuildSignature.cpp - Modifiers, type lists and display signatures
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

#include "docgraph/builder/entity_builder.hpp"
#include "docgraph/model/ids.hpp"

namespace docgraph
{

namespace
{

bool is_visibility(std::string_view kw)
{
  return kw == "public" || kw == "protected" || kw == "private";
}

bool is_comment(std::string_view kind)
{
  return kind == "line_comment" || kind == "block_comment";
}

// Space-join the non-empty parts.
std::string join_parts(const std::vector<std::string> & parts)
{
  std::string out;
  for (const auto & p : parts) {
    if (p.empty()) continue;
    if (!out.empty()) out += ' ';
    out += p;
  }
  return out;
}

std::string keyword_if(const Modifiers & mods, std::string_view kw)
{
  return mods.has(kw) ? std::string(kw) : std::string();
}

std::string visibility_part(const Modifiers & mods)
{
  return mods.is_package_private() ? std::string() : mods.visibility;
}

}  // namespace

// ============================================================================
// Modifiers
// ============================================================================

bool Modifiers::has(std::string_view keyword) const noexcept
{
  return std::find(keywords.begin(), keywords.end(), keyword) != keywords.end();
}

bool Modifiers::is_package_private() const noexcept { return visibility == k_package_private; }

Modifiers EntityBuilder::read_modifiers(ts_ll::Node decl) const
{
  Modifiers mods;

  ts_ll::Node mod_node;
  for (uint32_t i = 0; i < decl.named_child_count(); ++i) {
    const ts_ll::Node c = decl.named_child(i);
    if (c.kind() == "modifiers") {
      mod_node = c;
      break;
    }
  }
  if (mod_node.is_null()) {
    return mods;
  }

  for (uint32_t i = 0; i < mod_node.child_count(); ++i) {
    const ts_ll::Node c = mod_node.child(i);
    const std::string_view kind = c.kind();
    if (is_comment(kind) || c.is_error() || c.is_missing()) continue;

    if (kind == "marker_annotation" || kind == "annotation") {
      std::string text = collapse_whitespace(node_text(c));
      if (mods.marker.empty()) {
        mods.marker = text;
      }
      mods.all.push_back(std::move(text));
      continue;
    }

    const std::string kw(node_text(c));
    if (is_visibility(kw)) {
      mods.visibility = kw;
    } else {
      mods.keywords.push_back(kw);
    }
    mods.all.push_back(kw);
  }
  return mods;
}

std::vector<std::string> EntityBuilder::read_type_parameters(ts_ll::Node decl) const
{
  std::vector<std::string> out;
  const ts_ll::Node tp = decl.child_by_field("type_parameters");
  if (tp.is_null()) {
    return out;
  }
  for (uint32_t i = 0; i < tp.named_child_count(); ++i) {
    const ts_ll::Node c = tp.named_child(i);
    if (c.kind() == "type_parameter") {
      out.push_back(collapse_whitespace(node_text(c)));
    }
  }
  return out;
}

// Types listed by "extends S", "implements A, B", "extends A, B" or "throws X, Y".
std::vector<std::string> EntityBuilder::read_type_list(ts_ll::Node clause) const
{
  std::vector<std::string> out;
  for (uint32_t i = 0; i < clause.named_child_count(); ++i) {
    const ts_ll::Node c = clause.named_child(i);
    if (is_comment(c.kind())) continue;
    if (c.kind() == "type_list") {
      for (uint32_t j = 0; j < c.named_child_count(); ++j) {
        if (!is_comment(c.named_child(j).kind())) {
          out.push_back(collapse_whitespace(node_text(c.named_child(j))));
        }
      }
    } else {
      out.push_back(collapse_whitespace(node_text(c)));
    }
  }
  return out;
}

// ============================================================================
// Signatures
// ============================================================================

std::string EntityBuilder::method_signature(const Method & method, const Modifiers & mods)
{
  std::string core = fmt::format("{} {}", method.return_type, method.identifier);
  if (!method.type_parameters.empty()) {
    core += fmt::format("<{}>", fmt::join(method.type_parameters, ", "));
  }
  core += fmt::format("({})", fmt::join(method.parameters, ", "));

  std::string throws_clause;
  if (!method.throws.empty()) {
    throws_clause = fmt::format("throws {}", fmt::join(method.throws, ", "));
  }

  return join_parts({
    mods.marker,
    visibility_part(mods),
    keyword_if(mods, "abstract"),
    keyword_if(mods, "static"),
    keyword_if(mods, "final"),
    keyword_if(mods, "synchronized"),
    core,
    throws_clause,
  });
}

std::string EntityBuilder::field_signature(
  const Modifiers & mods, std::string_view type, std::string_view name, std::string_view value)
{
  std::string sig = join_parts({
    mods.marker,
    visibility_part(mods),
    keyword_if(mods, "static"),
    keyword_if(mods, "final"),
    keyword_if(mods, "volatile"),
    keyword_if(mods, "transient"),
    fmt::format("{} {}", type, name),
  });
  if (!value.empty()) {
    sig += fmt::format(" = {}", value);
  }
  return sig;
}

std::string EntityBuilder::class_signature(const Class & cls, const Modifiers & mods)
{
  std::string head = fmt::format("{} {}", keyword(cls.kind), cls.identifier);
  if (!cls.type_parameters.empty()) {
    head += fmt::format("<{}>", fmt::join(cls.type_parameters, ", "));
  }
  if (cls.kind == ClassKind::Record) {
    head += fmt::format("({})", fmt::join(cls.record_components, ", "));
  }

  std::string extends_clause;
  std::string implements_clause;
  if (cls.kind == ClassKind::Interface) {
    if (!cls.interfaces.empty()) {
      extends_clause = fmt::format("extends {}", fmt::join(cls.interfaces, ", "));
    }
  } else {
    if (!cls.superclass.empty()) {
      extends_clause = fmt::format("extends {}", cls.superclass);
    }
    if (!cls.interfaces.empty()) {
      implements_clause = fmt::format("implements {}", fmt::join(cls.interfaces, ", "));
    }
  }

  return join_parts({
    mods.marker,
    visibility_part(mods),
    keyword_if(mods, "abstract"),
    keyword_if(mods, "static"),
    keyword_if(mods, "final"),
    head,
    extends_clause,
    implements_clause,
  });
}

}  // namespace docgraph
