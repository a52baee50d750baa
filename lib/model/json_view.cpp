// docgraph/model/json_view.cpp - JSON views of the entity model
//
#include "docgraph/model/json_view.hpp"

#include <string>

namespace docgraph
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_dependency(const DependencyRef & dep)
{
  return json{
    {"umid", dep.target != nullptr ? dep.target->umid : std::string()},
    {"tier", std::string(to_string(dep.tier))},
    {"ambiguous", dep.ambiguous}};
}

template <typename T, typename Fn>
json j_array(const std::vector<std::unique_ptr<T>> & items, Fn && fn)
{
  json arr = json::array();
  for (const auto & item : items) {
    arr.push_back(fn(*item));
  }
  return arr;
}

}  // namespace

// ============================================================================
// Full model
// ============================================================================

json to_json(const Method & method)
{
  json deps = json::array();
  for (const auto & d : method.dependencies) {
    deps.push_back(j_dependency(d));
  }

  return json{
    {"umid", method.umid},
    {"scoped_identifier", method.scoped_identifier},
    {"identifier", method.identifier},
    {"signature", method.signature},
    {"return_type", method.return_type},
    {"parameters", method.parameters},
    {"arity", method.arity()},
    {"line", method.line},
    {"hash", method.body_hash},
    {"description", method.description},
    {"confidence", method.confidence},
    {"dependencies", std::move(deps)},
    {"unresolved", method.unresolved_dependencies}};
}

json to_json(const Field & field)
{
  return json{
    {"id", field.id},
    {"identifier", field.identifier},
    {"type", field.type},
    {"signature", field.signature},
    {"line", field.line}};
}

json to_json(const Class & cls)
{
  json j{
    {"ucid", cls.ucid},
    {"identifier", cls.identifier},
    {"kind", std::string(to_string(cls.kind))},
    {"signature", cls.signature},
    {"line", cls.line},
    {"description", cls.description},
    {"confidence", cls.confidence},
    {"status", std::string(to_string(cls.annotation_status))}};

  if (cls.annotation_status == AnnotationStatus::Error) {
    j["error"] = cls.annotation_error;
  }
  if (cls.kind == ClassKind::Enum) {
    j["constants"] = cls.constants;
  }

  j["fields"] = j_array(cls.fields, [](const Field & f) { return to_json(f); });
  j["methods"] = j_array(cls.methods, [](const Method & m) { return to_json(m); });
  j["classes"] = j_array(cls.classes, [](const Class & c) { return to_json(c); });
  return j;
}

json to_json(const File & file)
{
  json imports = json::array();
  for (const auto & imp : file.imports) {
    imports.push_back(import_text(imp));
  }

  return json{
    {"ufid", file.ufid},
    {"package", file.package},
    {"imports", std::move(imports)},
    {"classes", j_array(file.classes, [](const Class & c) { return to_json(c); })}};
}

json to_json(const std::vector<std::unique_ptr<File>> & files)
{
  return json{{"files", j_array(files, [](const File & f) { return to_json(f); })}};
}

// ============================================================================
// Skeleton
// ============================================================================

json to_skeleton_json(const Class & cls)
{
  json methods = json::array();
  for (const auto & m : cls.methods) {
    methods.push_back(json{{"signature", m->signature}, {"description", m->description}});
  }

  json fields = json::array();
  for (const auto & f : cls.fields) {
    fields.push_back(f->signature);
  }

  return json{
    {"ucid", cls.ucid},
    {"signature", cls.signature},
    {"description", cls.description},
    {"fields", std::move(fields)},
    {"methods", std::move(methods)},
    {"classes", j_array(cls.classes, [](const Class & c) { return to_skeleton_json(c); })}};
}

json to_skeleton_json(const std::vector<std::unique_ptr<File>> & files)
{
  json out = json::object();
  for (const auto & file : files) {
    out[file->ufid] = j_array(file->classes, [](const Class & c) { return to_skeleton_json(c); });
  }
  return out;
}

}  // namespace docgraph
