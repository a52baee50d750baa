// docgraph/annotate/payload.cpp - Generator requests and response validation
#include "docgraph/annotate/payload.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <optional>

namespace docgraph
{

using nlohmann::json;

namespace
{

json j_imports(gsl::span<const Import> imports)
{
  json arr = json::array();
  for (const auto & imp : imports) {
    arr.push_back(import_text(imp));
  }
  return arr;
}

std::optional<int> read_confidence(const json & obj)
{
  const auto it = obj.find("confidence");
  if (it == obj.end() || !it->is_number_integer()) {
    return std::nullopt;
  }
  const auto value = it->get<int64_t>();
  if (value < 0 || value > k_max_confidence) {
    return std::nullopt;
  }
  return static_cast<int>(value);
}

std::optional<std::string> read_string(const json & obj, const char * key)
{
  const auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

ResponseCheck mismatch(std::string detail)
{
  ResponseCheck r;
  r.error = "schema mismatch: " + detail;
  return r;
}

}  // namespace

bool AnnotationRequest::is_requested(size_t index) const noexcept
{
  return std::find(requested.begin(), requested.end(), index) != requested.end();
}

bool needs_annotation(const Class & cls) noexcept
{
  if (cls.description.empty()) {
    return true;
  }
  return std::any_of(cls.methods.begin(), cls.methods.end(), [](const auto & m) {
    return m->description.empty();
  });
}

// ============================================================================
// Requests
// ============================================================================

AnnotationRequest build_request(Class & cls, gsl::span<const Import> imports)
{
  AnnotationRequest req;
  req.cls = &cls;
  for (auto & m : cls.methods) {
    req.methods.push_back(m.get());
  }

  req.warm = std::any_of(req.methods.begin(), req.methods.end(), [](const Method * m) {
    return !m->description.empty();
  });

  json & p = req.payload;
  p["mode"] = req.warm ? "warm" : "cold";
  p["id"] = cls.ucid;
  p["kind"] = std::string(to_string(cls.kind));
  p["signature"] = cls.signature;

  if (!req.warm) {
    p["code"] = cls.body;
    p["imports"] = j_imports(imports);
    json methods = json::object();
    for (size_t i = 0; i < req.methods.size(); ++i) {
      methods[std::to_string(i)] = req.methods[i]->signature;
      req.requested.push_back(i);
    }
    p["methods"] = std::move(methods);
    return req;
  }

  p["imports"] = j_imports(imports);

  json fields = json::array();
  for (const auto & f : cls.fields) {
    fields.push_back(f->signature);
  }
  p["fields"] = std::move(fields);

  json cached = json::object();
  json regenerate = json::object();
  for (size_t i = 0; i < req.methods.size(); ++i) {
    const Method & m = *req.methods[i];
    if (m.description.empty()) {
      regenerate[std::to_string(i)] = m.body;
      req.requested.push_back(i);
    } else {
      cached[std::to_string(i)] = m.description;
    }
  }
  p["cached"] = std::move(cached);
  p["regenerate"] = std::move(regenerate);

  json children = json::array();
  for (const auto & nested : cls.classes) {
    children.push_back(json{
      {"id", nested->ucid},
      {"signature", nested->signature},
      {"description", nested->description}});
  }
  p["children"] = std::move(children);
  return req;
}

// ============================================================================
// Responses
// ============================================================================

ResponseCheck validate_response(const json & response, const AnnotationRequest & request)
{
  if (!response.is_object()) {
    return mismatch("response is not an object");
  }

  const auto id = read_string(response, "id");
  if (!id) {
    return mismatch("missing string 'id'");
  }
  if (*id != request.cls->ucid) {
    return mismatch(fmt::format("id '{}' does not match '{}'", *id, request.cls->ucid));
  }

  ResponseCheck check;
  auto description = read_string(response, "description");
  if (!description) {
    return mismatch("missing string 'description'");
  }
  check.annotation.description = std::move(*description);

  const auto confidence = read_confidence(response);
  if (!confidence) {
    return mismatch("'confidence' must be an integer in [0, 100]");
  }
  check.annotation.confidence = *confidence;

  const auto methods = response.find("methods");
  if (methods == response.end() || !methods->is_array()) {
    return mismatch("missing array 'methods'");
  }

  for (const auto & entry : *methods) {
    if (!entry.is_object()) {
      return mismatch("method entry is not an object");
    }
    const auto index = entry.find("method_index");
    if (index == entry.end() || !index->is_number_integer()) {
      return mismatch("method entry without integer 'method_index'");
    }
    const auto raw_index = index->get<int64_t>();
    if (raw_index < 0 || static_cast<uint64_t>(raw_index) >= request.methods.size()) {
      return mismatch(fmt::format("method_index {} out of range", raw_index));
    }

    MethodAnnotation ma;
    ma.method_index = static_cast<size_t>(raw_index);
    auto method_desc = read_string(entry, "description");
    if (!method_desc) {
      return mismatch(fmt::format("method {} without string 'description'", raw_index));
    }
    ma.description = std::move(*method_desc);
    const auto method_conf = read_confidence(entry);
    if (!method_conf) {
      return mismatch(fmt::format("method {} 'confidence' must be an integer in [0, 100]", raw_index));
    }
    ma.confidence = *method_conf;
    check.annotation.methods.push_back(std::move(ma));
  }

  check.success = true;
  return check;
}

void merge_annotation(const AnnotationRequest & request, const ClassAnnotation & annotation)
{
  Class & cls = *request.cls;
  cls.description = annotation.description;
  cls.confidence = annotation.confidence;
  cls.annotation_status = AnnotationStatus::Ok;
  cls.annotation_error.clear();

  for (const auto & ma : annotation.methods) {
    if (!request.is_requested(ma.method_index)) continue;
    Method & m = *request.methods[ma.method_index];
    m.description = ma.description;
    m.confidence = ma.confidence;
  }
}

}  // namespace docgraph
