// docgraph/annotate/payload.hpp - Generator requests and response validation
//
// Cold request (no cached method description in the class):
//   {"mode": "cold", "id", "kind", "signature", "code", "imports",
//    "methods": {"0": "<signature>", ...}}
//
// Warm request:
//   {"mode": "warm", "id", "kind", "signature", "imports", "fields",
//    "cached": {"<i>": "<description>"}, "regenerate": {"<i>": "<body>"},
//    "children": [{"id", "signature", "description"}]}
//
// Response:
//   {"id": "<ucid>", "description": "...", "confidence": 0-100,
//    "methods": [{"method_index": i, "description": "...", "confidence": 0-100}]}
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "docgraph/model/entity.hpp"

namespace docgraph
{

inline constexpr int k_max_confidence = 100;

/**
 * One prepared generator call.
 *
 * Method indices are positions in `methods` and are fixed when the request
 * is built; the response is mapped back through the same table.
 */
struct AnnotationRequest
{
  Class * cls = nullptr;
  std::vector<Method *> methods;
  std::vector<size_t> requested;  // indices the generator is asked to describe
  bool warm = false;
  nlohmann::json payload;

  [[nodiscard]] bool is_requested(size_t index) const noexcept;
};

struct MethodAnnotation
{
  size_t method_index = 0;
  std::string description;
  int confidence = 0;
};

struct ClassAnnotation
{
  std::string description;
  int confidence = 0;
  std::vector<MethodAnnotation> methods;
};

struct ResponseCheck
{
  bool success = false;
  ClassAnnotation annotation;
  std::string error;
};

/// True if the class or any of its own methods has no description.
[[nodiscard]] bool needs_annotation(const Class & cls) noexcept;

[[nodiscard]] AnnotationRequest build_request(Class & cls, gsl::span<const Import> imports);

/// Check a response against the schema and the request's index table.
[[nodiscard]] ResponseCheck validate_response(
  const nlohmann::json & response, const AnnotationRequest & request);

/// Write a validated annotation into the class and its requested methods.
void merge_annotation(const AnnotationRequest & request, const ClassAnnotation & annotation);

}  // namespace docgraph
