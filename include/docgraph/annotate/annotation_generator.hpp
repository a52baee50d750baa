// docgraph/annotate/annotation_generator.hpp - Interface to a description generator
#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace docgraph
{

enum class GenerationStatus {
  Ok,
  Transient,  // rate limited or temporarily unavailable; worth retrying
  Terminal,   // will not succeed on retry
};

struct GenerationResult
{
  GenerationStatus status = GenerationStatus::Terminal;
  nlohmann::json response;
  std::string error;

  [[nodiscard]] bool is_ok() const noexcept { return status == GenerationStatus::Ok; }

  static GenerationResult ok(nlohmann::json body)
  {
    GenerationResult r;
    r.status = GenerationStatus::Ok;
    r.response = std::move(body);
    return r;
  }

  static GenerationResult transient(std::string msg)
  {
    GenerationResult r;
    r.status = GenerationStatus::Transient;
    r.error = std::move(msg);
    return r;
  }

  static GenerationResult terminal(std::string msg)
  {
    GenerationResult r;
    r.status = GenerationStatus::Terminal;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Produces descriptions for one class per call.
 *
 * generate() is called from several worker threads at once and must be safe
 * for concurrent use.
 */
class AnnotationGenerator
{
public:
  virtual ~AnnotationGenerator() = default;

  [[nodiscard]] virtual GenerationResult generate(const nlohmann::json & request) = 0;
};

}  // namespace docgraph
