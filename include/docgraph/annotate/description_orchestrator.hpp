// docgraph/annotate/description_orchestrator.hpp - Concurrent class annotation
#pragma once

#include <chrono>
#include <functional>
#include <gsl/span>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "docgraph/annotate/annotation_generator.hpp"
#include "docgraph/annotate/payload.hpp"
#include "docgraph/model/entity.hpp"

namespace docgraph
{

struct OrchestratorOptions
{
  size_t max_concurrency = 4;
  int max_attempts = 3;
  std::chrono::milliseconds base_backoff{500};
  std::chrono::milliseconds max_backoff{8000};

  /// Called between attempts. Defaults to std::this_thread::sleep_for.
  std::function<void(std::chrono::milliseconds)> sleep;
};

struct ClassOutcome
{
  std::string ucid;
  AnnotationStatus status = AnnotationStatus::Pending;
  int attempts = 0;
  std::string error;
};

struct AnnotationReport
{
  std::vector<ClassOutcome> outcomes;  // in scheduling order
  size_t scheduled = 0;
  size_t succeeded = 0;
  size_t failed = 0;
  size_t skipped = 0;  // fully described classes, no call made
  size_t retries = 0;

  [[nodiscard]] const ClassOutcome * find(std::string_view ucid) const noexcept;
};

/// Delay before attempt `attempt + 1`, given `attempt` failed (1-based).
[[nodiscard]] std::chrono::milliseconds backoff_delay(
  int attempt, std::chrono::milliseconds base, std::chrono::milliseconds max);

/**
 * Runs one generator call per class that needs annotation.
 *
 * Anything thrown by the generator or by the sleep function fails only the
 * class being annotated.
 *
 * All requests are built before the first call. Each worker writes only to the
 * class of the task it holds and that class's methods; the report is filled in
 * after all workers have joined.
 */
class DescriptionOrchestrator
{
public:
  DescriptionOrchestrator(AnnotationGenerator & generator, OrchestratorOptions options);

  AnnotationReport annotate(gsl::span<const std::unique_ptr<File>> files);

private:
  struct Task
  {
    AnnotationRequest request;
    ClassOutcome outcome;
  };

  void run_task(Task & task);
  GenerationResult call_generator(const nlohmann::json & payload);

  /// Sleeps before the next attempt. Returns an error if the sleep threw.
  std::optional<std::string> wait_before_retry(int attempt);

  AnnotationGenerator & generator_;
  OrchestratorOptions options_;
};

}  // namespace docgraph
