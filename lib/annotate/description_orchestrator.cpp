// docgraph/annotate/description_orchestrator.cpp - Concurrent class annotation
#include "docgraph/annotate/description_orchestrator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_set>

namespace docgraph
{

const ClassOutcome * AnnotationReport::find(std::string_view ucid) const noexcept
{
  for (const auto & o : outcomes) {
    if (o.ucid == ucid) return &o;
  }
  return nullptr;
}

std::chrono::milliseconds backoff_delay(
  int attempt, std::chrono::milliseconds base, std::chrono::milliseconds max)
{
  if (attempt < 1) attempt = 1;
  auto delay = base;
  for (int i = 1; i < attempt; ++i) {
    if (delay >= max) break;
    delay *= 2;
  }
  return std::min(delay, max);
}

DescriptionOrchestrator::DescriptionOrchestrator(
  AnnotationGenerator & generator, OrchestratorOptions options)
: generator_(generator), options_(std::move(options))
{
  if (options_.max_concurrency == 0) options_.max_concurrency = 1;
  if (options_.max_attempts < 1) options_.max_attempts = 1;
  if (!options_.sleep) {
    options_.sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

// ============================================================================
// Scheduling
// ============================================================================

AnnotationReport DescriptionOrchestrator::annotate(gsl::span<const std::unique_ptr<File>> files)
{
  AnnotationReport report;

  // Build every request up front; workers only see their own task.
  std::vector<Task> tasks;
  std::unordered_set<std::string> visited;
  for (const auto & file : files) {
    for_each_class_in_file(*file, [&](Class & cls) {
      if (!visited.insert(cls.ucid).second) return;
      if (!needs_annotation(cls)) {
        ++report.skipped;
        return;
      }
      Task task;
      task.request = build_request(cls, file->imports);
      task.outcome.ucid = cls.ucid;
      tasks.push_back(std::move(task));
    });
  }

  report.scheduled = tasks.size();
  if (tasks.empty()) {
    return report;
  }

  std::mutex queue_mutex;
  std::deque<Task *> queue;
  for (auto & task : tasks) {
    queue.push_back(&task);
  }

  auto worker = [&]() {
    for (;;) {
      Task * task = nullptr;
      {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (queue.empty()) return;
        task = queue.front();
        queue.pop_front();
      }
      run_task(*task);
    }
  };

  const size_t n_workers = std::min(options_.max_concurrency, tasks.size());
  std::vector<std::thread> workers;
  workers.reserve(n_workers);
  for (size_t i = 0; i < n_workers; ++i) {
    workers.emplace_back(worker);
  }
  for (auto & t : workers) {
    t.join();
  }

  for (auto & task : tasks) {
    if (task.outcome.status == AnnotationStatus::Ok) {
      ++report.succeeded;
    } else {
      ++report.failed;
    }
    if (task.outcome.attempts > 1) {
      report.retries += static_cast<size_t>(task.outcome.attempts - 1);
    }
    report.outcomes.push_back(std::move(task.outcome));
  }
  return report;
}

// ============================================================================
// One class
// ============================================================================

GenerationResult DescriptionOrchestrator::call_generator(const nlohmann::json & payload)
{
  try {
    return generator_.generate(payload);
  } catch (const std::exception & e) {
    return GenerationResult::terminal(std::string("generator threw: ") + e.what());
  } catch (...) {
    return GenerationResult::terminal("generator threw a non-standard exception");
  }
}

std::optional<std::string> DescriptionOrchestrator::wait_before_retry(int attempt)
{
  try {
    options_.sleep(backoff_delay(attempt, options_.base_backoff, options_.max_backoff));
  } catch (const std::exception & e) {
    return std::string("backoff failed: ") + e.what();
  } catch (...) {
    return std::string("backoff failed with a non-standard exception");
  }
  return std::nullopt;
}

void DescriptionOrchestrator::run_task(Task & task)
{
  Class & cls = *task.request.cls;
  ClassOutcome & outcome = task.outcome;

  auto fail = [&](std::string message) {
    outcome.status = AnnotationStatus::Error;
    outcome.error = message;
    cls.annotation_status = AnnotationStatus::Error;
    cls.annotation_error = std::move(message);
  };

  for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
    outcome.attempts = attempt;
    GenerationResult result = call_generator(task.request.payload);

    if (result.status == GenerationStatus::Transient) {
      if (attempt == options_.max_attempts) {
        fail(fmt::format("gave up after {} attempts: {}", attempt, result.error));
        return;
      }
      if (auto error = wait_before_retry(attempt)) {
        fail(std::move(*error));
        return;
      }
      continue;
    }

    if (result.status == GenerationStatus::Terminal) {
      fail(result.error);
      return;
    }

    ResponseCheck check = validate_response(result.response, task.request);
    if (!check.success) {
      fail(check.error);
      return;
    }
    merge_annotation(task.request, check.annotation);
    outcome.status = AnnotationStatus::Ok;
    return;
  }
}

}  // namespace docgraph
