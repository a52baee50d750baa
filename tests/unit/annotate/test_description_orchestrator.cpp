#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "docgraph/annotate/description_orchestrator.hpp"
#include "docgraph/test_support/parse_helpers.hpp"

using namespace docgraph;
using nlohmann::json;
using docgraph::test_support::index_sources;

namespace
{

/// Describes every requested method. Per-class behaviour is scripted by ucid.
class ScriptedGenerator : public AnnotationGenerator
{
public:
  enum class Mode { Succeed, Terminal, Throw, ThrowNonStandard, BadSchema };

  std::map<std::string, Mode> modes;
  std::map<std::string, int> transient_failures;  // remaining transient failures per ucid

  GenerationResult generate(const json & request) override
  {
    const std::string id = request.at("id").get<std::string>();
    const int now = ++in_flight_;
    int seen = max_in_flight_.load();
    while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    --in_flight_;

    Mode mode = Mode::Succeed;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++calls_[id];
      payloads_[id] = request;
      if (auto it = modes.find(id); it != modes.end()) mode = it->second;
      if (auto it = transient_failures.find(id); it != transient_failures.end() && it->second > 0) {
        --it->second;
        return GenerationResult::transient("rate limited");
      }
    }

    switch (mode) {
      case Mode::Terminal:
        return GenerationResult::terminal("model refused");
      case Mode::Throw:
        throw std::runtime_error("connection reset");
      case Mode::ThrowNonStandard:
        throw 42;
      case Mode::BadSchema:
        return GenerationResult::ok(json{{"id", id}});
      case Mode::Succeed:
        break;
    }

    json methods = json::array();
    const json & requested =
      request.at("mode") == "cold" ? request.at("methods") : request.at("regenerate");
    for (auto it = requested.begin(); it != requested.end(); ++it) {
      methods.push_back(json{
        {"method_index", std::stoi(it.key())},
        {"description", "described " + it.key()},
        {"confidence", 50}});
    }
    return GenerationResult::ok(
      json{{"id", id}, {"description", "about " + id}, {"confidence", 75}, {"methods", methods}});
  }

  int calls(const std::string & id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_[id];
  }

  json payload(const std::string & id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return payloads_[id];
  }

  int max_in_flight() const { return max_in_flight_.load(); }

private:
  std::mutex mutex_;
  std::map<std::string, int> calls_;
  std::map<std::string, json> payloads_;
  std::atomic<int> in_flight_{0};
  std::atomic<int> max_in_flight_{0};
};

std::unique_ptr<Project> sample_project()
{
  return index_sources({
    {"A.java", "package p; class A { void a1() { } void a2() { a1(); } class Inner { void i() { } } }"},
    {"B.java", "package p; class B { void b() { } }"},
    {"C.java", "package p; class C { void c() { } }"},
  });
}

struct SleepLog
{
  std::mutex mutex;
  std::vector<std::chrono::milliseconds> delays;

  std::function<void(std::chrono::milliseconds)> fn()
  {
    return [this](std::chrono::milliseconds d) {
      std::lock_guard<std::mutex> lock(mutex);
      delays.push_back(d);
    };
  }
};

OrchestratorOptions options_with(SleepLog & log, size_t concurrency = 2, int attempts = 3)
{
  OrchestratorOptions o;
  o.max_concurrency = concurrency;
  o.max_attempts = attempts;
  o.base_backoff = std::chrono::milliseconds(100);
  o.max_backoff = std::chrono::milliseconds(250);
  o.sleep = log.fn();
  return o;
}

}  // namespace

TEST(AnnotateBackoff, DoublesUntilTheCap)
{
  using ms = std::chrono::milliseconds;
  EXPECT_EQ(backoff_delay(1, ms(100), ms(1000)), ms(100));
  EXPECT_EQ(backoff_delay(2, ms(100), ms(1000)), ms(200));
  EXPECT_EQ(backoff_delay(3, ms(100), ms(1000)), ms(400));
  EXPECT_EQ(backoff_delay(5, ms(100), ms(1000)), ms(1000));
  EXPECT_EQ(backoff_delay(60, ms(100), ms(1000)), ms(1000));
}

TEST(AnnotateOrchestrator, AnnotatesEveryClassIncludingNested)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  SleepLog log;

  const AnnotationReport report = project->annotate(gen, options_with(log));

  EXPECT_EQ(report.scheduled, 4u);
  EXPECT_EQ(report.succeeded, 4u);
  EXPECT_EQ(report.failed, 0u);
  EXPECT_EQ(gen.calls("p.A.Inner"), 1);

  const Class * a = test_support::cls(*project, "p.A");
  EXPECT_EQ(a->description, "about p.A");
  EXPECT_EQ(a->annotation_status, AnnotationStatus::Ok);
  EXPECT_EQ(test_support::method(*project, "p.A#a2()")->description, "described 1");
  EXPECT_TRUE(log.delays.empty());
}

TEST(AnnotateOrchestrator, ConcurrencyIsBounded)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  SleepLog log;

  (void)project->annotate(gen, options_with(log, 2));
  EXPECT_LE(gen.max_in_flight(), 2);
}

TEST(AnnotateOrchestrator, TransientFailuresAreRetriedWithBackoff)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  gen.transient_failures["p.B"] = 2;
  SleepLog log;

  const AnnotationReport report = project->annotate(gen, options_with(log, 1, 3));

  const ClassOutcome * b = report.find("p.B");
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->status, AnnotationStatus::Ok);
  EXPECT_EQ(b->attempts, 3);
  EXPECT_EQ(report.retries, 2u);
  ASSERT_EQ(log.delays.size(), 2u);
  EXPECT_EQ(log.delays[0], std::chrono::milliseconds(100));
  EXPECT_EQ(log.delays[1], std::chrono::milliseconds(200));
}

TEST(AnnotateOrchestrator, ExhaustedRetriesFailOnlyThatClass)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  gen.transient_failures["p.B"] = 10;
  SleepLog log;

  const AnnotationReport report = project->annotate(gen, options_with(log, 2, 4));

  EXPECT_EQ(gen.calls("p.B"), 4);
  const Class * b = test_support::cls(*project, "p.B");
  EXPECT_EQ(b->annotation_status, AnnotationStatus::Error);
  EXPECT_NE(b->annotation_error.find("rate limited"), std::string::npos);
  EXPECT_TRUE(b->description.empty());

  EXPECT_EQ(report.failed, 1u);
  EXPECT_EQ(report.succeeded, 3u);
  EXPECT_EQ(test_support::cls(*project, "p.C")->annotation_status, AnnotationStatus::Ok);
  // 100, 200, then capped at 250.
  ASSERT_EQ(log.delays.size(), 3u);
  EXPECT_EQ(log.delays[2], std::chrono::milliseconds(250));
}

TEST(AnnotateOrchestrator, TerminalThrownAndInvalidResponsesAreIsolated)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  gen.modes["p.A"] = ScriptedGenerator::Mode::Terminal;
  gen.modes["p.B"] = ScriptedGenerator::Mode::Throw;
  gen.modes["p.C"] = ScriptedGenerator::Mode::BadSchema;
  SleepLog log;

  const AnnotationReport report = project->annotate(gen, options_with(log, 4));

  EXPECT_EQ(report.failed, 3u);
  EXPECT_EQ(report.succeeded, 1u);
  EXPECT_EQ(gen.calls("p.A"), 1);
  EXPECT_EQ(gen.calls("p.B"), 1);

  EXPECT_EQ(test_support::cls(*project, "p.A")->annotation_error, "model refused");
  EXPECT_NE(
    test_support::cls(*project, "p.B")->annotation_error.find("connection reset"), std::string::npos);
  EXPECT_EQ(
    test_support::cls(*project, "p.C")->annotation_error.rfind("schema mismatch", 0), 0u);
  EXPECT_TRUE(test_support::method(*project, "p.C#c()")->description.empty());

  EXPECT_EQ(test_support::cls(*project, "p.A.Inner")->annotation_status, AnnotationStatus::Ok);
}

TEST(AnnotateOrchestrator, NonStandardThrowFailsOnlyThatClass)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  gen.modes["p.B"] = ScriptedGenerator::Mode::ThrowNonStandard;
  SleepLog log;

  const AnnotationReport report = project->annotate(gen, options_with(log, 2));

  EXPECT_EQ(report.failed, 1u);
  EXPECT_EQ(report.succeeded, 3u);
  EXPECT_EQ(gen.calls("p.B"), 1);
  const Class * b = test_support::cls(*project, "p.B");
  EXPECT_EQ(b->annotation_status, AnnotationStatus::Error);
  EXPECT_NE(b->annotation_error.find("non-standard exception"), std::string::npos);
  EXPECT_EQ(test_support::cls(*project, "p.C")->annotation_status, AnnotationStatus::Ok);
}

TEST(AnnotateOrchestrator, ThrowingSleepFailsOnlyTheRetryingClass)
{
  auto project = sample_project();
  ScriptedGenerator gen;
  gen.transient_failures["p.B"] = 1;
  SleepLog log;
  OrchestratorOptions options = options_with(log, 2, 3);
  options.sleep = [](std::chrono::milliseconds) { throw std::runtime_error("interrupted"); };

  const AnnotationReport report = project->annotate(gen, options);

  EXPECT_EQ(report.failed, 1u);
  EXPECT_EQ(report.succeeded, 3u);
  EXPECT_EQ(gen.calls("p.B"), 1);
  const Class * b = test_support::cls(*project, "p.B");
  EXPECT_EQ(b->annotation_status, AnnotationStatus::Error);
  EXPECT_NE(b->annotation_error.find("interrupted"), std::string::npos);
  EXPECT_EQ(test_support::cls(*project, "p.A")->annotation_status, AnnotationStatus::Ok);
}

TEST(AnnotateOrchestrator, FullyDescribedClassesAreSkipped)
{
  auto project = sample_project();
  Class * c = project->registry().lookup_class("p.C");
  c->description = "cached";
  c->methods[0]->description = "cached";
  ScriptedGenerator gen;
  SleepLog log;

  const AnnotationReport report = project->annotate(gen, options_with(log));

  EXPECT_EQ(report.skipped, 1u);
  EXPECT_EQ(report.scheduled, 3u);
  EXPECT_EQ(gen.calls("p.C"), 0);
  EXPECT_EQ(report.find("p.C"), nullptr);
}

TEST(AnnotateOrchestrator, WarmRequestCarriesOnlyDirtyIndices)
{
  auto project = sample_project();
  Class * a = project->registry().lookup_class("p.A");
  a->description = "cached";
  a->methods[0]->description = "cached a1";
  ScriptedGenerator gen;
  SleepLog log;

  (void)project->annotate(gen, options_with(log));

  const json payload = gen.payload("p.A");
  EXPECT_EQ(payload["mode"], "warm");
  EXPECT_EQ(payload["regenerate"].size(), 1u);
  EXPECT_TRUE(payload["regenerate"].contains("1"));
  EXPECT_EQ(test_support::method(*project, "p.A#a1()")->description, "cached a1");
  EXPECT_EQ(test_support::method(*project, "p.A#a2()")->description, "described 1");
}
