#include <gtest/gtest.h>

#include <atomic>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

#include "docgraph/annotate/command_generator.hpp"

using namespace docgraph;
using nlohmann::json;

namespace
{

CommandGenerator shell(const std::string & script, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
  return CommandGenerator({"/bin/sh", "-c", script}, timeout);
}

const json k_request = json{{"mode", "cold"}, {"id", "p.A"}};

}  // namespace

TEST(AnnotateCommand, ZeroExitWithJsonIsOk)
{
  auto gen = shell(R"(cat >/dev/null; echo '{"id": "p.A", "description": "d", "confidence": 5, "methods": []}')");
  const GenerationResult r = gen.generate(k_request);
  ASSERT_EQ(r.status, GenerationStatus::Ok) << r.error;
  EXPECT_EQ(r.response["id"], "p.A");
}

TEST(AnnotateCommand, RequestIsWrittenToStdin)
{
  auto gen = shell("cat");
  const GenerationResult r = gen.generate(k_request);
  ASSERT_EQ(r.status, GenerationStatus::Ok) << r.error;
  EXPECT_EQ(r.response, k_request);
}

TEST(AnnotateCommand, TempFailExitStatusIsTransient)
{
  auto gen = shell("cat >/dev/null; echo 'slow down' >&2; exit 75");
  const GenerationResult r = gen.generate(k_request);
  EXPECT_EQ(r.status, GenerationStatus::Transient);
  EXPECT_NE(r.error.find("slow down"), std::string::npos);
}

TEST(AnnotateCommand, OtherExitStatusIsTerminal)
{
  auto gen = shell("echo 'bad key' >&2; exit 3");
  const GenerationResult r = gen.generate(k_request);
  EXPECT_EQ(r.status, GenerationStatus::Terminal);
  EXPECT_NE(r.error.find("status 3"), std::string::npos);
  EXPECT_NE(r.error.find("bad key"), std::string::npos);
}

TEST(AnnotateCommand, UnparsableOutputIsTerminal)
{
  auto gen = shell("cat >/dev/null; echo 'not json'");
  const GenerationResult r = gen.generate(k_request);
  EXPECT_EQ(r.status, GenerationStatus::Terminal);
  EXPECT_NE(r.error.find("unparsable"), std::string::npos);
}

TEST(AnnotateCommand, TimeoutKillsTheCommandAndIsTransient)
{
  auto gen = shell("exec sleep 5", std::chrono::milliseconds(100));
  const GenerationResult r = gen.generate(k_request);
  EXPECT_EQ(r.status, GenerationStatus::Transient);
  EXPECT_NE(r.error.find("timed out"), std::string::npos);
}

TEST(AnnotateCommand, MissingExecutableIsTerminal)
{
  CommandGenerator gen({"/nonexistent/docgraph-generator"});
  const GenerationResult r = gen.generate(k_request);
  EXPECT_EQ(r.status, GenerationStatus::Terminal);
  EXPECT_NE(r.error.find("127"), std::string::npos);
}

TEST(AnnotateCommand, EmptyCommandIsTerminal)
{
  CommandGenerator gen({});
  EXPECT_EQ(gen.generate(k_request).status, GenerationStatus::Terminal);
}

TEST(AnnotateCommand, ConcurrentRequestsEachSeeEndOfInput)
{
  // Every child reads stdin to EOF, which only arrives once no sibling child
  // holds a copy of its write end.
  auto gen = shell(R"(cat >/dev/null; echo '{"ok": 1}')", std::chrono::milliseconds(3000));

  constexpr int k_rounds = 8;
  constexpr int k_threads = 16;
  std::atomic<int> ok{0};
  std::atomic<int> not_ok{0};
  for (int round = 0; round < k_rounds; ++round) {
    std::vector<std::thread> threads;
    for (int i = 0; i < k_threads; ++i) {
      threads.emplace_back([&]() {
        const GenerationResult r = gen.generate(k_request);
        if (r.status == GenerationStatus::Ok) {
          ++ok;
        } else {
          ++not_ok;
        }
      });
    }
    for (auto & t : threads) {
      t.join();
    }
  }
  EXPECT_EQ(ok.load(), k_rounds * k_threads);
  EXPECT_EQ(not_ok.load(), 0);
}
