#include <gtest/gtest.h>

#include "docgraph/test_support/parse_helpers.hpp"

using namespace docgraph;
using docgraph::test_support::index_source;

namespace
{

const char * const k_source = R"java(
package p;
class Calc {
  int add(int a, int b) { return a + b; }
  int twice(int a) { return add(a, a); }
}
)java";

const char * const k_reformatted = R"java(
package p;
class Calc {
  int add(int a, int b) {
    return a+b;
  }
  int twice(int a) {
    return add(a,a);
  }
}
)java";

const char * const k_edited = R"java(
package p;
class Calc {
  int add(int a, int b) { return a + b; }
  int twice(int a) { return 2 * a; }
}
)java";

void describe_everything(Project & project)
{
  for (Method * m : project.registry().methods()) {
    m->description = "method " + m->identifier;
    m->confidence = 90;
  }
  for (Class * c : project.registry().classes()) {
    c->description = "class " + c->identifier;
    c->confidence = 80;
  }
}

}  // namespace

TEST(CacheManager, ExportCoversEveryMethodAndClass)
{
  auto project = index_source(k_source);
  describe_everything(*project);

  const CacheMap cache = project->export_cache();
  ASSERT_EQ(cache.size(), 3u);
  ASSERT_EQ(cache.count("p.Calc#add(int,int)"), 1u);
  EXPECT_EQ(cache.at("p.Calc#add(int,int)").description, "method add");
  EXPECT_EQ(cache.at("p.Calc").description, "class Calc");
  EXPECT_EQ(
    cache.at("p.Calc#twice(int)").hash, test_support::method(*project, "p.Calc#twice(int)")->body_hash);
}

TEST(CacheManager, WhitespaceOnlyEditsKeepEverythingClean)
{
  auto first = index_source(k_source);
  describe_everything(*first);
  const CacheMap cache = first->export_cache();

  auto second = index_source(k_reformatted);
  const CacheLoadStats stats = second->load_cache(cache);

  EXPECT_EQ(stats.clean_methods, 2u);
  EXPECT_EQ(stats.clean_classes, 1u);
  EXPECT_EQ(stats.dirty(), 0u);
  EXPECT_EQ(test_support::method(*second, "p.Calc#add(int,int)")->description, "method add");

  // Exporting again reproduces the same cache.
  EXPECT_EQ(second->export_cache(), cache);
}

TEST(CacheManager, ChangedBodyInvalidatesOnlyThatMethodAndItsClass)
{
  auto first = index_source(k_source);
  describe_everything(*first);
  const CacheMap cache = first->export_cache();

  auto second = index_source(k_edited);
  const CacheLoadStats stats = second->load_cache(cache);

  EXPECT_EQ(stats.clean_methods, 1u);
  EXPECT_EQ(stats.dirty_methods, 1u);
  EXPECT_EQ(stats.dirty_classes, 1u);

  const Method * twice = test_support::method(*second, "p.Calc#twice(int)");
  ASSERT_NE(twice, nullptr);
  EXPECT_TRUE(twice->description.empty());
  EXPECT_EQ(twice->confidence, 0);

  // A caller changing does not dirty its callee.
  EXPECT_EQ(test_support::method(*second, "p.Calc#add(int,int)")->description, "method add");
  EXPECT_TRUE(test_support::cls(*second, "p.Calc")->description.empty());
}

TEST(CacheManager, UnknownIdsAreDirty)
{
  auto project = index_source(k_source);
  const CacheLoadStats stats = project->load_cache(CacheMap{});
  EXPECT_EQ(stats.clean_methods, 0u);
  EXPECT_EQ(stats.dirty_methods, 2u);
  EXPECT_EQ(stats.dirty_classes, 1u);
}
