#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "docgraph/cache/cache_store.hpp"

using namespace docgraph;
namespace fs = std::filesystem;

namespace
{

fs::path temp_dir(const char * name)
{
  const fs::path dir = fs::temp_directory_path() / "docgraph_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(CacheStore, MissingFileIsAnEmptyCache)
{
  const auto result = load_cache_file(temp_dir("missing") / "nope.json");
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.entries.empty());
}

TEST(CacheStore, SaveCreatesDirectoriesAndLoadsBack)
{
  const fs::path path = temp_dir("roundtrip") / "nested" / "cache.json";

  CacheMap entries;
  entries["p.A#f()"] = CacheEntry{"abc", "does f"};
  entries["p.A"] = CacheEntry{"def", ""};

  const auto saved = save_cache_file(path, entries);
  ASSERT_TRUE(saved.success) << saved.error;
  ASSERT_TRUE(fs::exists(path));

  const auto loaded = load_cache_file(path);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.entries, entries);
}

TEST(CacheStore, MalformedJsonIsAnError)
{
  const auto result = parse_cache("{ not json");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("malformed"), std::string::npos);

  EXPECT_FALSE(parse_cache("[1, 2]").success);
}

TEST(CacheStore, EntriesWithoutHashAreSkipped)
{
  const auto result = parse_cache(R"({
    "good": {"hash": "h", "description": "d"},
    "no_hash": {"description": "d"},
    "not_object": 3,
    "no_desc": {"hash": "h2"}
  })");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.entries.size(), 2u);
  EXPECT_EQ(result.entries.at("good").description, "d");
  EXPECT_EQ(result.entries.at("no_desc").description, "");
}
