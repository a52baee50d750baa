#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "docgraph/project/project_config.hpp"

using namespace docgraph;
namespace fs = std::filesystem;

TEST(ProjectConfig, EmptyDocumentUsesDefaults)
{
  const auto r = parse_project_config("", "/work");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.sources.extensions, std::vector<std::string>{".java"});
  EXPECT_EQ(r.config.resolve(r.config.cache.path), fs::path("/work/.docgraph/cache.json"));
  EXPECT_TRUE(r.config.annotation.enabled);
  EXPECT_TRUE(r.config.annotation.command.empty());
}

TEST(ProjectConfig, ReadsEverySection)
{
  const auto r = parse_project_config(
    R"(
package:
  name: shop
sources:
  root: src/main/java
  extensions: [java, .jav]
  exclude: [generated]
cache:
  path: /tmp/cache.json
output:
  model: out/model.json
  skeleton: out/skeleton.json
annotation:
  enabled: true
  command: [python3, describe.py, --fast]
  max_concurrency: 8
  max_attempts: 5
  base_backoff_ms: 250
  max_backoff_ms: 4000
  timeout_ms: 30000
)",
    "/work");
  ASSERT_TRUE(r.success) << r.error;
  const ProjectConfig & c = r.config;

  EXPECT_EQ(c.package.name, "shop");
  EXPECT_EQ(c.resolve(c.sources.root), fs::path("/work/src/main/java"));
  EXPECT_EQ(c.sources.extensions, (std::vector<std::string>{".java", ".jav"}));
  EXPECT_EQ(c.sources.exclude, std::vector<std::string>{"generated"});
  EXPECT_EQ(c.resolve(c.cache.path), fs::path("/tmp/cache.json"));
  EXPECT_EQ(c.output.skeleton, fs::path("out/skeleton.json"));
  EXPECT_EQ(c.annotation.command, (std::vector<std::string>{"python3", "describe.py", "--fast"}));
  EXPECT_EQ(c.annotation.max_concurrency, 8u);
  EXPECT_EQ(c.annotation.max_attempts, 5);
  EXPECT_EQ(c.annotation.base_backoff, std::chrono::milliseconds(250));
  EXPECT_EQ(c.annotation.max_backoff, std::chrono::milliseconds(4000));
  EXPECT_EQ(c.annotation.timeout, std::chrono::milliseconds(30000));
}

TEST(ProjectConfig, ScalarCommandIsOneArgument)
{
  const auto r = parse_project_config("annotation:\n  command: ./describe\n", "/work");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.annotation.command, std::vector<std::string>{"./describe"});
}

TEST(ProjectConfig, ValidationErrorsAreReturned)
{
  auto fails_with = [](const char * yaml, const char * fragment) {
    const auto r = parse_project_config(yaml, "/work");
    EXPECT_FALSE(r.success) << yaml;
    EXPECT_NE(r.error.find(fragment), std::string::npos) << r.error;
  };

  fails_with("annotation:\n  max_concurrency: 0\n", "max_concurrency");
  fails_with("annotation:\n  max_attempts: 0\n", "max_attempts");
  fails_with("annotation:\n  timeout_ms: -5\n", "timeout_ms");
  fails_with("annotation:\n  base_backoff_ms: 500\n  max_backoff_ms: 100\n", "max_backoff_ms");
  fails_with("sources:\n  extensions: java\n", "sources.extensions must be a list");
  fails_with("sources:\n  extensions: []\n", "must not be empty");
  fails_with("annotation:\n  max_attempts: lots\n", "failed to parse YAML");
  fails_with("[1, 2]", "root must be a map");
  fails_with("package: [unclosed\n", "failed to parse YAML");
}

TEST(ProjectConfig, LoadAndFindOnDisk)
{
  const fs::path root = fs::temp_directory_path() / "docgraph_tests" / "config";
  fs::remove_all(root);
  fs::create_directories(root / "a" / "b");
  {
    std::ofstream out(root / k_project_config_file_name);
    out << default_project_config("demo");
  }

  const auto found = find_project_config(root / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(root / k_project_config_file_name));

  const auto r = load_project_config(*found);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "demo");
  EXPECT_FALSE(r.config.annotation.enabled);
  EXPECT_EQ(fs::canonical(r.config.project_root), fs::canonical(root));

  EXPECT_FALSE(load_project_config(root / "missing.yaml").success);
}
