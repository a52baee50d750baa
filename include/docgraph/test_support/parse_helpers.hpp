// docgraph/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// These helpers provide a lightweight in-memory indexing pipeline for tests.
//
#pragma once

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "docgraph/driver/project.hpp"
#include "docgraph/model/entity.hpp"

namespace docgraph::test_support
{

struct TestSource
{
  std::string ufid;
  std::string text;
};

/// Build (but do not resolve) a project from one Java snippet.
[[nodiscard]] inline std::unique_ptr<Project> build_source(
  std::string src, std::string ufid = "Test.java")
{
  auto project = std::make_unique<Project>();
  project->add_source(std::move(ufid), std::move(src));
  return project;
}

/// Build and resolve a project from several files, in the given order.
[[nodiscard]] inline std::unique_ptr<Project> index_sources(
  std::initializer_list<TestSource> sources)
{
  auto project = std::make_unique<Project>();
  for (const auto & s : sources) {
    project->add_source(s.ufid, s.text);
  }
  project->resolve();
  return project;
}

[[nodiscard]] inline std::unique_ptr<Project> index_source(
  std::string src, std::string ufid = "Test.java")
{
  auto project = build_source(std::move(src), std::move(ufid));
  project->resolve();
  return project;
}

[[nodiscard]] inline const Method * method(const Project & project, std::string_view umid)
{
  return project.registry().lookup_by_umid(umid);
}

[[nodiscard]] inline const Class * cls(const Project & project, std::string_view ucid)
{
  return project.registry().lookup_class(ucid);
}

}  // namespace docgraph::test_support
