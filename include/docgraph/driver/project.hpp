// docgraph/driver/project.hpp - In-memory index of a set of Java sources
//
// Phases run in order: add_source() for every file, then resolve(), then
// optionally load_cache() / annotate() / export_cache().
//
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "docgraph/annotate/description_orchestrator.hpp"
#include "docgraph/basic/diagnostic.hpp"
#include "docgraph/basic/source_manager.hpp"
#include "docgraph/cache/cache_manager.hpp"
#include "docgraph/model/entity.hpp"
#include "docgraph/resolve/dependency_resolver.hpp"
#include "docgraph/resolve/symbol_registry.hpp"

namespace docgraph
{

class Project
{
public:
  Project() = default;
  Project(const Project &) = delete;
  Project & operator=(const Project &) = delete;
  Project(Project &&) = default;
  Project & operator=(Project &&) = default;

  /**
   * Parse, build and register one source file.
   *
   * Returns nullptr (and reports an error) if `ufid` was already added.
   * Throws std::logic_error once resolve() has run.
   */
  File * add_source(std::string ufid, std::string text);

  /// Seal the registry and resolve every method's call sites.
  const ResolutionStats & resolve();

  CacheLoadStats load_cache(const CacheMap & cache);
  [[nodiscard]] CacheMap export_cache() const;

  AnnotationReport annotate(AnnotationGenerator & generator, const OrchestratorOptions & options);

  [[nodiscard]] bool is_resolved() const noexcept { return registry_.is_sealed(); }

  [[nodiscard]] const std::vector<std::unique_ptr<File>> & files() const noexcept { return files_; }
  [[nodiscard]] const File * find_file(std::string_view ufid) const noexcept;
  [[nodiscard]] const SymbolRegistry & registry() const noexcept { return registry_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }
  [[nodiscard]] const ResolutionStats & resolution_stats() const noexcept { return stats_; }
  [[nodiscard]] DiagnosticBag & diagnostics() noexcept { return diags_; }
  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return diags_; }

private:
  SourceRegistry sources_;
  SymbolRegistry registry_;
  DiagnosticBag diags_;
  std::vector<std::unique_ptr<File>> files_;
  ResolutionStats stats_;
};

}  // namespace docgraph
