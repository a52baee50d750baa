// docgraph/driver/indexer.hpp - Indexer driver
//
// Single entry point for the indexing pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "docgraph/annotate/annotation_generator.hpp"
#include "docgraph/annotate/description_orchestrator.hpp"
#include "docgraph/basic/diagnostic.hpp"
#include "docgraph/cache/cache_manager.hpp"
#include "docgraph/driver/project.hpp"
#include "docgraph/project/project_config.hpp"
#include "docgraph/resolve/dependency_resolver.hpp"

namespace docgraph
{

// ============================================================================
// Index Mode
// ============================================================================

enum class IndexMode {
  Check,  ///< Build and resolve only; no cache, annotation or output
  Index,  ///< Full run including cache, annotation and JSON output
};

// ============================================================================
// Index Options
// ============================================================================

struct IndexOptions
{
  IndexMode mode = IndexMode::Index;

  /// Model output path (overrides project config)
  std::optional<std::filesystem::path> model_output;

  /// Cache file path (overrides project config)
  std::optional<std::filesystem::path> cache_path;

  /// Force annotation off even when the project enables it
  bool no_annotate = false;

  /// Worker count (overrides project config)
  std::optional<size_t> max_concurrency;

  /// Generator to use instead of the configured command
  AnnotationGenerator * generator = nullptr;

  /// Backoff sleep passed to the orchestrator (defaults to a real sleep)
  std::function<void(std::chrono::milliseconds)> sleep;
};

// ============================================================================
// Index Result
// ============================================================================

struct IndexStats
{
  size_t files = 0;
  size_t classes = 0;
  size_t methods = 0;
  ResolutionStats resolution;
  CacheLoadStats cache;
  std::optional<AnnotationReport> annotation;
};

struct IndexResult
{
  /// Whether indexing succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  IndexStats stats;

  /// Files written (model, skeleton, cache)
  std::vector<std::filesystem::path> written_files;

  /// The indexed project (sources are needed to print diagnostics)
  std::unique_ptr<Project> project;
};

// ============================================================================
// Indexer
// ============================================================================

class Indexer
{
public:
  /**
   * Index the sources of a project defined by a ProjectConfig.
   *
   * Unreadable files and per-class annotation failures are reported and the
   * run continues; the model is written even when some classes failed.
   */
  [[nodiscard]] static IndexResult index_project(
    const ProjectConfig & config, const IndexOptions & options);

  /**
   * Source files under the configured root with a configured extension,
   * skipping excluded directory names, sorted by path.
   */
  [[nodiscard]] static std::vector<std::filesystem::path> collect_sources(
    const ProjectConfig & config);

  /// Delete generated model, skeleton and cache files. Returns removed paths.
  static std::vector<std::filesystem::path> clean_outputs(const ProjectConfig & config);

private:
  static bool write_json(
    const std::filesystem::path & path, const nlohmann::json & doc, DiagnosticBag & diags);

  static void report_annotation_failures(const AnnotationReport & report, DiagnosticBag & diags);
};

}  // namespace docgraph
