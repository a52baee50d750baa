// docgraph/project/project_config.hpp - Project configuration (docgraph.yaml)
//
// Parses and validates docgraph.yaml project configuration files.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docgraph
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct PackageConfig
{
  std::string name;
};

/**
 * Where Java sources are collected from.
 */
struct SourcesConfig
{
  /// Root directory, relative to docgraph.yaml
  std::filesystem::path root = ".";

  /// File extensions to index, including the dot
  std::vector<std::string> extensions = {".java"};

  /// Directory names skipped anywhere below the root
  std::vector<std::string> exclude = {".git", "build", "target", "out"};
};

struct CacheConfig
{
  std::filesystem::path path = ".docgraph/cache.json";
};

struct OutputConfig
{
  std::filesystem::path model = ".docgraph/model.json";

  /// Skeleton view (signatures and descriptions only); empty disables it
  std::filesystem::path skeleton;
};

struct AnnotationConfig
{
  bool enabled = true;

  /// Generator command and its arguments; empty disables annotation
  std::vector<std::string> command;

  size_t max_concurrency = 4;
  int max_attempts = 3;
  std::chrono::milliseconds base_backoff{500};
  std::chrono::milliseconds max_backoff{8000};
  std::chrono::milliseconds timeout{120000};
};

/**
 * Complete project configuration (docgraph.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  SourcesConfig sources;
  CacheConfig cache;
  OutputConfig output;
  AnnotationConfig annotation;

  /// Directory containing docgraph.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path & p) const
  {
    return p.is_absolute() ? p : project_root / p;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a docgraph.yaml file.
 *
 * @param config_path Path to docgraph.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to docgraph.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Contents written by `docgraph init`.
[[nodiscard]] std::string default_project_config(std::string_view package_name);

inline constexpr const char * k_project_config_file_name = "docgraph.yaml";

}  // namespace docgraph
