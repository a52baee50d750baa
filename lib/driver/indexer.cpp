// docgraph/driver/indexer.cpp - Indexer driver implementation
//
#include "docgraph/driver/indexer.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include "docgraph/annotate/command_generator.hpp"
#include "docgraph/cache/cache_store.hpp"
#include "docgraph/model/json_view.hpp"

namespace docgraph
{

namespace
{

namespace fs = std::filesystem;

bool is_excluded(const fs::path & dir, const std::vector<std::string> & exclude)
{
  const std::string name = dir.filename().string();
  return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

bool has_extension(const fs::path & file, const std::vector<std::string> & extensions)
{
  const std::string ext = file.extension().string();
  return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

/// Project-relative name used as the file's ufid.
std::string make_ufid(const fs::path & file, const fs::path & root)
{
  std::error_code ec;
  const fs::path rel = fs::relative(file, root, ec);
  if (ec || rel.empty()) {
    return file.generic_string();
  }
  return rel.generic_string();
}

OrchestratorOptions orchestrator_options(const ProjectConfig & config, const IndexOptions & options)
{
  OrchestratorOptions out;
  out.max_concurrency = options.max_concurrency.value_or(config.annotation.max_concurrency);
  out.max_attempts = config.annotation.max_attempts;
  out.base_backoff = config.annotation.base_backoff;
  out.max_backoff = config.annotation.max_backoff;
  out.sleep = options.sleep;
  return out;
}

}  // namespace

std::vector<fs::path> Indexer::collect_sources(const ProjectConfig & config)
{
  std::vector<fs::path> out;
  const fs::path root = config.resolve(config.sources.root);

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return out;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  while (!ec && it != end) {
    const fs::directory_entry & entry = *it;
    if (entry.is_directory(ec)) {
      if (is_excluded(entry.path(), config.sources.exclude)) {
        it.disable_recursion_pending();
      }
    } else if (entry.is_regular_file(ec) && has_extension(entry.path(), config.sources.extensions)) {
      out.push_back(entry.path());
    }
    it.increment(ec);
  }

  std::sort(out.begin(), out.end());
  return out;
}

IndexResult Indexer::index_project(const ProjectConfig & config, const IndexOptions & options)
{
  IndexResult result;
  result.project = std::make_unique<Project>();
  Project & project = *result.project;
  DiagnosticBag & diags = result.diagnostics;

  const fs::path root = config.resolve(config.sources.root);
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    diags.report_error(SourceRange{}, "source root not found: " + root.string())
      .with_code(diag_codes::k_config_error);
    return result;
  }

  // 1. Build entities for every readable file
  for (const auto & path : collect_sources(config)) {
    auto text = read_file(path);
    if (!text) {
      diags.report_error(SourceRange{}, "cannot read source file: " + path.string())
        .with_code(diag_codes::k_unreadable_file);
      continue;
    }
    project.add_source(make_ufid(path, root), std::move(*text));
  }

  // 2. Resolve dependencies across all files
  result.stats.resolution = project.resolve();
  result.stats.files = project.files().size();
  result.stats.classes = project.registry().class_count();
  result.stats.methods = project.registry().method_count();
  diags.merge(std::move(project.diagnostics()));

  if (options.mode == IndexMode::Check) {
    result.success = !diags.has_errors();
    return result;
  }

  // 3. Seed descriptions from the cache
  const fs::path cache_path = options.cache_path.value_or(config.resolve(config.cache.path));
  const CacheLoadResult cache = load_cache_file(cache_path);
  if (cache.success) {
    result.stats.cache = project.load_cache(cache.entries);
  } else {
    diags.report_warning(SourceRange{}, cache.error)
      .with_code(diag_codes::k_cache_error)
      .with_help("the cache is ignored and every entity is treated as changed");
    result.stats.cache = project.load_cache({});
  }

  // 4. Annotate
  const bool annotate = !options.no_annotate && config.annotation.enabled &&
                        (options.generator != nullptr || !config.annotation.command.empty());
  if (annotate) {
    std::unique_ptr<CommandGenerator> command;
    AnnotationGenerator * generator = options.generator;
    if (generator == nullptr) {
      command = std::make_unique<CommandGenerator>(config.annotation.command, config.annotation.timeout);
      generator = command.get();
    }
    AnnotationReport report = project.annotate(*generator, orchestrator_options(config, options));
    report_annotation_failures(report, diags);
    result.stats.annotation = std::move(report);
  }

  // 5. Persist cache and model
  const CacheSaveResult saved = save_cache_file(cache_path, project.export_cache());
  if (saved.success) {
    result.written_files.push_back(cache_path);
  } else {
    diags.report_error(SourceRange{}, saved.error).with_code(diag_codes::k_cache_error);
  }

  const fs::path model_path = options.model_output.value_or(config.resolve(config.output.model));
  if (write_json(model_path, to_json(project.files()), diags)) {
    result.written_files.push_back(model_path);
  }

  if (!config.output.skeleton.empty()) {
    const fs::path skeleton_path = config.resolve(config.output.skeleton);
    if (write_json(skeleton_path, to_skeleton_json(project.files()), diags)) {
      result.written_files.push_back(skeleton_path);
    }
  }

  result.success = !diags.has_errors();
  return result;
}

std::vector<fs::path> Indexer::clean_outputs(const ProjectConfig & config)
{
  std::vector<fs::path> removed;
  std::vector<fs::path> targets = {
    config.resolve(config.output.model), config.resolve(config.cache.path)};
  if (!config.output.skeleton.empty()) {
    targets.push_back(config.resolve(config.output.skeleton));
  }

  for (const auto & t : targets) {
    std::error_code ec;
    if (fs::remove(t, ec)) {
      removed.push_back(t);
    }
  }
  return removed;
}

bool Indexer::write_json(
  const fs::path & path, const nlohmann::json & doc, DiagnosticBag & diags)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      diags.report_error(
        SourceRange{}, fmt::format("cannot create directory {}: {}", path.parent_path().string(), ec.message()))
        .with_code(diag_codes::k_output_error);
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    diags.report_error(SourceRange{}, "failed to open output file: " + path.string())
      .with_code(diag_codes::k_output_error);
    return false;
  }
  out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  if (!out) {
    diags.report_error(SourceRange{}, "failed while writing output file: " + path.string())
      .with_code(diag_codes::k_output_error);
    return false;
  }
  return true;
}

void Indexer::report_annotation_failures(const AnnotationReport & report, DiagnosticBag & diags)
{
  for (const auto & outcome : report.outcomes) {
    if (outcome.status != AnnotationStatus::Error) continue;
    diags.report_error(
      SourceRange{}, fmt::format("annotation of '{}' failed: {}", outcome.ucid, outcome.error))
      .with_code(diag_codes::k_annotation_failed);
  }
}

}  // namespace docgraph
