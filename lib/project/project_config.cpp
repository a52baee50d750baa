// docgraph/project/project_config.cpp - Project configuration implementation
//
#include "docgraph/project/project_config.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace docgraph
{

namespace
{

std::optional<std::vector<std::string>> read_string_list(
  const YAML::Node & node, const char * key, std::string & error)
{
  if (!node.IsSequence()) {
    error = fmt::format("{} must be a list", key);
    return std::nullopt;
  }
  std::vector<std::string> out;
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

/// Reads a positive millisecond count.
std::optional<std::chrono::milliseconds> read_millis(
  const YAML::Node & node, const char * key, std::string & error)
{
  const auto value = node.as<long long>();
  if (value <= 0) {
    error = fmt::format("{} must be positive", key);
    return std::nullopt;
  }
  return std::chrono::milliseconds(value);
}

std::optional<std::string> parse_sources(const YAML::Node & src, SourcesConfig & out)
{
  std::string error;
  if (src["root"]) {
    out.root = src["root"].as<std::string>();
  }
  if (src["extensions"]) {
    auto exts = read_string_list(src["extensions"], "sources.extensions", error);
    if (!exts) return error;
    if (exts->empty()) return std::string("sources.extensions must not be empty");
    out.extensions.clear();
    for (auto & e : *exts) {
      out.extensions.push_back(e.empty() || e.front() == '.' ? e : "." + e);
    }
  }
  if (src["exclude"]) {
    auto ex = read_string_list(src["exclude"], "sources.exclude", error);
    if (!ex) return error;
    out.exclude = std::move(*ex);
  }
  return std::nullopt;
}

std::optional<std::string> parse_annotation(const YAML::Node & ann, AnnotationConfig & out)
{
  std::string error;
  if (ann["enabled"]) {
    out.enabled = ann["enabled"].as<bool>();
  }
  if (ann["command"]) {
    if (ann["command"].IsScalar()) {
      out.command = {ann["command"].as<std::string>()};
    } else {
      auto cmd = read_string_list(ann["command"], "annotation.command", error);
      if (!cmd) return error;
      out.command = std::move(*cmd);
    }
  }
  if (ann["max_concurrency"]) {
    const auto n = ann["max_concurrency"].as<int>();
    if (n < 1) return std::string("annotation.max_concurrency must be at least 1");
    out.max_concurrency = static_cast<size_t>(n);
  }
  if (ann["max_attempts"]) {
    const auto n = ann["max_attempts"].as<int>();
    if (n < 1) return std::string("annotation.max_attempts must be at least 1");
    out.max_attempts = n;
  }
  if (ann["base_backoff_ms"]) {
    auto ms = read_millis(ann["base_backoff_ms"], "annotation.base_backoff_ms", error);
    if (!ms) return error;
    out.base_backoff = *ms;
  }
  if (ann["max_backoff_ms"]) {
    auto ms = read_millis(ann["max_backoff_ms"], "annotation.max_backoff_ms", error);
    if (!ms) return error;
    out.max_backoff = *ms;
  }
  if (ann["timeout_ms"]) {
    auto ms = read_millis(ann["timeout_ms"], "annotation.timeout_ms", error);
    if (!ms) return error;
    out.timeout = *ms;
  }
  if (out.max_backoff < out.base_backoff) {
    return std::string("annotation.max_backoff_ms must not be less than base_backoff_ms");
  }
  return std::nullopt;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"] && root["package"]["name"]) {
    config.package.name = root["package"]["name"].as<std::string>();
  }

  if (root["sources"]) {
    if (auto err = parse_sources(root["sources"], config.sources)) {
      return ConfigLoadResult::fail(*err);
    }
  }

  if (root["cache"] && root["cache"]["path"]) {
    config.cache.path = root["cache"]["path"].as<std::string>();
  }

  if (root["output"]) {
    const auto & out = root["output"];
    if (out["model"]) {
      config.output.model = out["model"].as<std::string>();
    }
    if (out["skeleton"]) {
      config.output.skeleton = out["skeleton"].as<std::string>();
    }
  }

  if (root["annotation"]) {
    if (auto err = parse_annotation(root["annotation"], config.annotation)) {
      return ConfigLoadResult::fail(*err);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(std::string_view package_name)
{
  return fmt::format(
    "package:\n"
    "  name: {}\n"
    "\n"
    "sources:\n"
    "  root: .\n"
    "  extensions: [.java]\n"
    "  exclude: [.git, build, target, out]\n"
    "\n"
    "cache:\n"
    "  path: .docgraph/cache.json\n"
    "\n"
    "output:\n"
    "  model: .docgraph/model.json\n"
    "  skeleton: .docgraph/skeleton.json\n"
    "\n"
    "annotation:\n"
    "  enabled: false\n"
    "  command: []\n"
    "  max_concurrency: 4\n"
    "  max_attempts: 3\n"
    "  base_backoff_ms: 500\n"
    "  max_backoff_ms: 8000\n"
    "  timeout_ms: 120000\n",
    package_name);
}

}  // namespace docgraph
