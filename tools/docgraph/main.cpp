// docgraph - Java source indexer command line interface
//
// Usage:
//   docgraph index [dir] [--project] [-o model.json] [--cache path] [--no-annotate] [-j N] [-v]
//   docgraph check [dir]
//   docgraph init [package-name]
//   docgraph clean [dir]
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <rang.hpp>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include "docgraph/basic/diagnostic_printer.hpp"
#include "docgraph/driver/indexer.hpp"
#include "docgraph/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "docgraph v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  index [dir]              Index a Java project and write the JSON model\n"
            << "  check [dir]              Build and resolve only, print diagnostics\n"
            << "  init [package-name]      Write a default docgraph.yaml\n"
            << "  clean [dir]              Remove generated model, skeleton and cache files\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Model output file\n"
            << "  --cache <path>           Cache file\n"
            << "  --project                Require a docgraph.yaml\n"
            << "  --no-annotate            Skip description generation\n"
            << "  -j, --jobs <n>           Concurrent generator calls\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

void print_error(const std::string & message)
{
  std::cerr << rang::style::bold << rang::fg::red << "error" << rang::style::reset << ": "
            << message << "\n";
}

void print_diagnostics(const docgraph::DiagnosticBag & diagnostics, const docgraph::Project * project)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  docgraph::DiagnosticPrinter printer(std::cerr, use_color);

  static const docgraph::SourceRegistry k_no_sources;
  printer.print_all(diagnostics, project != nullptr ? project->sources() : k_no_sources);

  const std::string summary = docgraph::summarize(diagnostics);
  if (!summary.empty()) {
    fmt::print(stderr, "{} reported\n", summary);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string output_path;
  std::string cache_path;
  std::optional<size_t> jobs;
  bool use_project = false;
  bool no_annotate = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    const bool takes_value =
      arg == "-o" || arg == "--output" || arg == "--cache" || arg == "-j" || arg == "--jobs";
    if (takes_value && i + 1 >= argc) {
      args.error = "missing value for '" + arg + "'";
      break;
    }

    if (arg == "-o" || arg == "--output") {
      args.output_path = argv[++i];
    } else if (arg == "--cache") {
      args.cache_path = argv[++i];
    } else if (arg == "-j" || arg == "--jobs") {
      const std::string value = argv[++i];
      try {
        const int n = std::stoi(value);
        if (n < 1) throw std::out_of_range(value);
        args.jobs = static_cast<size_t>(n);
      } catch (const std::exception &) {
        args.error = "invalid job count: " + value;
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-annotate") {
      args.no_annotate = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

/// Find docgraph.yaml from the given directory upward. Without one, the
/// directory itself is indexed with default settings unless --project is set.
std::optional<docgraph::ProjectConfig> load_config(const CommandArgs & args)
{
  const fs::path start = args.input.empty() ? fs::current_path() : fs::path(args.input);

  if (auto config_path = docgraph::find_project_config(start)) {
    auto loaded = docgraph::load_project_config(*config_path);
    if (!loaded.success) {
      print_error(loaded.error);
      return std::nullopt;
    }
    if (args.verbose) {
      fmt::print(stderr, "Using {}\n", config_path->string());
    }
    return std::move(loaded.config);
  }

  if (args.use_project) {
    print_error(fmt::format("no {} found in {} or parents", docgraph::k_project_config_file_name, start.string()));
    return std::nullopt;
  }

  docgraph::ProjectConfig config;
  config.project_root = fs::absolute(start);
  return config;
}

void print_stats(const docgraph::IndexStats & stats)
{
  const auto & r = stats.resolution;
  fmt::print(
    stderr, "{} files, {} classes, {} methods, {} call sites\n", stats.files, stats.classes,
    stats.methods, r.call_sites);
  fmt::print(
    stderr, "resolved: local {}, import {}, global {}; ambiguous {}; unresolved {}\n",
    r.local.resolved, r.imported.resolved, r.global.resolved, r.ambiguous_total(), r.unresolved);
  fmt::print(
    stderr, "cache: {} clean, {} changed\n", stats.cache.clean_methods + stats.cache.clean_classes,
    stats.cache.dirty());
  if (stats.annotation) {
    const auto & a = *stats.annotation;
    fmt::print(
      stderr, "annotation: {} scheduled, {} ok, {} failed, {} retries\n", a.scheduled, a.succeeded,
      a.failed, a.retries);
  }
}

// ============================================================================
// Commands
// ============================================================================

int run_indexer(const CommandArgs & args, docgraph::IndexMode mode)
{
  const auto config = load_config(args);
  if (!config) {
    return 1;
  }

  docgraph::IndexOptions options;
  options.mode = mode;
  options.no_annotate = args.no_annotate;
  options.max_concurrency = args.jobs;
  if (!args.output_path.empty()) {
    options.model_output = args.output_path;
  }
  if (!args.cache_path.empty()) {
    options.cache_path = args.cache_path;
  }

  if (args.verbose) {
    fmt::print(
      stderr, "Indexing {} ({})\n", config->resolve(config->sources.root).string(),
      config->package.name.empty() ? "unnamed package" : config->package.name);
  }

  const docgraph::IndexResult result = docgraph::Indexer::index_project(*config, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.project.get());
  }
  if (args.verbose) {
    print_stats(result.stats);
  }

  for (const auto & file : result.written_files) {
    std::cerr << "Wrote: " << file.string() << "\n";
  }

  if (!result.success) {
    return 1;
  }
  if (mode == docgraph::IndexMode::Check) {
    std::cout << rang::fg::green << "OK" << rang::style::reset << ": " << result.stats.files
              << " files, " << result.stats.classes << " classes\n";
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path config_path = fs::current_path() / docgraph::k_project_config_file_name;

  if (fs::exists(config_path)) {
    print_error("already exists: " + config_path.string());
    return 1;
  }

  const std::string name =
    args.input.empty() ? fs::current_path().filename().string() : args.input;

  std::ofstream config(config_path);
  if (!config) {
    print_error("failed to create " + config_path.string());
    return 1;
  }
  config << docgraph::default_project_config(name);
  config.close();
  if (!config) {
    print_error("failed to write " + config_path.string());
    return 1;
  }

  std::cout << "Initialized " << config_path.string() << "\n";
  std::cout << "\nNext steps:\n"
            << "  set annotation.command and annotation.enabled in "
            << docgraph::k_project_config_file_name << "\n"
            << "  docgraph index\n";
  return 0;
}

int cmd_clean(const CommandArgs & args)
{
  const auto config = load_config(args);
  if (!config) {
    return 1;
  }

  for (const auto & removed : docgraph::Indexer::clean_outputs(*config)) {
    std::cout << "Removed: " << removed.string() << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    print_error(args.error);
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "index") {
    return run_indexer(args, docgraph::IndexMode::Index);
  }

  if (args.command == "check") {
    return run_indexer(args, docgraph::IndexMode::Check);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  if (args.command == "clean") {
    return cmd_clean(args);
  }

  print_error("unknown command '" + args.command + "'");
  print_usage(argv[0]);
  return 1;
}
