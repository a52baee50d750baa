// docgraph/driver/project.cpp - In-memory index of a set of Java sources
#include "docgraph/driver/project.hpp"

#include <stdexcept>

#include "docgraph/builder/entity_builder.hpp"
#include "docgraph/syntax/frontend.hpp"

namespace docgraph
{

File * Project::add_source(std::string ufid, std::string text)
{
  if (registry_.is_sealed()) {
    throw std::logic_error("cannot add '" + ufid + "' after the project was resolved");
  }
  if (sources_.find(ufid).has_value()) {
    diags_.report_error(SourceRange{}, "source '" + ufid + "' was added twice");
    return nullptr;
  }

  const FileId id = sources_.register_file(ufid, std::move(text));
  const ParsedUnit unit = parse_java(sources_, id, diags_);
  if (unit.tree.is_null()) {
    return nullptr;
  }

  EntityBuilder builder(*sources_.get_file(id), id, registry_, diags_);
  files_.push_back(builder.build_file(unit.root()));
  return files_.back().get();
}

const ResolutionStats & Project::resolve()
{
  registry_.seal();
  const DependencyResolver resolver(registry_);
  stats_ = resolver.resolve_all(files_);
  return stats_;
}

CacheLoadStats Project::load_cache(const CacheMap & cache)
{
  CacheManager manager(registry_);
  return manager.load(cache);
}

CacheMap Project::export_cache() const
{
  const CacheManager manager(registry_);
  return manager.export_entries();
}

AnnotationReport Project::annotate(
  AnnotationGenerator & generator, const OrchestratorOptions & options)
{
  DescriptionOrchestrator orchestrator(generator, options);
  return orchestrator.annotate(files_);
}

const File * Project::find_file(std::string_view ufid) const noexcept
{
  for (const auto & f : files_) {
    if (f->ufid == ufid) return f.get();
  }
  return nullptr;
}

}  // namespace docgraph
