// docgraph/resolve/dependency_resolver.cpp - Call-site to method resolution
#include "docgraph/resolve/dependency_resolver.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

#include "docgraph/model/ids.hpp"

namespace docgraph
{

// ============================================================================
// ResolutionStats
// ============================================================================

TierStats & ResolutionStats::tier(ResolutionTier t) noexcept
{
  switch (t) {
    case ResolutionTier::Local:
      return local;
    case ResolutionTier::Import:
      return imported;
    case ResolutionTier::Global:
      return global;
  }
  return global;
}

void ResolutionStats::merge(const ResolutionStats & other) noexcept
{
  methods += other.methods;
  call_sites += other.call_sites;
  local.resolved += other.local.resolved;
  local.ambiguous += other.local.ambiguous;
  imported.resolved += other.imported.resolved;
  imported.ambiguous += other.imported.ambiguous;
  global.resolved += other.global.resolved;
  global.ambiguous += other.global.ambiguous;
  unresolved += other.unresolved;
}

namespace
{

std::string_view last_segment(std::string_view qualified)
{
  const size_t dot = qualified.rfind('.');
  return dot == std::string_view::npos ? qualified : qualified.substr(dot + 1);
}

void append_unique(std::vector<const Method *> & out, gsl::span<Method * const> found)
{
  for (const Method * m : found) {
    if (std::find(out.begin(), out.end(), m) == out.end()) {
      out.push_back(m);
    }
  }
}

// Keep one edge per target. A confident edge replaces an ambiguous one in
// place, so the first-seen order is preserved.
void add_edge(std::vector<DependencyRef> & deps, const DependencyRef & edge)
{
  auto it = std::find_if(deps.begin(), deps.end(), [&](const DependencyRef & d) {
    return d.target == edge.target;
  });
  if (it == deps.end()) {
    deps.push_back(edge);
    return;
  }
  if (it->ambiguous && !edge.ambiguous) {
    *it = edge;
  }
}

}  // namespace

// ============================================================================
// DependencyResolver
// ============================================================================

ResolutionStats DependencyResolver::resolve_all(gsl::span<const std::unique_ptr<File>> files) const
{
  if (!registry_.is_sealed()) {
    throw std::logic_error("dependency resolution requires a sealed symbol registry");
  }

  ResolutionStats stats;
  for (const auto & file : files) {
    const gsl::span<const Import> imports(file->imports);
    for_each_class_in_file(*file, [&](Class & cls) {
      for (auto & method : cls.methods) {
        stats.merge(resolve(*method, imports));
      }
    });
  }
  return stats;
}

ResolutionStats DependencyResolver::resolve(Method & method, gsl::span<const Import> imports) const
{
  ResolutionStats stats;
  stats.methods = 1;
  method.dependencies.clear();
  method.unresolved_dependencies.clear();

  for (const CallSite & call : method.calls) {
    ++stats.call_sites;

    Candidates found = find_candidates(method, call.name, imports);
    if (found.methods.empty()) {
      method.unresolved_dependencies.push_back(call.name);
      ++stats.unresolved;
      continue;
    }

    std::sort(
      found.methods.begin(), found.methods.end(),
      [](const Method * a, const Method * b) { return a->umid < b->umid; });

    std::vector<const Method *> chosen = found.methods;
    if (chosen.size() > 1 && call.argument_count != k_unknown_argument_count) {
      std::vector<const Method *> matching;
      std::copy_if(
        chosen.begin(), chosen.end(), std::back_inserter(matching),
        [&](const Method * m) { return m->accepts_argument_count(call.argument_count); });
      if (!matching.empty()) {
        chosen = std::move(matching);
      }
    }

    const bool ambiguous = chosen.size() > 1;
    TierStats & tier_stats = stats.tier(found.tier);
    if (ambiguous) {
      ++tier_stats.ambiguous;
    } else {
      ++tier_stats.resolved;
    }

    for (const Method * target : chosen) {
      add_edge(method.dependencies, DependencyRef{target, found.tier, ambiguous});
    }
  }

  // Recursion is not recorded as an edge.
  method.dependencies.erase(
    std::remove_if(
      method.dependencies.begin(), method.dependencies.end(),
      [&](const DependencyRef & d) { return d.target == &method; }),
    method.dependencies.end());

  auto & unresolved = method.unresolved_dependencies;
  std::sort(unresolved.begin(), unresolved.end());
  unresolved.erase(std::unique(unresolved.begin(), unresolved.end()), unresolved.end());

  return stats;
}

DependencyResolver::Candidates DependencyResolver::find_candidates(
  const Method & method, std::string_view name, gsl::span<const Import> imports) const
{
  Candidates out;

  // 1. Local
  append_unique(
    out.methods, registry_.lookup_by_scoped(make_scoped_identifier(method.class_ucid, name)));
  if (!out.methods.empty()) {
    out.tier = ResolutionTier::Local;
    return out;
  }

  // 2. Import
  for (const Import & imp : imports) {
    append_unique(out.methods, registry_.lookup_by_scoped(make_scoped_identifier(imp.name, name)));
    if (imp.is_static && !imp.is_wildcard && last_segment(imp.name) == name) {
      append_unique(out.methods, registry_.lookup_by_scoped(imp.name));
    }
  }
  if (!out.methods.empty()) {
    out.tier = ResolutionTier::Import;
    return out;
  }

  // 3. Global
  append_unique(out.methods, registry_.lookup_by_short_name(name));
  out.tier = ResolutionTier::Global;
  return out;
}

}  // namespace docgraph
