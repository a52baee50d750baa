// docgraph/resolve/dependency_resolver.hpp - Call-site to method resolution
#pragma once

#include <cstddef>
#include <gsl/span>
#include <memory>
#include <string_view>
#include <vector>

#include "docgraph/model/entity.hpp"
#include "docgraph/resolve/symbol_registry.hpp"

namespace docgraph
{

struct TierStats
{
  size_t resolved = 0;   // call sites with one confident target
  size_t ambiguous = 0;  // call sites with several candidate targets
};

struct ResolutionStats
{
  size_t methods = 0;
  size_t call_sites = 0;
  TierStats local;
  TierStats imported;
  TierStats global;
  size_t unresolved = 0;

  [[nodiscard]] TierStats & tier(ResolutionTier t) noexcept;
  [[nodiscard]] size_t resolved_total() const noexcept
  {
    return local.resolved + imported.resolved + global.resolved;
  }
  [[nodiscard]] size_t ambiguous_total() const noexcept
  {
    return local.ambiguous + imported.ambiguous + global.ambiguous;
  }

  void merge(const ResolutionStats & other) noexcept;
};

/**
 * Resolves the raw call sites of each method against a sealed registry.
 *
 * Tiers are tried in order and the first tier producing any candidate wins:
 *   1. Local:  "<class ucid>.<name>"
 *   2. Import: "<import>.<name>" for every import in file order, plus the
 *              import itself when it is a static import of `name`
 *   3. Global: every method called `name`
 * A call site without candidates is recorded as unresolved.
 *
 * Within a tier, several candidates are narrowed by argument count. A single
 * survivor is a confident edge; otherwise every survivor is kept as an
 * ambiguous edge. When the count is unknown or no candidate accepts it, all
 * candidates are kept as ambiguous.
 */
class DependencyResolver
{
public:
  explicit DependencyResolver(const SymbolRegistry & registry) : registry_(registry) {}

  /**
   * Resolve every method of every file.
   *
   * @throws std::logic_error if the registry is not sealed yet
   */
  ResolutionStats resolve_all(gsl::span<const std::unique_ptr<File>> files) const;

  /// Resolve one method. Previous results on the method are replaced.
  ResolutionStats resolve(Method & method, gsl::span<const Import> imports) const;

private:
  struct Candidates
  {
    std::vector<const Method *> methods;
    ResolutionTier tier = ResolutionTier::Local;
  };

  [[nodiscard]] Candidates find_candidates(
    const Method & method, std::string_view name, gsl::span<const Import> imports) const;

  const SymbolRegistry & registry_;
};

}  // namespace docgraph
