// docgraph/cache/cache_manager.hpp - Description cache keyed by body hash
#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "docgraph/resolve/symbol_registry.hpp"

namespace docgraph
{

struct CacheEntry
{
  std::string hash;
  std::string description;

  [[nodiscard]] bool operator==(const CacheEntry & other) const
  {
    return hash == other.hash && description == other.description;
  }
};

/// id (umid for methods, ucid for classes) -> entry. Ordered so that
/// exported cache files are stable across runs.
using CacheMap = std::map<std::string, CacheEntry, std::less<>>;

struct CacheLoadStats
{
  size_t clean_methods = 0;
  size_t dirty_methods = 0;
  size_t clean_classes = 0;
  size_t dirty_classes = 0;

  [[nodiscard]] size_t dirty() const noexcept { return dirty_methods + dirty_classes; }
};

/**
 * Matches cached descriptions against freshly computed body hashes.
 *
 * An entity is clean when the cache holds an entry for its id with an equal
 * hash; its description is then restored from the cache. Any other entity is
 * dirty and its description is cleared. Dirtiness never propagates along
 * dependency edges.
 */
class CacheManager
{
public:
  explicit CacheManager(const SymbolRegistry & registry) : registry_(registry) {}

  CacheLoadStats load(const CacheMap & cache);

  /// Current hash and description of every registered method and class.
  [[nodiscard]] CacheMap export_entries() const;

private:
  const SymbolRegistry & registry_;
};

}  // namespace docgraph
