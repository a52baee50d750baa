// docgraph/cache/cache_manager.cpp - Description cache keyed by body hash
#include "docgraph/cache/cache_manager.hpp"

namespace docgraph
{

namespace
{

// Returns true when the entity was restored from the cache.
template <typename Entity>
bool seed_from_cache(Entity & entity, const std::string & id, const CacheMap & cache)
{
  auto it = cache.find(id);
  if (it != cache.end() && it->second.hash == entity.body_hash) {
    entity.description = it->second.description;
    return true;
  }
  entity.description.clear();
  entity.confidence = 0;
  return false;
}

}  // namespace

CacheLoadStats CacheManager::load(const CacheMap & cache)
{
  CacheLoadStats stats;

  for (Method * m : registry_.methods()) {
    if (seed_from_cache(*m, m->umid, cache)) {
      ++stats.clean_methods;
    } else {
      ++stats.dirty_methods;
    }
  }

  for (Class * c : registry_.classes()) {
    if (seed_from_cache(*c, c->ucid, cache)) {
      ++stats.clean_classes;
    } else {
      ++stats.dirty_classes;
    }
  }

  return stats;
}

CacheMap CacheManager::export_entries() const
{
  CacheMap out;
  for (const Method * m : registry_.methods()) {
    out[m->umid] = CacheEntry{m->body_hash, m->description};
  }
  for (const Class * c : registry_.classes()) {
    out[c->ucid] = CacheEntry{c->body_hash, c->description};
  }
  return out;
}

}  // namespace docgraph
