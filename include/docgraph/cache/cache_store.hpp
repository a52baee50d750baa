// docgraph/cache/cache_store.hpp - Persisted description cache (JSON file)
//
// File format:
//   {
//     "app.Main#run()": {"hash": "<sha256>", "description": "..."},
//     "app.Main":       {"hash": "<sha256>", "description": "..."}
//   }
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "docgraph/cache/cache_manager.hpp"

namespace docgraph
{

struct CacheLoadResult
{
  CacheMap entries;
  bool success = false;
  std::string error;

  static CacheLoadResult ok(CacheMap map)
  {
    CacheLoadResult r;
    r.entries = std::move(map);
    r.success = true;
    return r;
  }

  static CacheLoadResult fail(std::string msg)
  {
    CacheLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

struct CacheSaveResult
{
  bool success = false;
  std::string error;
};

/**
 * Read a cache file. A missing file is an empty cache, not an error.
 * Entries without a string "hash" are skipped.
 */
[[nodiscard]] CacheLoadResult load_cache_file(const std::filesystem::path & path);

/// Parse cache JSON text.
[[nodiscard]] CacheLoadResult parse_cache(std::string_view text);

/// Write a cache file, creating parent directories as needed.
[[nodiscard]] CacheSaveResult save_cache_file(
  const std::filesystem::path & path, const CacheMap & entries);

[[nodiscard]] std::string serialize_cache(const CacheMap & entries);

}  // namespace docgraph
