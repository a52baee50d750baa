// docgraph/cache/cache_store.cpp - Persisted description cache (JSON file)
#include "docgraph/cache/cache_store.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <system_error>

namespace docgraph
{

using nlohmann::json;

CacheLoadResult parse_cache(std::string_view text)
{
  json root;
  try {
    root = json::parse(text.begin(), text.end());
  } catch (const json::parse_error & e) {
    return CacheLoadResult::fail(std::string("malformed cache JSON: ") + e.what());
  }

  if (!root.is_object()) {
    return CacheLoadResult::fail("cache root must be a JSON object");
  }

  CacheMap entries;
  for (auto it = root.begin(); it != root.end(); ++it) {
    const json & value = it.value();
    if (!value.is_object()) continue;

    const auto hash = value.find("hash");
    if (hash == value.end() || !hash->is_string()) continue;

    CacheEntry entry;
    entry.hash = hash->get<std::string>();
    const auto desc = value.find("description");
    if (desc != value.end() && desc->is_string()) {
      entry.description = desc->get<std::string>();
    }
    entries.emplace(it.key(), std::move(entry));
  }
  return CacheLoadResult::ok(std::move(entries));
}

CacheLoadResult load_cache_file(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return CacheLoadResult::ok({});
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return CacheLoadResult::fail("cannot open cache file: " + path.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse_cache(ss.str());
}

std::string serialize_cache(const CacheMap & entries)
{
  json root = json::object();
  for (const auto & [id, entry] : entries) {
    root[id] = json{{"hash", entry.hash}, {"description", entry.description}};
  }
  return root.dump(2, ' ', false, json::error_handler_t::replace);
}

CacheSaveResult save_cache_file(const std::filesystem::path & path, const CacheMap & entries)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return {false, "cannot create directory " + path.parent_path().string() + ": " + ec.message()};
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return {false, "cannot write cache file: " + path.string()};
  }
  out << serialize_cache(entries) << "\n";
  if (!out) {
    return {false, "failed while writing cache file: " + path.string()};
  }
  return {true, {}};
}

}  // namespace docgraph
