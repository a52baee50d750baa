// docgraph/resolve/symbol_registry.hpp - Per-run index of classes and methods
#pragma once

#include <cstddef>
#include <functional>
#include <gsl/span>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "docgraph/model/entity.hpp"

namespace docgraph
{

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

struct RegistryHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

struct RegistryEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Symbol Registry
// ============================================================================

/**
 * Resolution context for one indexing run.
 *
 * Indices:
 * - by_umid:       umid -> Method (one entry per method)
 * - by_scoped:     "<ucid>.<identifier>" -> overload set
 * - by_short_name: identifier -> every method with that name
 * - by_ucid:       ucid -> Class
 *
 * The registry does not own anything. Keys are views into the registered
 * entities' id strings, which must not change after registration.
 *
 * Registration happens during the build phase; seal() ends it. Lookups are
 * valid at any time but resolution only starts after sealing.
 */
class SymbolRegistry
{
public:
  using MethodList = std::vector<Method *>;

  SymbolRegistry() = default;
  SymbolRegistry(const SymbolRegistry &) = delete;
  SymbolRegistry & operator=(const SymbolRegistry &) = delete;
  SymbolRegistry(SymbolRegistry &&) = default;
  SymbolRegistry & operator=(SymbolRegistry &&) = default;

  // ===========================================================================
  // Registration
  // ===========================================================================

  /**
   * Register a method in all three method indices.
   *
   * @return false if the umid is already registered or the registry is
   *         sealed; no index is modified in that case
   */
  bool register_method(Method & method);

  /**
   * Register a class in the class index.
   *
   * @return false if the ucid is already registered or the registry is sealed
   */
  bool register_class(Class & cls);

  void seal() noexcept { sealed_ = true; }
  [[nodiscard]] bool is_sealed() const noexcept { return sealed_; }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  [[nodiscard]] Method * lookup_by_umid(std::string_view umid) const;
  [[nodiscard]] gsl::span<Method * const> lookup_by_scoped(std::string_view scoped) const;
  [[nodiscard]] gsl::span<Method * const> lookup_by_short_name(std::string_view name) const;
  [[nodiscard]] Class * lookup_class(std::string_view ucid) const;

  [[nodiscard]] bool contains_method(std::string_view umid) const
  {
    return lookup_by_umid(umid) != nullptr;
  }
  [[nodiscard]] bool contains_class(std::string_view ucid) const
  {
    return lookup_class(ucid) != nullptr;
  }

  /// Methods in registration order.
  [[nodiscard]] gsl::span<Method * const> methods() const noexcept { return methods_; }
  /// Classes in registration order.
  [[nodiscard]] gsl::span<Class * const> classes() const noexcept { return classes_; }

  [[nodiscard]] size_t method_count() const noexcept { return methods_.size(); }
  [[nodiscard]] size_t class_count() const noexcept { return classes_.size(); }

private:
  template <typename V>
  using Index = std::unordered_map<std::string_view, V, RegistryHash, RegistryEqual>;

  Index<Method *> by_umid_;
  Index<MethodList> by_scoped_;
  Index<MethodList> by_short_name_;
  Index<Class *> by_ucid_;

  std::vector<Method *> methods_;
  std::vector<Class *> classes_;
  bool sealed_ = false;
};

}  // namespace docgraph
