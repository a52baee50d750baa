// docgraph/resolve/symbol_registry.cpp - Per-run index of classes and methods
#include "docgraph/resolve/symbol_registry.hpp"

namespace docgraph
{

bool SymbolRegistry::register_method(Method & method)
{
  if (sealed_) {
    return false;
  }

  auto [it, inserted] = by_umid_.emplace(method.umid, &method);
  if (!inserted) {
    return false;
  }

  by_scoped_[method.scoped_identifier].push_back(&method);
  by_short_name_[method.identifier].push_back(&method);
  methods_.push_back(&method);
  return true;
}

bool SymbolRegistry::register_class(Class & cls)
{
  if (sealed_) {
    return false;
  }

  auto [it, inserted] = by_ucid_.emplace(cls.ucid, &cls);
  if (!inserted) {
    return false;
  }
  classes_.push_back(&cls);
  return true;
}

Method * SymbolRegistry::lookup_by_umid(std::string_view umid) const
{
  auto it = by_umid_.find(umid);
  return it != by_umid_.end() ? it->second : nullptr;
}

gsl::span<Method * const> SymbolRegistry::lookup_by_scoped(std::string_view scoped) const
{
  auto it = by_scoped_.find(scoped);
  if (it == by_scoped_.end()) {
    return {};
  }
  return it->second;
}

gsl::span<Method * const> SymbolRegistry::lookup_by_short_name(std::string_view name) const
{
  auto it = by_short_name_.find(name);
  if (it == by_short_name_.end()) {
    return {};
  }
  return it->second;
}

Class * SymbolRegistry::lookup_class(std::string_view ucid) const
{
  auto it = by_ucid_.find(ucid);
  return it != by_ucid_.end() ? it->second : nullptr;
}

}  // namespace docgraph
