// docgraph/model/ids.hpp - Identifier formats for files, classes, methods and fields
//
//   ucid               package.Outer.Inner     (empty scope omits the dot)
//   umid               <ucid>#<identifier>(<type>,<type>)
//   scoped identifier  <ucid>.<identifier>
//   field id           <ucid>.<identifier>
//
// These strings are persisted in cache files, so their format is stable.
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docgraph
{

inline constexpr std::string_view k_constructor_identifier = "<init>";
inline constexpr std::string_view k_unknown_identifier = "Unknown";
inline constexpr std::string_view k_package_private = "package-private";

[[nodiscard]] std::string make_ucid(std::string_view scope, std::string_view identifier);

[[nodiscard]] std::string make_umid(
  std::string_view ucid, std::string_view identifier,
  const std::vector<std::string> & parameter_types);

[[nodiscard]] std::string make_scoped_identifier(std::string_view ucid, std::string_view identifier);

[[nodiscard]] std::string make_field_id(std::string_view ucid, std::string_view identifier);

}  // namespace docgraph
