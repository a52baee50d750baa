// docgraph/model/ids.cpp - Identifier formats
#include "docgraph/model/ids.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace docgraph
{

std::string make_ucid(std::string_view scope, std::string_view identifier)
{
  if (scope.empty()) {
    return std::string(identifier);
  }
  return fmt::format("{}.{}", scope, identifier);
}

std::string make_umid(
  std::string_view ucid, std::string_view identifier,
  const std::vector<std::string> & parameter_types)
{
  return fmt::format("{}#{}({})", ucid, identifier, fmt::join(parameter_types, ","));
}

std::string make_scoped_identifier(std::string_view ucid, std::string_view identifier)
{
  return fmt::format("{}.{}", ucid, identifier);
}

std::string make_field_id(std::string_view ucid, std::string_view identifier)
{
  return fmt::format("{}.{}", ucid, identifier);
}

}  // namespace docgraph
