// docgraph/model/json_view.hpp - JSON views of the entity model
//
// Two views are produced:
//  - the full model (ids, signatures, dependency edges, descriptions), consumed
//    by downstream serializers;
//  - a skeleton (signatures and descriptions only, nested the same way), useful
//    as a compact outline of a project.
//
#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <vector>

#include "docgraph/model/entity.hpp"

namespace docgraph
{

[[nodiscard]] nlohmann::json to_json(const Method & method);
[[nodiscard]] nlohmann::json to_json(const Field & field);
[[nodiscard]] nlohmann::json to_json(const Class & cls);
[[nodiscard]] nlohmann::json to_json(const File & file);

/**
 * Serialize all files.
 *
 * @return {"files": [...]} with files in the given order
 */
[[nodiscard]] nlohmann::json to_json(const std::vector<std::unique_ptr<File>> & files);

[[nodiscard]] nlohmann::json to_skeleton_json(const Class & cls);
[[nodiscard]] nlohmann::json to_skeleton_json(
  const std::vector<std::unique_ptr<File>> & files);

}  // namespace docgraph
