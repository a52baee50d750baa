// docgraph/cache/body_hash.hpp - Whitespace-insensitive content hashing
#pragma once

#include <string>
#include <string_view>

namespace docgraph
{

/// Remove every whitespace character (space, tab, CR, LF, VT, FF).
[[nodiscard]] std::string normalize_body(std::string_view body);

/**
 * Lowercase hex SHA-256 of the normalized body.
 *
 * Bodies that differ only in whitespace hash identically.
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
[[nodiscard]] std::string compute_hash(std::string_view body);

}  // namespace docgraph
