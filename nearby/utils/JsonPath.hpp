#pragma once

#include <string_view>
#include <nlohmann/json.hpp>

namespace Nearby {

namespace JsonPath {

/**
 * @brief Resolve a dot-separated path (e.g. "venue.location") inside a document
 * @return Pointer to the addressed node, or nullptr if any segment is missing
 *         or an intermediate node is not an object
 */
[[nodiscard]] const nlohmann::json* Resolve(const nlohmann::json& document, std::string_view path);

/**
 * @brief Resolve a path, creating intermediate objects as needed
 * @return Pointer to the addressed node, or nullptr if an intermediate node
 *         exists but is not an object
 */
nlohmann::json* ResolveOrCreate(nlohmann::json& document, std::string_view path);

} // namespace JsonPath

} // namespace Nearby
