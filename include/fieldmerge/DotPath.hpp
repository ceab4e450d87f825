/**
 * @file DotPath.hpp
 * @brief Dot-notation access to configuration trees
 *
 * Settings are addressed as "merge.prune_dangling" or "output.indent".
 * Array elements are reachable by decimal index ("a.0.b").
 *
 * Behavior:
 * - get_by_dot() raises KeyError when a segment is missing
 * - find_by_dot() returns nullptr when a segment is missing
 * - both raise TypeError when traversal hits a scalar before the last segment
 * - set_by_dot() creates intermediate objects and replaces scalars in the way
 */

#ifndef FIELDMERGE_DOTPATH_HPP
#define FIELDMERGE_DOTPATH_HPP

#include "fieldmerge/Value.hpp"
#include "fieldmerge/Errors.hpp"
#include <string>
#include <vector>

namespace fieldmerge {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped:
 * - "output.indent" -> ["output", "indent"]
 * - "" -> []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value at path (strict)
 *
 * @return Pointer to value at path; the root for an empty path
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a non-container before the final segment
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Get value at path, or nullptr if a segment is missing
 *
 * @throws TypeError if traversal hits a non-container before the final segment
 */
const Value* find_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value at path, creating intermediate objects as needed
 *
 * An empty path replaces the root.
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Check whether path resolves
 *
 * @throws TypeError if traversal hits a non-container before the final segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace fieldmerge

#endif // FIELDMERGE_DOTPATH_HPP
