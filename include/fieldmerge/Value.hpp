/**
 * @file Value.hpp
 * @brief Untyped value model for objects, schemas and configuration
 *
 * Uses nlohmann::json as the underlying tree:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * A Value carries no schema. TypedValue pairs one with a schema type.
 */

#ifndef FIELDMERGE_VALUE_HPP
#define FIELDMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace fieldmerge {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. Equality is structural and operator< gives
 * the total order used when path elements carry values.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace fieldmerge

#endif // FIELDMERGE_VALUE_HPP
