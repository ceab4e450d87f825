/**
 * @file Parse.hpp
 * @brief String-to-Value type parsing
 *
 * Converts environment variable values and --overrides values into typed
 * Values. First match wins:
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (^-?[0-9]+$, within int64 range)
 * - Float (^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...] that parses)
 * - Quoted string ("..." with JSON escapes)
 * - Raw string (fallback)
 */

#ifndef FIELDMERGE_PARSE_HPP
#define FIELDMERGE_PARSE_HPP

#include "fieldmerge/Value.hpp"
#include <string>

namespace fieldmerge {

/**
 * @brief Parse string value to appropriate type
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")       // -> true
 * parse_value("42")         // -> 42
 * parse_value("-2.5e10")    // -> -2.5e10
 * parse_value("[1,2]")      // -> [1, 2]
 * parse_value("\"7\"")      // -> "7"
 * parse_value("json")       // -> "json"
 * ```
 */
Value parse_value(const std::string& str);

} // namespace fieldmerge

#endif // FIELDMERGE_PARSE_HPP
