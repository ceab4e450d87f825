/**
 * @file Loader.hpp
 * @brief Reading JSON and TOML documents from disk
 *
 * Used for configuration files, schema documents and state files.
 * Format is chosen by extension: ".json" or ".toml".
 */

#ifndef FIELDMERGE_LOADER_HPP
#define FIELDMERGE_LOADER_HPP

#include "fieldmerge/Value.hpp"
#include <string>

namespace fieldmerge {

// ============================================================================
// JSON File Loading
// ============================================================================

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid; line and column are
 *         derived from the parser's byte offset
 */
Value load_json_file(const std::string& path);

// ============================================================================
// TOML File Loading
// ============================================================================

/**
 * @brief Load a TOML file
 *
 * Tables become nested objects. Dates and times are rendered as strings.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Auto-detect File Loading
// ============================================================================

/**
 * @brief Load a document, choosing the parser by extension
 *
 * An empty path yields an empty object.
 *
 * @throws FileNotFoundError if path is non-empty and file doesn't exist
 * @throws ParseError on syntax errors
 * @throws ConfigError if extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Lowercase extension including the dot, or "" if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Check that path names an existing regular file
 */
bool file_exists(const std::string& path);

} // namespace fieldmerge

#endif // FIELDMERGE_LOADER_HPP
