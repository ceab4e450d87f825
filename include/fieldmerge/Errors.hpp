/**
 * @file Errors.hpp
 * @brief Exception types for fieldmerge
 *
 * Error taxonomy:
 * - Error: Base class for everything thrown by the library
 * - ConfigError: Configuration loading and access
 *   - MissingMandatoryConfig: Mandatory keys absent
 *   - FileNotFoundError: Input file not found
 *   - ParseError: JSON/TOML syntax errors
 *   - KeyError: Dot-path segment not found
 *   - TypeError: Traversal into non-container
 * - SchemaError: Malformed schema document or unresolved type reference
 * - ValidationError: Object does not match its schema type
 * - PathParseError: Malformed field path text
 *
 * ConflictError lives in Conflict.hpp next to the Conflict value type.
 */

#ifndef FIELDMERGE_ERRORS_HPP
#define FIELDMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace fieldmerge {

/**
 * @brief Base class for all fieldmerge exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Base class for configuration errors
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Mandatory configuration keys are missing after merge
 */
class MissingMandatoryConfig : public ConfigError {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 *
 * Line and column are 0 when the parser does not report a position.
 */
class ParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path, position and error details
     * @param file Path to the file with parse error
     * @param line 1-based line, or 0 if unknown
     * @param column 1-based column, or 0 if unknown
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) oss << " at " << line << ":" << column;
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public ConfigError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "merge.prune_dangling")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-container type
 * (e.g., trying to access "scalar_value.sub_key").
 */
class TypeError : public ConfigError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Schema document is malformed or references an unknown type
 */
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& details)
        : Error("Schema error: " + details)
    {}
};

/**
 * @brief Object does not conform to its schema type
 */
class ValidationError : public Error {
public:
    /**
     * @param path Rendered field path of the offending node ("" for root)
     * @param details What was wrong at that node
     */
    ValidationError(std::string path, std::string details)
        : Error("Validation error at '" + (path.empty() ? std::string(".") : path) +
                "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Field path text could not be parsed
 */
class PathParseError : public Error {
public:
    PathParseError(std::string text, size_t position, const std::string& details)
        : Error("Invalid field path '" + text + "' at offset " +
                std::to_string(position) + ": " + details)
        , text_(std::move(text))
        , position_(position)
    {}

    const std::string& text() const noexcept { return text_; }
    size_t position() const noexcept { return position_; }

private:
    std::string text_;
    size_t position_;
};

} // namespace fieldmerge

#endif // FIELDMERGE_ERRORS_HPP
