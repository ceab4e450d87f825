/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "fieldmerge/Loader.hpp"
#include "fieldmerge/Errors.hpp"
#include "fieldmerge/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

namespace fieldmerge {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

// 1-based line and column of the byte at offset (nlohmann reports one past it)
std::pair<int, int> line_and_column(const std::string& content, size_t offset) {
    int line = 1;
    int column = 1;
    const size_t end = std::min(offset > 0 ? offset - 1 : 0, content.size());
    for (size_t i = 0; i < end; ++i) {
        if (content[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

// ============================================================================
// JSON File Loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);

    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        const auto [line, column] = line_and_column(content, e.byte);
        throw ParseError(path, line, column, e.what());
    }
}

// ============================================================================
// TOML File Loading
// ============================================================================

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_value_to_json(table);
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_config_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }

    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported file type: '" + ext + "' (expected .json or .toml)");
}

} // namespace fieldmerge
