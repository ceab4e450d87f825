/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "fieldmerge/DotPath.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace fieldmerge {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {
    // Non-negative decimal without leading zeros
    bool is_array_index(const std::string& segment) {
        if (segment.empty()) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Walk segments from data
     *
     * Returns nullptr at the first missing segment and reports it through
     * missing. Scalars in the way are a TypeError.
     */
    const Value* traverse(const Value& data, const std::string& path, std::string* missing) {
        const Value* current = &data;

        for (const auto& seg : split_dot_path(path)) {
            if (!is_container(*current)) {
                throw TypeError(path, "object or array", type_name(*current));
            }

            if (current->is_object()) {
                auto it = current->find(seg);
                if (it == current->end()) {
                    if (missing) *missing = seg;
                    return nullptr;
                }
                current = &*it;
            } else {
                if (!is_array_index(seg) || std::stoull(seg) >= current->size()) {
                    if (missing) *missing = seg;
                    return nullptr;
                }
                current = &(*current)[std::stoull(seg)];
            }
        }

        return current;
    }
} // namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    std::string missing;
    const Value* found = traverse(data, path, &missing);
    if (!found) throw KeyError(path, missing);
    return found;
}

const Value* find_by_dot(const Value& data, const std::string& path) {
    return traverse(data, path, nullptr);
}

bool contains_dot(const Value& data, const std::string& path) {
    return traverse(data, path, nullptr) != nullptr;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        Value& child = (*current)[segments[i]];
        if (!child.is_object()) {
            child = Value::object();
        }
        current = &child;
    }

    if (!current->is_object()) {
        *current = Value::object();
    }
    (*current)[segments.back()] = value;
}

} // namespace fieldmerge
