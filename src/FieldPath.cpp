/**
 * @file FieldPath.cpp
 * @brief Implementation of field paths and their text form
 */

#include "fieldmerge/FieldPath.hpp"
#include "fieldmerge/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace fieldmerge {

namespace {
    /**
     * @brief Find the first occurrence of any stop character outside JSON
     *        strings and brackets, starting at pos
     * @return Index of the stop character, or npos
     */
    size_t find_top_level(const std::string& s, size_t pos, const std::string& stops) {
        int depth = 0;
        bool in_str = false;
        for (size_t i = pos; i < s.size(); ++i) {
            char c = s[i];
            if (in_str) {
                if (c == '\\') { ++i; continue; }
                if (c == '"') in_str = false;
                continue;
            }
            if (depth == 0 && stops.find(c) != std::string::npos) return i;
            if (c == '"') { in_str = true; continue; }
            if (c == '{' || c == '[') { ++depth; continue; }
            if (c == '}' || c == ']') { --depth; continue; }
        }
        return std::string::npos;
    }

    /**
     * @brief Parse a JSON fragment embedded in path text
     */
    Value parse_embedded(const std::string& text, size_t offset, const std::string& fragment) {
        Value v = Value::parse(fragment, nullptr, false);
        if (v.is_discarded()) {
            throw PathParseError(text, offset, "invalid value '" + fragment + "'");
        }
        return v;
    }

    bool is_index(const std::string& body) {
        return !body.empty() && std::all_of(body.begin(), body.end(),
            [](unsigned char c) { return std::isdigit(c); });
    }

    PathElement parse_selector(const std::string& text, size_t offset, const std::string& body) {
        if (body.empty()) {
            throw PathParseError(text, offset, "empty selector");
        }

        if (is_index(body)) {
            return PathElement::at_index(std::stoi(body));
        }

        if (body.front() == '=') {
            return PathElement::of_value(parse_embedded(text, offset + 1, body.substr(1)));
        }

        PathElement::KeyFields fields;
        size_t pos = 0;
        while (pos <= body.size()) {
            size_t end = find_top_level(body, pos, ",");
            if (end == std::string::npos) end = body.size();
            std::string part = body.substr(pos, end - pos);

            size_t eq = part.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw PathParseError(text, offset + pos, "expected name=value in key selector");
            }
            fields.emplace_back(part.substr(0, eq),
                                parse_embedded(text, offset + pos + eq + 1, part.substr(eq + 1)));
            pos = end + 1;
        }
        return PathElement::key(std::move(fields));
    }
}

FieldPath FieldPath::parse(const std::string& text) {
    std::vector<PathElement> elements;
    if (text.empty() || text == ".") {
        return FieldPath();
    }

    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];

        if (c == '.') {
            ++pos;
            if (pos < text.size() && text[pos] == '"') {
                // Quoted name: a JSON string literal
                size_t end = pos + 1;
                while (end < text.size() && text[end] != '"') {
                    if (text[end] == '\\') ++end;
                    ++end;
                }
                if (end >= text.size()) {
                    throw PathParseError(text, pos, "unterminated quoted field name");
                }
                Value name = parse_embedded(text, pos, text.substr(pos, end - pos + 1));
                elements.push_back(PathElement::field(name.get<std::string>()));
                pos = end + 1;
            } else {
                size_t end = text.find_first_of(".[", pos);
                if (end == std::string::npos) end = text.size();
                if (end == pos) {
                    throw PathParseError(text, pos, "empty field name");
                }
                elements.push_back(PathElement::field(text.substr(pos, end - pos)));
                pos = end;
            }
            continue;
        }

        if (c == '[') {
            size_t end = find_top_level(text, pos + 1, "]");
            if (end == std::string::npos) {
                throw PathParseError(text, pos, "unterminated selector");
            }
            elements.push_back(parse_selector(text, pos + 1, text.substr(pos + 1, end - pos - 1)));
            pos = end + 1;
            continue;
        }

        throw PathParseError(text, pos, std::string("expected '.' or '[' but found '") + c + "'");
    }

    return FieldPath(std::move(elements));
}

FieldPath FieldPath::child(PathElement element) const {
    FieldPath result = *this;
    result.elements_.push_back(std::move(element));
    return result;
}

FieldPath FieldPath::parent() const {
    if (elements_.empty()) return FieldPath();
    return FieldPath(std::vector<PathElement>(elements_.begin(), elements_.end() - 1));
}

bool FieldPath::is_prefix_of(const FieldPath& other) const {
    if (elements_.size() > other.elements_.size()) return false;
    return std::equal(elements_.begin(), elements_.end(), other.elements_.begin());
}

std::string FieldPath::to_string() const {
    if (elements_.empty()) return ".";
    std::ostringstream oss;
    for (const auto& pe : elements_) {
        oss << pe.to_string();
    }
    return oss.str();
}

int FieldPath::compare(const FieldPath& other) const {
    const size_t n = std::min(elements_.size(), other.elements_.size());
    for (size_t i = 0; i < n; ++i) {
        int c = elements_[i].compare(other.elements_[i]);
        if (c != 0) return c;
    }
    if (elements_.size() == other.elements_.size()) return 0;
    return elements_.size() < other.elements_.size() ? -1 : 1;
}

std::ostream& operator<<(std::ostream& os, const FieldPath& path) {
    return os << path.to_string();
}

void to_json(Value& j, const FieldPath& path) {
    j = Value::array();
    for (const auto& pe : path) {
        j.push_back(path_element_to_json(pe));
    }
}

void from_json(const Value& j, FieldPath& path) {
    if (!j.is_array()) {
        throw PathParseError(j.dump(), 0, "field path must be an array");
    }
    std::vector<PathElement> elements;
    elements.reserve(j.size());
    for (const auto& item : j) {
        elements.push_back(path_element_from_json(item));
    }
    path = FieldPath(std::move(elements));
}

} // namespace fieldmerge
