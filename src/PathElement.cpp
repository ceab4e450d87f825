/**
 * @file PathElement.cpp
 * @brief Implementation of path elements
 */

#include "fieldmerge/PathElement.hpp"
#include "fieldmerge/Errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace fieldmerge {

namespace {
    /**
     * @brief Three-way comparison of two values using Value's total order
     */
    int compare_values(const Value& a, const Value& b) {
        if (a < b) return -1;
        if (b < a) return 1;
        return 0;
    }

    /**
     * @brief True if a field name can be written bare in path text
     */
    bool is_plain_name(const std::string& name) {
        if (name.empty()) return false;
        return name.find_first_of(".[]\"=,") == std::string::npos;
    }
}

PathElement PathElement::field(std::string name) {
    return PathElement(Data(std::in_place_index<0>, std::move(name)));
}

PathElement PathElement::key(KeyFields fields) {
    std::sort(fields.begin(), fields.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return PathElement(Data(std::in_place_index<1>, std::move(fields)));
}

PathElement PathElement::of_value(fieldmerge::Value v) {
    return PathElement(Data(std::in_place_index<2>, std::move(v)));
}

PathElement PathElement::at_index(int i) {
    return PathElement(Data(std::in_place_index<3>, i));
}

const std::string& PathElement::field_name() const {
    if (kind() != Kind::FieldName) throw std::logic_error("path element is not a field name");
    return std::get<0>(data_);
}

const PathElement::KeyFields& PathElement::key_fields() const {
    if (kind() != Kind::Key) throw std::logic_error("path element is not a key");
    return std::get<1>(data_);
}

const fieldmerge::Value& PathElement::value() const {
    if (kind() != Kind::Value) throw std::logic_error("path element is not a value");
    return std::get<2>(data_);
}

int PathElement::index() const {
    if (kind() != Kind::Index) throw std::logic_error("path element is not an index");
    return std::get<3>(data_);
}

std::string PathElement::to_string() const {
    std::ostringstream oss;
    switch (kind()) {
        case Kind::FieldName: {
            const auto& name = std::get<0>(data_);
            oss << '.';
            if (is_plain_name(name)) oss << name;
            else oss << fieldmerge::Value(name).dump();
            break;
        }
        case Kind::Key: {
            oss << '[';
            const auto& fields = std::get<1>(data_);
            for (size_t i = 0; i < fields.size(); ++i) {
                if (i > 0) oss << ',';
                oss << fields[i].first << '=' << fields[i].second.dump();
            }
            oss << ']';
            break;
        }
        case Kind::Value:
            oss << "[=" << std::get<2>(data_).dump() << ']';
            break;
        case Kind::Index:
            oss << '[' << std::get<3>(data_) << ']';
            break;
    }
    return oss.str();
}

int PathElement::compare(const PathElement& other) const {
    if (data_.index() != other.data_.index()) {
        return data_.index() < other.data_.index() ? -1 : 1;
    }

    switch (kind()) {
        case Kind::FieldName:
            return std::get<0>(data_).compare(std::get<0>(other.data_));

        case Kind::Key: {
            const auto& a = std::get<1>(data_);
            const auto& b = std::get<1>(other.data_);
            for (size_t i = 0; i < a.size() && i < b.size(); ++i) {
                int c = a[i].first.compare(b[i].first);
                if (c != 0) return c;
                c = compare_values(a[i].second, b[i].second);
                if (c != 0) return c;
            }
            if (a.size() == b.size()) return 0;
            return a.size() < b.size() ? -1 : 1;
        }

        case Kind::Value:
            return compare_values(std::get<2>(data_), std::get<2>(other.data_));

        case Kind::Index: {
            int a = std::get<3>(data_);
            int b = std::get<3>(other.data_);
            if (a == b) return 0;
            return a < b ? -1 : 1;
        }
    }
    return 0;
}

// ============================================================================
// Persistence
// ============================================================================

Value path_element_to_json(const PathElement& pe) {
    switch (pe.kind()) {
        case PathElement::Kind::FieldName:
            return Value{{"f", pe.field_name()}};

        case PathElement::Kind::Key: {
            Value fields = Value::object();
            for (const auto& [name, v] : pe.key_fields()) {
                fields[name] = v;
            }
            return Value{{"k", fields}};
        }

        case PathElement::Kind::Value:
            return Value{{"v", pe.value()}};

        case PathElement::Kind::Index:
            return Value{{"i", pe.index()}};
    }
    return Value();
}

PathElement path_element_from_json(const Value& j) {
    if (!j.is_object() || j.size() != 1) {
        throw PathParseError(j.dump(), 0, "expected an object with exactly one of f, k, v, i");
    }

    auto it = j.begin();
    const std::string& tag = it.key();
    const Value& payload = it.value();

    if (tag == "f") {
        if (!payload.is_string()) {
            throw PathParseError(j.dump(), 0, "field name must be a string");
        }
        return PathElement::field(payload.get<std::string>());
    }
    if (tag == "k") {
        if (!payload.is_object() || payload.empty()) {
            throw PathParseError(j.dump(), 0, "key must be a non-empty object");
        }
        PathElement::KeyFields fields;
        for (auto kit = payload.begin(); kit != payload.end(); ++kit) {
            fields.emplace_back(kit.key(), kit.value());
        }
        return PathElement::key(std::move(fields));
    }
    if (tag == "v") {
        return PathElement::of_value(payload);
    }
    if (tag == "i") {
        if (!payload.is_number_integer()) {
            throw PathParseError(j.dump(), 0, "index must be an integer");
        }
        return PathElement::at_index(payload.get<int>());
    }

    throw PathParseError(j.dump(), 0, "unknown path element tag '" + tag + "'");
}

} // namespace fieldmerge
