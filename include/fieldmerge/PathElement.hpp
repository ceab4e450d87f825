/**
 * @file PathElement.hpp
 * @brief One step into a typed tree
 *
 * A PathElement is a closed tagged variant:
 * - FieldName: a map field or map key (".spec")
 * - Key: an associative list item selected by its key fields ("[name=\"a\"]")
 * - Value: a set-like list item selected by value equality ("[=5]")
 * - Index: a positional item of a granular list ("[3]")
 *
 * Elements are immutable, compared structurally and totally ordered
 * (kind first, then payload) so that field sets serialize deterministically.
 */

#ifndef FIELDMERGE_PATHELEMENT_HPP
#define FIELDMERGE_PATHELEMENT_HPP

#include "fieldmerge/Value.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fieldmerge {

class PathElement {
public:
    enum class Kind {
        FieldName = 0,
        Key = 1,
        Value = 2,
        Index = 3
    };

    /// Key field (name, value) pairs, kept sorted by name.
    using KeyFields = std::vector<std::pair<std::string, fieldmerge::Value>>;

    static PathElement field(std::string name);
    static PathElement key(KeyFields fields);
    static PathElement of_value(fieldmerge::Value v);
    static PathElement at_index(int i);

    Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

    /// @throws std::logic_error if the element is of another kind
    const std::string& field_name() const;
    const KeyFields& key_fields() const;
    const fieldmerge::Value& value() const;
    int index() const;

    /**
     * @brief Render as path text
     *
     * FieldName renders with its leading dot; names that would not parse
     * back (empty, or containing '.', '[', ']' or '"') are JSON-quoted.
     */
    std::string to_string() const;

    /// Three-way comparison: negative, zero or positive.
    int compare(const PathElement& other) const;

    bool operator==(const PathElement& other) const { return compare(other) == 0; }
    bool operator!=(const PathElement& other) const { return compare(other) != 0; }
    bool operator<(const PathElement& other) const { return compare(other) < 0; }

private:
    using Data = std::variant<std::string, KeyFields, fieldmerge::Value, int>;

    explicit PathElement(Data data) : data_(std::move(data)) {}

    Data data_;
};

/**
 * @brief Persisted form of a path element
 *
 * {"f": name} | {"k": {field: value, ...}} | {"v": value} | {"i": n}
 */
Value path_element_to_json(const PathElement& pe);

/// @throws PathParseError if the JSON is not one of the persisted forms
PathElement path_element_from_json(const Value& j);

} // namespace fieldmerge

namespace nlohmann {

// PathElement has no default state, so it is converted through a
// serializer specialization instead of ADL to_json/from_json.
template <>
struct adl_serializer<fieldmerge::PathElement> {
    static fieldmerge::PathElement from_json(const json& j) {
        return fieldmerge::path_element_from_json(j);
    }
    static void to_json(json& j, const fieldmerge::PathElement& pe) {
        j = fieldmerge::path_element_to_json(pe);
    }
};

} // namespace nlohmann

#endif // FIELDMERGE_PATHELEMENT_HPP
