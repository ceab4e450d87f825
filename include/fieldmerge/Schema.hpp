/**
 * @file Schema.hpp
 * @brief Type descriptions for typed values
 *
 * A Schema is a set of named types. Each type is an Atom: a scalar, a map
 * or a list. Maps and lists carry an element relationship that decides
 * how their children are addressed and merged:
 *
 * - separable:   children are owned and merged one by one
 *                (map fields by name, list items by index)
 * - associative: list items are identified by key fields, or by their
 *                own value when the list has no keys (a set)
 * - atomic:      the container is owned and replaced as a whole
 *
 * Schema document (JSON, or TOML with the same shape):
 * ```json
 * {"types": [
 *   {"name": "leafFields",
 *    "map": {"fields": [
 *      {"name": "numeric", "type": {"scalar": "numeric"}},
 *      {"name": "string",  "type": {"scalar": "string"}},
 *      {"name": "bool",    "type": {"scalar": "boolean"}}]}}
 * ]}
 * ```
 * A type reference is {"namedType": "..."} or an inline
 * {"scalar": ...} / {"map": {...}} / {"list": {...}}.
 */

#ifndef FIELDMERGE_SCHEMA_HPP
#define FIELDMERGE_SCHEMA_HPP

#include "fieldmerge/Value.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fieldmerge {

enum class ScalarKind {
    Numeric,
    String,
    Boolean,
    Untyped
};

enum class ElementRelationship {
    Separable,
    Associative,
    Atomic
};

struct Atom;

/**
 * @brief Reference to a type: by name, or an inline atom
 */
struct TypeRef {
    std::string named_type;
    std::shared_ptr<const Atom> inlined;
};

struct StructField {
    std::string name;
    TypeRef type;
};

struct MapType {
    std::vector<StructField> fields;
    /// Type of keys not listed in fields; unset means unknown keys are invalid.
    std::optional<TypeRef> element_type;
    ElementRelationship relationship = ElementRelationship::Separable;

    const StructField* find_field(const std::string& name) const;
};

struct ListType {
    TypeRef element_type;
    ElementRelationship relationship = ElementRelationship::Atomic;
    /// Key field names for associative lists of maps.
    std::vector<std::string> keys;
};

struct Atom {
    enum class Kind { Scalar, Map, List };

    Kind kind = Kind::Scalar;
    ScalarKind scalar = ScalarKind::Untyped;
    MapType map;
    ListType list;

    /// True for scalars and atomic containers: owned as a single leaf.
    bool is_leaf() const {
        if (kind == Kind::Scalar) return true;
        if (kind == Kind::Map) return map.relationship == ElementRelationship::Atomic;
        return list.relationship == ElementRelationship::Atomic;
    }
};

class Schema {
public:
    Schema() = default;

    /**
     * @brief Build a schema from its document form
     * @throws SchemaError on malformed documents or unresolved namedType
     */
    static Schema from_json(const Value& doc);

    bool has_type(const std::string& name) const { return types_.count(name) > 0; }

    /// @throws SchemaError if the name is unknown
    const Atom& type(const std::string& name) const;

    /// @throws SchemaError if a named reference is unknown
    const Atom& resolve(const TypeRef& ref) const;

    std::vector<std::string> type_names() const;

private:
    std::map<std::string, Atom> types_;
};

/**
 * @brief Load a schema document from a .json or .toml file
 * @throws FileNotFoundError, ParseError, SchemaError
 */
std::shared_ptr<const Schema> load_schema_file(const std::string& path);

std::string to_string(ScalarKind kind);
std::string to_string(ElementRelationship relationship);

} // namespace fieldmerge

#endif // FIELDMERGE_SCHEMA_HPP
