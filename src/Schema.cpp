/**
 * @file Schema.cpp
 * @brief Schema document parsing and type resolution
 */

#include "fieldmerge/Schema.hpp"
#include "fieldmerge/Errors.hpp"
#include "fieldmerge/Loader.hpp"

#include <set>

namespace fieldmerge {

namespace {

TypeRef parse_type_ref(const Value& j, const std::string& where);
Atom parse_atom(const Value& j, const std::string& where);

ScalarKind parse_scalar(const Value& j, const std::string& where) {
    if (!j.is_string()) {
        throw SchemaError(where + ": scalar must be a string");
    }
    const auto s = j.get<std::string>();
    if (s == "numeric") return ScalarKind::Numeric;
    if (s == "string") return ScalarKind::String;
    if (s == "boolean") return ScalarKind::Boolean;
    if (s == "untyped") return ScalarKind::Untyped;
    throw SchemaError(where + ": unknown scalar '" + s + "'");
}

ElementRelationship parse_relationship(const Value& j, const std::string& where,
                                       ElementRelationship fallback) {
    if (j.is_null()) return fallback;
    if (!j.is_string()) {
        throw SchemaError(where + ": elementRelationship must be a string");
    }
    const auto s = j.get<std::string>();
    if (s == "separable") return ElementRelationship::Separable;
    if (s == "associative") return ElementRelationship::Associative;
    if (s == "atomic") return ElementRelationship::Atomic;
    throw SchemaError(where + ": unknown elementRelationship '" + s + "'");
}

MapType parse_map(const Value& j, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(where + ": map must be an object");
    }

    MapType m;
    if (j.contains("fields")) {
        const auto& fields = j["fields"];
        if (!fields.is_array()) {
            throw SchemaError(where + ": fields must be an array");
        }
        std::set<std::string> seen;
        for (const auto& f : fields) {
            if (!f.is_object() || !f.contains("name") || !f["name"].is_string()) {
                throw SchemaError(where + ": every field needs a string 'name'");
            }
            StructField sf;
            sf.name = f["name"].get<std::string>();
            if (!seen.insert(sf.name).second) {
                throw SchemaError(where + ": duplicate field '" + sf.name + "'");
            }
            if (!f.contains("type")) {
                throw SchemaError(where + "." + sf.name + ": missing 'type'");
            }
            sf.type = parse_type_ref(f["type"], where + "." + sf.name);
            m.fields.push_back(std::move(sf));
        }
    }
    if (j.contains("elementType")) {
        m.element_type = parse_type_ref(j["elementType"], where + ".*");
    }
    m.relationship = parse_relationship(j.value("elementRelationship", Value()), where,
                                        ElementRelationship::Separable);
    if (m.relationship == ElementRelationship::Associative) {
        throw SchemaError(where + ": maps cannot be associative");
    }
    return m;
}

ListType parse_list(const Value& j, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(where + ": list must be an object");
    }
    if (!j.contains("elementType")) {
        throw SchemaError(where + ": list needs an 'elementType'");
    }

    ListType l;
    l.element_type = parse_type_ref(j["elementType"], where + "[]");
    l.relationship = parse_relationship(j.value("elementRelationship", Value()), where,
                                        ElementRelationship::Atomic);
    if (j.contains("keys")) {
        const auto& keys = j["keys"];
        if (!keys.is_array()) {
            throw SchemaError(where + ": keys must be an array");
        }
        for (const auto& k : keys) {
            if (!k.is_string()) {
                throw SchemaError(where + ": keys must be strings");
            }
            l.keys.push_back(k.get<std::string>());
        }
    }
    if (!l.keys.empty() && l.relationship != ElementRelationship::Associative) {
        throw SchemaError(where + ": keys require elementRelationship 'associative'");
    }
    return l;
}

Atom parse_atom(const Value& j, const std::string& where) {
    Atom atom;
    int kinds = 0;
    if (j.contains("scalar")) {
        atom.kind = Atom::Kind::Scalar;
        atom.scalar = parse_scalar(j["scalar"], where);
        ++kinds;
    }
    if (j.contains("map")) {
        atom.kind = Atom::Kind::Map;
        atom.map = parse_map(j["map"], where);
        ++kinds;
    }
    if (j.contains("list")) {
        atom.kind = Atom::Kind::List;
        atom.list = parse_list(j["list"], where);
        ++kinds;
    }
    if (kinds != 1) {
        throw SchemaError(where + ": expected exactly one of scalar, map, list");
    }
    return atom;
}

TypeRef parse_type_ref(const Value& j, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(where + ": type must be an object");
    }
    TypeRef ref;
    if (j.contains("namedType")) {
        if (!j["namedType"].is_string()) {
            throw SchemaError(where + ": namedType must be a string");
        }
        ref.named_type = j["namedType"].get<std::string>();
        return ref;
    }
    ref.inlined = std::make_shared<const Atom>(parse_atom(j, where));
    return ref;
}

/**
 * @brief Walks every reference reachable from an atom and checks that
 *        named types exist and associative keys name real fields
 */
class ReferenceChecker {
public:
    explicit ReferenceChecker(const Schema& schema) : schema_(schema) {}

    void check(const Atom& atom, const std::string& where) {
        switch (atom.kind) {
            case Atom::Kind::Scalar:
                return;
            case Atom::Kind::Map:
                for (const auto& f : atom.map.fields) {
                    check_ref(f.type, where + "." + f.name);
                }
                if (atom.map.element_type) {
                    check_ref(*atom.map.element_type, where + ".*");
                }
                return;
            case Atom::Kind::List: {
                check_ref(atom.list.element_type, where + "[]");
                if (!atom.list.keys.empty()) {
                    const Atom& elem = schema_.resolve(atom.list.element_type);
                    if (elem.kind != Atom::Kind::Map) {
                        throw SchemaError(where + ": keyed list elements must be maps");
                    }
                    for (const auto& k : atom.list.keys) {
                        if (!elem.map.find_field(k)) {
                            throw SchemaError(where + ": key '" + k + "' is not a field of the element type");
                        }
                    }
                }
                return;
            }
        }
    }

private:
    void check_ref(const TypeRef& ref, const std::string& where) {
        if (!ref.named_type.empty()) {
            if (!schema_.has_type(ref.named_type)) {
                throw SchemaError(where + ": unknown namedType '" + ref.named_type + "'");
            }
            // Named types are checked once at top level
            return;
        }
        if (ref.inlined) check(*ref.inlined, where);
    }

    const Schema& schema_;
};

} // anonymous namespace

const StructField* MapType::find_field(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

Schema Schema::from_json(const Value& doc) {
    if (!doc.is_object() || !doc.contains("types") || !doc["types"].is_array()) {
        throw SchemaError("document must be an object with a 'types' array");
    }

    Schema schema;
    for (const auto& t : doc["types"]) {
        if (!t.is_object() || !t.contains("name") || !t["name"].is_string()) {
            throw SchemaError("every type needs a string 'name'");
        }
        const auto name = t["name"].get<std::string>();
        if (schema.has_type(name)) {
            throw SchemaError("duplicate type '" + name + "'");
        }
        schema.types_.emplace(name, parse_atom(t, name));
    }

    ReferenceChecker checker(schema);
    for (const auto& [name, atom] : schema.types_) {
        checker.check(atom, name);
    }
    return schema;
}

const Atom& Schema::type(const std::string& name) const {
    auto it = types_.find(name);
    if (it == types_.end()) {
        throw SchemaError("unknown type '" + name + "'");
    }
    return it->second;
}

const Atom& Schema::resolve(const TypeRef& ref) const {
    if (!ref.named_type.empty()) return type(ref.named_type);
    if (!ref.inlined) {
        throw SchemaError("empty type reference");
    }
    return *ref.inlined;
}

std::vector<std::string> Schema::type_names() const {
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& [name, atom] : types_) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<const Schema> load_schema_file(const std::string& path) {
    Value doc = load_config_file(path);
    return std::make_shared<const Schema>(Schema::from_json(doc));
}

std::string to_string(ScalarKind kind) {
    switch (kind) {
        case ScalarKind::Numeric: return "numeric";
        case ScalarKind::String: return "string";
        case ScalarKind::Boolean: return "boolean";
        case ScalarKind::Untyped: return "untyped";
    }
    return "unknown";
}

std::string to_string(ElementRelationship relationship) {
    switch (relationship) {
        case ElementRelationship::Separable: return "separable";
        case ElementRelationship::Associative: return "associative";
        case ElementRelationship::Atomic: return "atomic";
    }
    return "unknown";
}

} // namespace fieldmerge
