/**
 * @file TypedValue.cpp
 * @brief Schema-directed walks over values: validation, path enumeration,
 *        comparison, merge and removal
 */

#include "fieldmerge/TypedValue.hpp"
#include "fieldmerge/Errors.hpp"

#include <map>
#include <set>
#include <sstream>
#include <vector>

namespace fieldmerge {

namespace {

struct Child {
    PathElement element;
    const Value* value;
    const Atom* atom;
};

/**
 * @brief Walks a value alongside its schema atom
 *
 * children() is the single place that decides how a container's children
 * are addressed; every other operation is written in terms of it.
 */
class Walker {
public:
    explicit Walker(const Schema& schema) : schema_(schema) {}

    /**
     * @brief Addressable children of v
     *
     * Leaves (scalars, atomic containers, nulls) have none unless
     * structural is set, in which case atomic containers are walked too
     * (list items by index) so validation reaches every node.
     */
    std::vector<Child> children(const Value& v, const Atom& atom, const FieldPath& path,
                                bool structural = false) const {
        std::vector<Child> out;
        if (v.is_null() || atom.kind == Atom::Kind::Scalar) return out;
        if (atom.is_leaf() && !structural) return out;

        if (atom.kind == Atom::Kind::Map) {
            if (!v.is_object()) {
                throw ValidationError(path.to_string(), "expected map, got " + type_name(v));
            }
            for (auto it = v.begin(); it != v.end(); ++it) {
                const StructField* field = atom.map.find_field(it.key());
                const TypeRef* ref = field ? &field->type
                                           : (atom.map.element_type ? &*atom.map.element_type : nullptr);
                if (!ref) {
                    throw ValidationError(path.child(PathElement::field(it.key())).to_string(),
                                          "field not declared in schema");
                }
                out.push_back(Child{PathElement::field(it.key()), &it.value(), &schema_.resolve(*ref)});
            }
            return out;
        }

        if (!v.is_array()) {
            throw ValidationError(path.to_string(), "expected list, got " + type_name(v));
        }
        const Atom& elem = schema_.resolve(atom.list.element_type);
        const bool associative = atom.list.relationship == ElementRelationship::Associative;
        std::set<PathElement> seen;

        for (size_t i = 0; i < v.size(); ++i) {
            const Value& item = v[i];
            if (!associative) {
                out.push_back(Child{PathElement::at_index(static_cast<int>(i)), &item, &elem});
                continue;
            }

            PathElement pe = atom.list.keys.empty() ? PathElement::of_value(item)
                                                    : key_of(item, atom.list.keys, path);
            if (!seen.insert(pe).second) {
                throw ValidationError(path.child(pe).to_string(), "duplicate entry in associative list");
            }
            out.push_back(Child{std::move(pe), &item, &elem});
        }
        return out;
    }

    void validate(const Value& v, const Atom& atom, const FieldPath& path) const {
        if (v.is_null()) return;
        if (atom.kind == Atom::Kind::Scalar) {
            check_scalar(v, atom.scalar, path);
            return;
        }
        for (const auto& c : children(v, atom, path, true)) {
            validate(*c.value, *c.atom, path.child(c.element));
        }
    }

    void collect(const Value& v, const Atom& atom, const FieldPath& path, FieldSet& out) const {
        for (const auto& c : children(v, atom, path)) {
            FieldPath p = path.child(c.element);
            collect(*c.value, *c.atom, p, out);
            out.insert(std::move(p));
        }
    }

    void compare(const Value& lhs, const Value& rhs, const Atom& atom, const FieldPath& path,
                 Comparison& out) const {
        const bool lhs_walkable = !lhs.is_null() && !atom.is_leaf();
        const bool rhs_walkable = !rhs.is_null() && !atom.is_leaf();

        if (lhs_walkable && rhs_walkable) {
            std::map<PathElement, Child> left;
            for (auto& c : children(lhs, atom, path)) {
                PathElement pe = c.element;
                left.emplace(std::move(pe), std::move(c));
            }

            for (const auto& r : children(rhs, atom, path)) {
                FieldPath p = path.child(r.element);
                auto it = left.find(r.element);
                if (it == left.end()) {
                    out.added.insert(p);
                    collect(*r.value, *r.atom, p, out.added);
                    continue;
                }
                compare(*it->second.value, *r.value, *r.atom, p, out);
                left.erase(it);
            }

            for (const auto& [pe, l] : left) {
                FieldPath p = path.child(pe);
                out.removed.insert(p);
                collect(*l.value, *l.atom, p, out.removed);
            }
            return;
        }

        if (lhs == rhs) return;
        if (!path.empty()) out.modified.insert(path);
        if (lhs_walkable) collect(lhs, atom, path, out.removed);
        if (rhs_walkable) collect(rhs, atom, path, out.added);
    }

    Value merge(const Value& lhs, const Value& rhs, const Atom& atom, const FieldPath& path) const {
        if (lhs.is_null() || rhs.is_null() || atom.is_leaf()) {
            return rhs;
        }

        Value result = lhs;

        if (atom.kind == Atom::Kind::Map) {
            for (const auto& r : children(rhs, atom, path)) {
                const std::string& key = r.element.field_name();
                auto it = lhs.find(key);
                result[key] = it == lhs.end()
                    ? *r.value
                    : merge(*it, *r.value, *r.atom, path.child(r.element));
            }
            return result;
        }

        // Lists: match rhs items to lhs positions by their path element
        std::map<PathElement, size_t> positions;
        size_t i = 0;
        for (const auto& l : children(lhs, atom, path)) {
            positions.emplace(l.element, i++);
        }
        for (const auto& r : children(rhs, atom, path)) {
            auto it = positions.find(r.element);
            if (it == positions.end()) {
                result.push_back(*r.value);
                continue;
            }
            result[it->second] = merge(lhs[it->second], *r.value, *r.atom, path.child(r.element));
        }
        return result;
    }

    void remove(Value& v, const Atom& atom, const FieldPath& target, const FieldPath& path) const {
        if (path.size() >= target.size()) return;

        const PathElement& want = target[path.size()];
        const auto kids = children(v, atom, path);
        for (size_t i = 0; i < kids.size(); ++i) {
            if (kids[i].element != want) continue;

            const bool last = path.size() + 1 == target.size();
            if (v.is_object()) {
                const std::string key = want.field_name();
                if (last) v.erase(key);
                else remove(v[key], *kids[i].atom, target, path.child(want));
            } else {
                if (last) v.erase(i);
                else remove(v[i], *kids[i].atom, target, path.child(want));
            }
            return;
        }
    }

private:
    PathElement key_of(const Value& item, const std::vector<std::string>& keys,
                       const FieldPath& path) const {
        if (!item.is_object()) {
            throw ValidationError(path.to_string(),
                                  "keyed list items must be maps, got " + type_name(item));
        }
        PathElement::KeyFields fields;
        for (const auto& k : keys) {
            auto it = item.find(k);
            if (it == item.end()) {
                throw ValidationError(path.to_string(), "list item is missing key field '" + k + "'");
            }
            fields.emplace_back(k, *it);
        }
        return PathElement::key(std::move(fields));
    }

    static void check_scalar(const Value& v, ScalarKind kind, const FieldPath& path) {
        bool ok = true;
        switch (kind) {
            case ScalarKind::Numeric: ok = v.is_number(); break;
            case ScalarKind::String: ok = v.is_string(); break;
            case ScalarKind::Boolean: ok = v.is_boolean(); break;
            case ScalarKind::Untyped: ok = true; break;
        }
        if (!ok) {
            throw ValidationError(path.to_string(),
                                  "expected " + to_string(kind) + ", got " + type_name(v));
        }
    }

    const Schema& schema_;
};

} // anonymous namespace

std::string Comparison::to_string() const {
    std::ostringstream oss;
    oss << "- Added Fields:\n" << added.to_string()
        << "- Modified Fields:\n" << modified.to_string()
        << "- Removed Fields:\n" << removed.to_string();
    return oss.str();
}

TypedValue::TypedValue(std::shared_ptr<const Schema> schema, std::string type_name, Value value)
    : schema_(std::move(schema))
    , type_name_(std::move(type_name))
    , value_(std::move(value))
{
    const Atom& atom = schema_->type(type_name_);
    if (value_.is_null()) {
        if (atom.kind == Atom::Kind::Map) value_ = Value::object();
        else if (atom.kind == Atom::Kind::List) value_ = Value::array();
    }
    Walker(*schema_).validate(value_, atom, FieldPath());
}

FieldSet TypedValue::to_field_set() const {
    FieldSet out;
    Walker(*schema_).collect(value_, schema_->type(type_name_), FieldPath(), out);
    return out;
}

Comparison TypedValue::compare(const TypedValue& rhs) const {
    require_same_type(rhs);
    Comparison out;
    Walker(*schema_).compare(value_, rhs.value_, schema_->type(type_name_), FieldPath(), out);
    return out;
}

TypedValue TypedValue::merge(const TypedValue& overrides) const {
    require_same_type(overrides);
    Value merged = Walker(*schema_).merge(value_, overrides.value_,
                                          schema_->type(type_name_), FieldPath());
    return TypedValue(schema_, type_name_, std::move(merged));
}

TypedValue TypedValue::remove_paths(const FieldSet& paths) const {
    Value result = value_;
    Walker walker(*schema_);
    const Atom& atom = schema_->type(type_name_);

    // Outermost paths only; descendants go with them and a keyed item
    // must keep its key fields until it is located.
    std::vector<FieldPath> ordered;
    for (const auto& p : paths) {
        if (!ordered.empty() && ordered.back().is_prefix_of(p)) continue;
        ordered.push_back(p);
    }

    // Higher list indexes first
    for (auto it = ordered.rbegin(); it != ordered.rend(); ++it) {
        if (it->empty()) {
            result = atom.kind == Atom::Kind::List ? Value::array() : Value::object();
            continue;
        }
        walker.remove(result, atom, *it, FieldPath());
    }
    return TypedValue(schema_, type_name_, std::move(result));
}

void TypedValue::require_same_type(const TypedValue& other) const {
    if (type_name_ != other.type_name_) {
        throw ValidationError("", "cannot combine values of type '" + type_name_ +
                                  "' and '" + other.type_name_ + "'");
    }
}

} // namespace fieldmerge
