/**
 * @file TypedValue.hpp
 * @brief A Value validated against a schema type
 *
 * TypedValue is what the merge engine works on. It exposes the three
 * operations the engine needs (compare, to_field_set, merge) plus
 * remove_paths for dropping values nobody owns any more.
 *
 * TypedValues are immutable; every operation returns a new one.
 */

#ifndef FIELDMERGE_TYPEDVALUE_HPP
#define FIELDMERGE_TYPEDVALUE_HPP

#include "fieldmerge/FieldSet.hpp"
#include "fieldmerge/Schema.hpp"
#include "fieldmerge/Value.hpp"
#include <memory>
#include <string>

namespace fieldmerge {

/**
 * @brief Field-level difference between two typed values
 */
struct Comparison {
    /// Paths present only in the right-hand value.
    FieldSet added;
    /// Leaf paths present in both with different values.
    FieldSet modified;
    /// Paths present only in the left-hand value.
    FieldSet removed;

    bool is_same() const { return added.empty() && modified.empty() && removed.empty(); }

    /// added + modified: every path whose right-hand value is new.
    FieldSet changed() const { return added.union_with(modified); }

    std::string to_string() const;
};

class TypedValue {
public:
    /**
     * @brief Validate value against the named type
     *
     * A null root stands for an empty map or list of the type.
     *
     * @throws SchemaError if type_name is unknown
     * @throws ValidationError if value does not conform
     */
    TypedValue(std::shared_ptr<const Schema> schema, std::string type_name, Value value);

    const Value& value() const noexcept { return value_; }
    const std::string& type_name() const noexcept { return type_name_; }
    const Schema& schema() const noexcept { return *schema_; }

    /**
     * @brief Every path present, containers and list items included
     *
     * Atomic containers contribute their own path only.
     */
    FieldSet to_field_set() const;

    /**
     * @brief Field-level difference from this value to rhs
     * @throws ValidationError if rhs has another type
     */
    Comparison compare(const TypedValue& rhs) const;

    /**
     * @brief Merge overrides on top of this value
     *
     * Override values win at every path they set. Maps merge by key,
     * associative lists by key (or value), granular lists by index.
     * Atomic containers and scalars are replaced. A null anywhere below
     * the root is an ordinary value and replaces what it overrides.
     *
     * @throws ValidationError if overrides has another type
     */
    TypedValue merge(const TypedValue& overrides) const;

    /// New value with the given paths (and their subtrees) deleted.
    TypedValue remove_paths(const FieldSet& paths) const;

    /// Same type and structurally equal value.
    bool operator==(const TypedValue& other) const {
        return type_name_ == other.type_name_ && value_ == other.value_;
    }
    bool operator!=(const TypedValue& other) const { return !(*this == other); }

private:
    void require_same_type(const TypedValue& other) const;

    std::shared_ptr<const Schema> schema_;
    std::string type_name_;
    Value value_;
};

} // namespace fieldmerge

#endif // FIELDMERGE_TYPEDVALUE_HPP
