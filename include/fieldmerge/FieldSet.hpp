/**
 * @file FieldSet.hpp
 * @brief Unordered sets of field paths
 *
 * A FieldSet holds unique paths. Iteration is in path order, which keeps
 * rendering and persistence deterministic; set semantics do not depend on
 * it. Paths sharing a prefix are adjacent in that order, so descendant
 * queries are a single lookup.
 *
 * The set operations are pure and return new sets. insert() is the only
 * mutator and is meant for building a set before it is handed out.
 */

#ifndef FIELDMERGE_FIELDSET_HPP
#define FIELDMERGE_FIELDSET_HPP

#include "fieldmerge/FieldPath.hpp"
#include <initializer_list>
#include <set>
#include <string>

namespace fieldmerge {

class FieldSet {
public:
    using const_iterator = std::set<FieldPath>::const_iterator;

    FieldSet() = default;
    FieldSet(std::initializer_list<FieldPath> paths) : paths_(paths) {}

    void insert(FieldPath path) { paths_.insert(std::move(path)); }

    /// Exact membership.
    bool has(const FieldPath& path) const { return paths_.count(path) > 0; }

    /**
     * @brief True if path or any of its ancestors is a member
     *
     * Ownership of a container covers everything beneath it.
     */
    bool contains(const FieldPath& path) const;

    /// True if some member is a strict descendant of path.
    bool has_descendants(const FieldPath& path) const;

    FieldSet union_with(const FieldSet& other) const;
    FieldSet intersection(const FieldSet& other) const;

    /**
     * @brief Members not covered by other
     *
     * A member is dropped when it or one of its ancestors is in other.
     */
    FieldSet difference(const FieldSet& other) const;

    /// Members of this set that are not members of other. Ancestors in other
    /// do not matter.
    FieldSet without(const FieldSet& other) const;

    /// Members that have no member descendants.
    FieldSet leaves() const;

    bool empty() const noexcept { return paths_.empty(); }
    size_t size() const noexcept { return paths_.size(); }
    const_iterator begin() const noexcept { return paths_.begin(); }
    const_iterator end() const noexcept { return paths_.end(); }

    /// One rendered path per line, in path order.
    std::string to_string() const;

    bool operator==(const FieldSet& other) const { return paths_ == other.paths_; }
    bool operator!=(const FieldSet& other) const { return paths_ != other.paths_; }

private:
    std::set<FieldPath> paths_;
};

/// Persisted as a JSON array of paths in path order.
void to_json(Value& j, const FieldSet& set);
void from_json(const Value& j, FieldSet& set);

} // namespace fieldmerge

#endif // FIELDMERGE_FIELDSET_HPP
