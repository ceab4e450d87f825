/**
 * @file ManagedFields.hpp
 * @brief Per-manager field ownership
 *
 * A VersionedSet is the field set one manager owns, stamped with the
 * schema version it was computed against and whether it came from an
 * apply. ManagedFields maps manager names to their VersionedSet.
 *
 * ManagedFields is a copy-on-write snapshot: set() and remove() return a
 * new snapshot and leave the receiver untouched, so a caller that keeps an
 * old snapshot never observes later changes. Unchanged snapshots share
 * their storage.
 */

#ifndef FIELDMERGE_MANAGEDFIELDS_HPP
#define FIELDMERGE_MANAGEDFIELDS_HPP

#include "fieldmerge/FieldSet.hpp"
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace fieldmerge {

/**
 * @brief Fields one manager owns as of a schema version
 */
struct VersionedSet {
    FieldSet fields;
    std::string api_version;
    /// True if produced by apply / force-apply, false for update.
    bool applied = false;

    bool operator==(const VersionedSet& other) const {
        return fields == other.fields && api_version == other.api_version &&
               applied == other.applied;
    }
    bool operator!=(const VersionedSet& other) const { return !(*this == other); }
};

/**
 * @brief Build a VersionedSet
 *
 * Accepts any set, including the empty one.
 */
inline VersionedSet make_versioned_set(FieldSet fields, std::string api_version, bool applied) {
    return VersionedSet{std::move(fields), std::move(api_version), applied};
}

class ManagedFields {
public:
    using Map = std::map<std::string, VersionedSet>;
    using const_iterator = Map::const_iterator;

    ManagedFields();

    /// Entries with empty field sets are dropped.
    ManagedFields(std::initializer_list<Map::value_type> entries);

    /// The manager's entry, or nullptr if it has none.
    const VersionedSet* find(const std::string& manager) const;

    bool has(const std::string& manager) const { return find(manager) != nullptr; }

    /**
     * @brief Snapshot with the manager's entry replaced
     *
     * An empty field set removes the entry instead of storing it.
     */
    ManagedFields set(const std::string& manager, VersionedSet versioned) const;

    /// Snapshot without the manager's entry.
    ManagedFields remove(const std::string& manager) const;

    /**
     * @brief Snapshot with paths removed from every manager except one
     *
     * Only exact members are removed. Managers left with nothing are dropped.
     */
    ManagedFields strip(const FieldSet& paths, const std::string& except) const;

    /// Managers whose field set contains path (exactly or by an ancestor).
    std::vector<std::string> owners(const FieldPath& path) const;

    bool empty() const noexcept { return entries_->empty(); }
    size_t size() const noexcept { return entries_->size(); }
    const_iterator begin() const noexcept { return entries_->begin(); }
    const_iterator end() const noexcept { return entries_->end(); }

    /// True if both snapshots share the same storage.
    bool shares_storage_with(const ManagedFields& other) const noexcept {
        return entries_ == other.entries_;
    }

    bool operator==(const ManagedFields& other) const {
        return entries_ == other.entries_ || *entries_ == *other.entries_;
    }
    bool operator!=(const ManagedFields& other) const { return !(*this == other); }

private:
    friend void from_json(const Value& j, ManagedFields& managed);

    explicit ManagedFields(std::shared_ptr<const Map> entries) : entries_(std::move(entries)) {}

    std::shared_ptr<const Map> entries_;
};

/**
 * @brief Persisted layout
 *
 * ```json
 * {
 *   "controller": {"apiVersion": "v1", "applied": false, "fields": [[{"f": "bool"}]]}
 * }
 * ```
 */
void to_json(Value& j, const VersionedSet& versioned);
void from_json(const Value& j, VersionedSet& versioned);
void to_json(Value& j, const ManagedFields& managed);
void from_json(const Value& j, ManagedFields& managed);

} // namespace fieldmerge

#endif // FIELDMERGE_MANAGEDFIELDS_HPP
