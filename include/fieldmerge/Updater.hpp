/**
 * @file Updater.hpp
 * @brief The merge engine: update, apply and force-apply
 *
 * Each operation is a pure function of its arguments:
 *
 *   (live object, live managed fields, incoming object, manager, version)
 *       -> (merged object, new managed fields)
 *
 * Inputs are never modified. Apply throws ConflictError when another
 * manager owns a field the apply would change or delete; nothing is
 * returned in that case and the caller must not persist anything.
 *
 * Ownership rules:
 * - update: the manager's set becomes exactly the paths whose value it
 *   changed, replacing what it owned before; those paths are removed from
 *   every other manager.
 * - apply: the manager's set becomes exactly the paths of the incoming
 *   object. Other managers are untouched, so any overlap with a changed
 *   value is a conflict.
 * - force-apply: as apply, with the conflicting paths taken away from
 *   their previous owners.
 * In all cases managers left with an empty set are dropped.
 */

#ifndef FIELDMERGE_UPDATER_HPP
#define FIELDMERGE_UPDATER_HPP

#include "fieldmerge/Conflict.hpp"
#include "fieldmerge/ManagedFields.hpp"
#include "fieldmerge/TypedValue.hpp"
#include <string>

namespace fieldmerge {

class Config;

enum class Operation {
    Update,
    Apply,
    ForceApply
};

std::string to_string(Operation op);

/**
 * @brief Engine settings
 */
struct UpdaterOptions {
    /**
     * When an apply stops declaring a path it owned, delete that path from
     * the merged object unless some manager still owns it or something
     * beneath it. Off by default: withdrawing ownership keeps the value.
     */
    bool prune_dangling = false;

    /**
     * @brief Read options from configuration
     *
     * Keys: merge.prune_dangling (bool)
     */
    static UpdaterOptions from_config(const Config& cfg);
};

/**
 * @brief Outcome of a successful operation
 */
struct MergeResult {
    TypedValue object;
    ManagedFields managed;
    /// Paths whose value differs between the live and merged object.
    FieldSet changed;
    /// Paths deleted from the object because no manager owns them any more.
    FieldSet pruned;
};

class Updater {
public:
    Updater() = default;
    explicit Updater(UpdaterOptions options) : options_(options) {}

    const UpdaterOptions& options() const noexcept { return options_; }

    /**
     * @brief Unconditional write
     *
     * The merged object is live with incoming's values laid over it.
     * Never fails on ownership.
     */
    MergeResult update(const TypedValue& live, const ManagedFields& managed,
                       const TypedValue& incoming, const std::string& manager,
                       const std::string& api_version) const;

    /**
     * @brief Conflict-checked declaration of intent
     *
     * @param force Take conflicting fields instead of failing
     * @throws ConflictError if force is false and other managers own
     *         fields whose value would change or be deleted
     */
    MergeResult apply(const TypedValue& live, const ManagedFields& managed,
                      const TypedValue& config, const std::string& manager,
                      const std::string& api_version, bool force = false) const;

    MergeResult force_apply(const TypedValue& live, const ManagedFields& managed,
                            const TypedValue& config, const std::string& manager,
                            const std::string& api_version) const {
        return apply(live, managed, config, manager, api_version, true);
    }

    /// Dispatch on op.
    MergeResult run(Operation op, const TypedValue& live, const ManagedFields& managed,
                    const TypedValue& incoming, const std::string& manager,
                    const std::string& api_version) const;

private:
    FieldSet dangling(const FieldSet& withdrawn, const ManagedFields& managed) const;

    UpdaterOptions options_;
};

} // namespace fieldmerge

#endif // FIELDMERGE_UPDATER_HPP
