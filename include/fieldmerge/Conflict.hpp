/**
 * @file Conflict.hpp
 * @brief Ownership conflicts between managers
 */

#ifndef FIELDMERGE_CONFLICT_HPP
#define FIELDMERGE_CONFLICT_HPP

#include "fieldmerge/Errors.hpp"
#include "fieldmerge/FieldPath.hpp"
#include "fieldmerge/FieldSet.hpp"
#include "fieldmerge/ManagedFields.hpp"
#include <string>
#include <vector>

namespace fieldmerge {

/**
 * @brief A path the acting manager tried to change while another manager
 *        owns it
 */
struct Conflict {
    std::string manager;
    FieldPath path;

    bool operator==(const Conflict& other) const {
        return manager == other.manager && path == other.path;
    }
    bool operator!=(const Conflict& other) const { return !(*this == other); }
    bool operator<(const Conflict& other) const {
        if (manager != other.manager) return manager < other.manager;
        return path < other.path;
    }
};

/// Ordered by manager, then path.
using Conflicts = std::vector<Conflict>;

/**
 * @brief Find every (manager, path) where another manager owns a changed path
 *
 * @param changed Paths whose value the operation changes
 * @param managed Current ownership table
 * @param manager The acting manager; its own entry never conflicts
 * @return Conflicts ordered by manager, then path
 */
Conflicts detect_conflicts(const FieldSet& changed, const ManagedFields& managed,
                           const std::string& manager);

/**
 * @brief Human-readable listing, grouped by manager
 *
 * ```
 * conflict with "controller": .string
 * conflicts with "other":
 * - .a
 * - .b
 * ```
 */
std::string format_conflicts(const Conflicts& conflicts);

/**
 * @brief Apply refused because other managers own fields it would change
 *
 * Resolve and retry the apply, or retry as a force-apply.
 */
class ConflictError : public Error {
public:
    explicit ConflictError(Conflicts conflicts)
        : Error(format_conflicts(conflicts))
        , conflicts_(std::move(conflicts))
    {}

    const Conflicts& conflicts() const noexcept {
        return conflicts_;
    }

private:
    Conflicts conflicts_;
};

} // namespace fieldmerge

#endif // FIELDMERGE_CONFLICT_HPP
