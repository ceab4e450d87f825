/**
 * @file Conflict.cpp
 * @brief Conflict detection
 */

#include "fieldmerge/Conflict.hpp"

#include <sstream>

namespace fieldmerge {

Conflicts detect_conflicts(const FieldSet& changed, const ManagedFields& managed,
                           const std::string& manager) {
    Conflicts out;
    if (changed.empty()) return out;

    // ManagedFields iterates by manager name and sets by path, so the
    // result is already in (manager, path) order.
    for (const auto& [other, versioned] : managed) {
        if (other == manager) continue;
        for (const auto& path : versioned.fields.intersection(changed)) {
            out.push_back(Conflict{other, path});
        }
    }
    return out;
}

std::string format_conflicts(const Conflicts& conflicts) {
    std::ostringstream oss;
    size_t i = 0;
    while (i < conflicts.size()) {
        size_t j = i;
        while (j < conflicts.size() && conflicts[j].manager == conflicts[i].manager) ++j;

        if (i > 0) oss << '\n';
        if (j - i == 1) {
            oss << "conflict with \"" << conflicts[i].manager << "\": " << conflicts[i].path;
        } else {
            oss << "conflicts with \"" << conflicts[i].manager << "\":";
            for (size_t k = i; k < j; ++k) {
                oss << "\n- " << conflicts[k].path;
            }
        }
        i = j;
    }
    return oss.str();
}

} // namespace fieldmerge
