/**
 * @file FieldSet.cpp
 * @brief Implementation of field set algebra
 */

#include "fieldmerge/FieldSet.hpp"
#include "fieldmerge/Errors.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace fieldmerge {

bool FieldSet::contains(const FieldPath& path) const {
    if (paths_.empty()) return false;
    if (has(FieldPath())) return true;

    std::vector<PathElement> prefix;
    prefix.reserve(path.size());
    for (const auto& pe : path) {
        prefix.push_back(pe);
        if (has(FieldPath(prefix))) return true;
    }
    return false;
}

bool FieldSet::has_descendants(const FieldPath& path) const {
    auto it = paths_.upper_bound(path);
    return it != paths_.end() && path.is_prefix_of(*it);
}

FieldSet FieldSet::union_with(const FieldSet& other) const {
    FieldSet result;
    std::set_union(paths_.begin(), paths_.end(),
                   other.paths_.begin(), other.paths_.end(),
                   std::inserter(result.paths_, result.paths_.end()));
    return result;
}

FieldSet FieldSet::intersection(const FieldSet& other) const {
    FieldSet result;
    std::set_intersection(paths_.begin(), paths_.end(),
                          other.paths_.begin(), other.paths_.end(),
                          std::inserter(result.paths_, result.paths_.end()));
    return result;
}

FieldSet FieldSet::difference(const FieldSet& other) const {
    FieldSet result;
    for (const auto& p : paths_) {
        if (!other.contains(p)) result.paths_.insert(result.paths_.end(), p);
    }
    return result;
}

FieldSet FieldSet::without(const FieldSet& other) const {
    FieldSet result;
    std::set_difference(paths_.begin(), paths_.end(),
                        other.paths_.begin(), other.paths_.end(),
                        std::inserter(result.paths_, result.paths_.end()));
    return result;
}

FieldSet FieldSet::leaves() const {
    FieldSet result;
    for (auto it = paths_.begin(); it != paths_.end(); ++it) {
        auto next = std::next(it);
        // Descendants sort directly after their ancestor
        if (next == paths_.end() || !it->is_prefix_of(*next)) {
            result.paths_.insert(result.paths_.end(), *it);
        }
    }
    return result;
}

std::string FieldSet::to_string() const {
    std::ostringstream oss;
    for (const auto& p : paths_) {
        oss << p.to_string() << '\n';
    }
    return oss.str();
}

void to_json(Value& j, const FieldSet& set) {
    j = Value::array();
    for (const auto& p : set) {
        j.push_back(Value(p));
    }
}

void from_json(const Value& j, FieldSet& set) {
    if (!j.is_array()) {
        throw PathParseError(j.dump(), 0, "field set must be an array of paths");
    }
    FieldSet result;
    for (const auto& item : j) {
        result.insert(item.get<FieldPath>());
    }
    set = std::move(result);
}

} // namespace fieldmerge
