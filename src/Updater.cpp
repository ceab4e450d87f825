/**
 * @file Updater.cpp
 * @brief Implementation of the merge engine
 */

#include "fieldmerge/Updater.hpp"
#include "fieldmerge/Config.hpp"

namespace fieldmerge {

std::string to_string(Operation op) {
    switch (op) {
        case Operation::Update: return "update";
        case Operation::Apply: return "apply";
        case Operation::ForceApply: return "force-apply";
    }
    return "unknown";
}

UpdaterOptions UpdaterOptions::from_config(const Config& cfg) {
    UpdaterOptions opts;
    opts.prune_dangling = cfg.get<bool>("merge.prune_dangling", opts.prune_dangling);
    return opts;
}

MergeResult Updater::update(const TypedValue& live, const ManagedFields& managed,
                            const TypedValue& incoming, const std::string& manager,
                            const std::string& api_version) const {
    TypedValue merged = live.merge(incoming);
    Comparison cmp = live.compare(merged);
    FieldSet touched = cmp.changed();

    // An update takes what it touched away from everyone else
    ManagedFields result = managed.strip(touched.union_with(cmp.removed), manager);

    // The new set replaces the updater's prior entry
    result = result.set(manager, make_versioned_set(touched, api_version, false));

    return MergeResult{std::move(merged), std::move(result), std::move(touched), FieldSet()};
}

MergeResult Updater::apply(const TypedValue& live, const ManagedFields& managed,
                           const TypedValue& config, const std::string& manager,
                           const std::string& api_version, bool force) const {
    TypedValue merged = live.merge(config);
    Comparison cmp = live.compare(merged);
    FieldSet changed = cmp.changed();

    // Deleting a value someone else owns is as much a conflict as changing it
    const FieldSet affected = changed.union_with(cmp.removed);

    ManagedFields result = managed;
    if (force) {
        result = managed.strip(affected, manager);
    } else {
        Conflicts conflicts = detect_conflicts(affected, managed, manager);
        if (!conflicts.empty()) {
            throw ConflictError(std::move(conflicts));
        }
    }

    FieldSet declared = config.to_field_set();
    FieldSet withdrawn;
    if (const VersionedSet* prior = managed.find(manager)) {
        withdrawn = prior->fields.without(declared);
    }
    result = result.set(manager, make_versioned_set(std::move(declared), api_version, true));

    FieldSet pruned;
    if (options_.prune_dangling && !withdrawn.empty()) {
        pruned = dangling(withdrawn, result);
        if (!pruned.empty()) {
            merged = merged.remove_paths(pruned);
        }
    }

    return MergeResult{std::move(merged), std::move(result), std::move(changed), std::move(pruned)};
}

MergeResult Updater::run(Operation op, const TypedValue& live, const ManagedFields& managed,
                         const TypedValue& incoming, const std::string& manager,
                         const std::string& api_version) const {
    switch (op) {
        case Operation::Update:
            return update(live, managed, incoming, manager, api_version);
        case Operation::Apply:
            return apply(live, managed, incoming, manager, api_version, false);
        case Operation::ForceApply:
            return apply(live, managed, incoming, manager, api_version, true);
    }
    return apply(live, managed, incoming, manager, api_version, false);
}

FieldSet Updater::dangling(const FieldSet& withdrawn, const ManagedFields& managed) const {
    FieldSet out;
    for (const auto& path : withdrawn) {
        bool claimed = false;
        for (const auto& [name, versioned] : managed) {
            // Exact or descendant claims only; a declared container lists its leaves too
            if (versioned.fields.has(path) || versioned.fields.has_descendants(path)) {
                claimed = true;
                break;
            }
        }
        if (!claimed) out.insert(path);
    }

    // A kept keyed item keeps the fields that identify it
    FieldSet keys;
    for (const auto& path : out) {
        if (path.size() < 2 || out.has(path.parent())) continue;
        const PathElement& item = path[path.size() - 2];
        if (item.kind() != PathElement::Kind::Key || path.back().kind() != PathElement::Kind::FieldName) {
            continue;
        }
        for (const auto& field : item.key_fields()) {
            if (field.first == path.back().field_name()) keys.insert(path);
        }
    }
    return out.without(keys);
}

} // namespace fieldmerge
