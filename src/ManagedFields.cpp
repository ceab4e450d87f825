/**
 * @file ManagedFields.cpp
 * @brief Implementation of the copy-on-write ownership table
 */

#include "fieldmerge/ManagedFields.hpp"
#include "fieldmerge/Errors.hpp"

namespace fieldmerge {

ManagedFields::ManagedFields()
    : entries_(std::make_shared<const Map>())
{}

ManagedFields::ManagedFields(std::initializer_list<Map::value_type> entries) {
    Map m;
    for (const auto& entry : entries) {
        if (!entry.second.fields.empty()) m.insert(entry);
    }
    entries_ = std::make_shared<const Map>(std::move(m));
}

const VersionedSet* ManagedFields::find(const std::string& manager) const {
    auto it = entries_->find(manager);
    return it == entries_->end() ? nullptr : &it->second;
}

ManagedFields ManagedFields::set(const std::string& manager, VersionedSet versioned) const {
    if (versioned.fields.empty()) {
        return remove(manager);
    }
    auto copy = std::make_shared<Map>(*entries_);
    (*copy)[manager] = std::move(versioned);
    return ManagedFields(std::shared_ptr<const Map>(std::move(copy)));
}

ManagedFields ManagedFields::remove(const std::string& manager) const {
    if (entries_->count(manager) == 0) {
        return *this;
    }
    auto copy = std::make_shared<Map>(*entries_);
    copy->erase(manager);
    return ManagedFields(std::shared_ptr<const Map>(std::move(copy)));
}

ManagedFields ManagedFields::strip(const FieldSet& paths, const std::string& except) const {
    if (paths.empty()) {
        return *this;
    }

    auto copy = std::make_shared<Map>();
    bool changed = false;
    for (const auto& [manager, versioned] : *entries_) {
        if (manager == except) {
            copy->emplace(manager, versioned);
            continue;
        }
        FieldSet remaining = versioned.fields.without(paths);
        if (remaining.size() != versioned.fields.size()) changed = true;
        if (remaining.empty()) continue;
        copy->emplace(manager, make_versioned_set(std::move(remaining),
                                                  versioned.api_version,
                                                  versioned.applied));
    }

    if (!changed) {
        return *this;
    }
    return ManagedFields(std::shared_ptr<const Map>(std::move(copy)));
}

std::vector<std::string> ManagedFields::owners(const FieldPath& path) const {
    std::vector<std::string> result;
    for (const auto& [manager, versioned] : *entries_) {
        if (versioned.fields.contains(path)) result.push_back(manager);
    }
    return result;
}

// ============================================================================
// Persistence
// ============================================================================

void to_json(Value& j, const VersionedSet& versioned) {
    j = Value{
        {"apiVersion", versioned.api_version},
        {"applied", versioned.applied},
        {"fields", Value(versioned.fields)}
    };
}

void from_json(const Value& j, VersionedSet& versioned) {
    if (!j.is_object()) {
        throw ParseError("managedFields", 0, 0, "entry must be an object");
    }
    if (!j.contains("apiVersion") || !j["apiVersion"].is_string()) {
        throw ParseError("managedFields", 0, 0, "entry is missing string 'apiVersion'");
    }
    if (!j.contains("fields")) {
        throw ParseError("managedFields", 0, 0, "entry is missing 'fields'");
    }

    VersionedSet result;
    result.api_version = j["apiVersion"].get<std::string>();
    result.applied = j.value("applied", false);
    result.fields = j["fields"].get<FieldSet>();
    versioned = std::move(result);
}

void to_json(Value& j, const ManagedFields& managed) {
    j = Value::object();
    for (const auto& [manager, versioned] : managed) {
        j[manager] = Value(versioned);
    }
}

void from_json(const Value& j, ManagedFields& managed) {
    if (j.is_null()) {
        managed = ManagedFields();
        return;
    }
    if (!j.is_object()) {
        throw ParseError("managedFields", 0, 0, "must be an object keyed by manager");
    }

    auto m = std::make_shared<ManagedFields::Map>();
    for (auto it = j.begin(); it != j.end(); ++it) {
        VersionedSet versioned = it.value().get<VersionedSet>();
        if (versioned.fields.empty()) continue;
        m->emplace(it.key(), std::move(versioned));
    }
    managed = ManagedFields(std::shared_ptr<const ManagedFields::Map>(std::move(m)));
}

} // namespace fieldmerge
