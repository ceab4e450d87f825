/**
 * @file State.cpp
 * @brief State file reading and writing
 */

#include "fieldmerge/State.hpp"
#include "fieldmerge/Config.hpp"
#include "fieldmerge/Loader.hpp"

namespace fieldmerge {

State load_state(const std::string& path, std::shared_ptr<const Schema> schema,
                 const std::string& type_name) {
    if (!file_exists(path)) {
        return State{TypedValue(std::move(schema), type_name, Value()), ManagedFields()};
    }

    const Value doc = load_json_file(path);
    if (!doc.is_object()) {
        throw ParseError(path, 0, 0, "state must be an object, got " + fieldmerge::type_name(doc));
    }

    Value object = doc.contains("object") ? doc.at("object") : Value();
    ManagedFields managed;
    if (doc.contains("managedFields")) {
        managed = doc.at("managedFields").get<ManagedFields>();
    }

    return State{TypedValue(std::move(schema), type_name, std::move(object)), std::move(managed)};
}

Value state_to_json(const State& state) {
    return Value{
        {"object", state.object.value()},
        {"managedFields", Value(state.managed)}
    };
}

void save_state(const std::string& path, const State& state, int indent) {
    Config::write_file_json(path, state_to_json(state), indent);
}

} // namespace fieldmerge
