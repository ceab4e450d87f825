/**
 * @file State.hpp
 * @brief Persisted object plus its managed fields
 *
 * On-disk layout (JSON):
 * ```json
 * {"object": {...}, "managedFields": {"manager": {...}}}
 * ```
 */

#ifndef FIELDMERGE_STATE_HPP
#define FIELDMERGE_STATE_HPP

#include "fieldmerge/ManagedFields.hpp"
#include "fieldmerge/TypedValue.hpp"
#include <memory>
#include <string>

namespace fieldmerge {

struct State {
    TypedValue object;
    ManagedFields managed;
};

/**
 * @brief Read a state file
 *
 * A missing file yields an empty object of the given type with no managers.
 *
 * @throws ParseError if the file or its managedFields is malformed
 * @throws ValidationError if the object does not match type_name
 */
State load_state(const std::string& path, std::shared_ptr<const Schema> schema,
                 const std::string& type_name);

Value state_to_json(const State& state);

void save_state(const std::string& path, const State& state, int indent = 2);

} // namespace fieldmerge

#endif // FIELDMERGE_STATE_HPP
