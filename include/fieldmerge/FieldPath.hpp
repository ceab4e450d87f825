/**
 * @file FieldPath.hpp
 * @brief Addresses of nodes inside a typed tree
 *
 * A FieldPath is an ordered sequence of PathElements from the root. The
 * empty path addresses the root itself.
 *
 * Text form (used for display and the CLI):
 * - ".spec.replicas"                      field names
 * - ".spec.containers[name=\"nginx\"]"    associative list item by keys
 * - ".spec.finalizers[=\"a\"]"            set item by value
 * - ".args[2]"                            granular list item by index
 * - "." or ""                             the root
 *
 * Persisted form is a JSON array of element objects (see PathElement.hpp).
 */

#ifndef FIELDMERGE_FIELDPATH_HPP
#define FIELDMERGE_FIELDPATH_HPP

#include "fieldmerge/PathElement.hpp"
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

namespace fieldmerge {

class FieldPath {
public:
    using const_iterator = std::vector<PathElement>::const_iterator;

    FieldPath() = default;
    FieldPath(std::initializer_list<PathElement> elements) : elements_(elements) {}
    explicit FieldPath(std::vector<PathElement> elements) : elements_(std::move(elements)) {}

    /**
     * @brief Parse path text
     *
     * Examples:
     * ```cpp
     * FieldPath::parse(".numeric");                       // [f:numeric]
     * FieldPath::parse(".list[name=\"a\",port=80].x");    // [f:list, k:{name,port}, f:x]
     * FieldPath::parse(".set[=1]");                        // [f:set, v:1]
     * ```
     *
     * @throws PathParseError on malformed text
     */
    static FieldPath parse(const std::string& text);

    /// New path with one more element appended.
    FieldPath child(PathElement element) const;

    /// Path without its last element. The root's parent is the root.
    FieldPath parent() const;

    bool empty() const noexcept { return elements_.empty(); }
    size_t size() const noexcept { return elements_.size(); }
    const PathElement& operator[](size_t i) const { return elements_[i]; }
    const PathElement& back() const { return elements_.back(); }
    const_iterator begin() const noexcept { return elements_.begin(); }
    const_iterator end() const noexcept { return elements_.end(); }

    /**
     * @brief True if this path equals other or is one of its ancestors
     */
    bool is_prefix_of(const FieldPath& other) const;

    std::string to_string() const;

    int compare(const FieldPath& other) const;

    bool operator==(const FieldPath& other) const { return compare(other) == 0; }
    bool operator!=(const FieldPath& other) const { return compare(other) != 0; }
    bool operator<(const FieldPath& other) const { return compare(other) < 0; }

private:
    std::vector<PathElement> elements_;
};

std::ostream& operator<<(std::ostream& os, const FieldPath& path);

void to_json(Value& j, const FieldPath& path);
void from_json(const Value& j, FieldPath& path);

} // namespace fieldmerge

#endif // FIELDMERGE_FIELDPATH_HPP
