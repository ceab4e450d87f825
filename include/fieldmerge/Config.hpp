#ifndef FIELDMERGE_CONFIG_HPP
#define FIELDMERGE_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <string>
#include <map>
#include <vector>
#include <optional>
#include "fieldmerge/Errors.hpp"

namespace fieldmerge {

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // Environment variable prefix, e.g. "FIELDMERGE"
    std::map<std::string, nlohmann::json> overrides; // final precedence
    nlohmann::json defaults = builtin_defaults();
    std::vector<std::string> mandatory;

    /// Built-in settings every load starts from.
    static nlohmann::json builtin_defaults();
};

/**
 * @brief Settings for the fieldmerge tool, with dot-notation helpers.
 *
 * Internally uses nlohmann::json to represent a hierarchical tree.
 * Recognised keys:
 * - merge.prune_dangling (bool)
 * - output.indent (int)
 * - output.format ("json" | "toml")
 */
class Config {
public:
    Config() = default;
    explicit Config(nlohmann::json data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    // Access the underlying tree
    const nlohmann::json& data() const noexcept { return data_; }

    // Dot helpers
    const nlohmann::json& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const nlohmann::json& v);

    /**
     * @brief Typed lookup with fallback
     *
     * Returns fallback when the key is missing or holds another type.
     */
    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    // Enforcement
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // Serialization
    std::string to_json_string(int indent = 2) const;
    std::string to_toml_string() const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, nlohmann::json>& kv);

    // Value rendering shared with the CLI
    static std::string render_toml(const nlohmann::json& j);
    static void write_file_json(const std::string& file, const nlohmann::json& j, int indent = 2);

private:
    nlohmann::json data_ = nlohmann::json::object();

    // Build a TOML table by value from a JSON object.
    static toml::table json_to_toml(const nlohmann::json& j);
};

} // namespace fieldmerge

#endif // FIELDMERGE_CONFIG_HPP
