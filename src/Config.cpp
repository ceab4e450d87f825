#include "fieldmerge/Config.hpp"
#include "fieldmerge/DotPath.hpp"
#include "fieldmerge/Loader.hpp"
#include "fieldmerge/Parse.hpp"
#include "fieldmerge/Util.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <cctype>
#include <utility>

namespace fieldmerge {

nlohmann::json LoadOptions::builtin_defaults() {
    return nlohmann::json{
        {"merge", {{"prune_dangling", false}}},
        {"output", {{"indent", 2}, {"format", "json"}}}
    };
}

Config Config::load(const LoadOptions& opts) {
    nlohmann::json merged = nlohmann::json::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, load_config_file(*opts.file_path));
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    // 5) mandatory
    cfg.enforce_mandatory(opts.mandatory);

    return cfg;
}

// ---- JSON -> TOML -----------------------------------------------------------
namespace {
    using nlohmann::json;

    toml::table to_toml_table(const json& o);
    toml::array to_toml_array(const json& a);

    // Hands the TOML counterpart of v to put. TOML has no null, so null
    // becomes an empty string.
    template <typename Put>
    void to_toml_node(const json& v, Put&& put) {
        if (v.is_object()) {
            put(to_toml_table(v));
        } else if (v.is_array()) {
            put(to_toml_array(v));
        } else if (v.is_string()) {
            put(v.get<std::string>());
        } else if (v.is_boolean()) {
            put(v.get<bool>());
        } else if (v.is_number_unsigned() &&
                   v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            put(v.get<double>());
        } else if (v.is_number_integer()) {
            put(v.get<std::int64_t>());
        } else if (v.is_number_float()) {
            put(v.get<double>());
        } else {
            put(std::string{});
        }
    }

    toml::array to_toml_array(const json& a) {
        toml::array out;
        for (const auto& elem : a) {
            to_toml_node(elem, [&out](auto&& node) { out.push_back(std::forward<decltype(node)>(node)); });
        }
        return out;
    }

    toml::table to_toml_table(const json& o) {
        toml::table out;
        for (auto it = o.begin(); it != o.end(); ++it) {
            const std::string& key = it.key();
            to_toml_node(it.value(), [&out, &key](auto&& node) {
                out.insert(key, std::forward<decltype(node)>(node));
            });
        }
        return out;
    }

    /**
     * @brief Map lowercase underscore-separated tokens onto existing keys
     *
     * At each level the longest run of tokens that, joined with '_', names
     * an existing key wins; otherwise a single token becomes a segment.
     * "merge_prune_dangling" -> "merge.prune_dangling" when that key exists.
     */
    std::string remap_env_key(const std::vector<std::string>& tokens, const json& data) {
        std::vector<std::string> segments;
        const json* level = &data;
        size_t i = 0;
        while (i < tokens.size()) {
            size_t take = 1;
            if (level && level->is_object()) {
                for (size_t n = tokens.size() - i; n > 1; --n) {
                    std::string candidate = tokens[i];
                    for (size_t k = 1; k < n; ++k) candidate += "_" + tokens[i + k];
                    if (level->contains(candidate)) { take = n; break; }
                }
            }
            std::string seg = tokens[i];
            for (size_t k = 1; k < take; ++k) seg += "_" + tokens[i + k];
            segments.push_back(seg);

            if (level && level->is_object() && level->contains(seg)) {
                level = &(*level)[seg];
            } else {
                level = nullptr;
            }
            i += take;
        }
        return join_dot_path(segments);
    }
} // namespace

toml::table Config::json_to_toml(const nlohmann::json& j) {
    // TOML requires a table at the root; anything else goes under "value"
    if (j.is_object()) return to_toml_table(j);
    toml::table root;
    to_toml_node(j, [&root](auto&& node) { root.insert("value", std::forward<decltype(node)>(node)); });
    return root;
}

const nlohmann::json& Config::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return find_by_dot(data_, path) != nullptr;
}

void Config::set(const std::string& path, const nlohmann::json& v) {
    set_by_dot(data_, path, v);
}

void Config::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

std::string Config::to_json_string(int indent) const {
    return data_.dump(indent);
}

std::string Config::to_toml_string() const {
    return render_toml(data_);
}

std::string Config::render_toml(const nlohmann::json& j) {
    std::ostringstream oss;
    oss << json_to_toml(j);
    return oss.str();
}

void Config::write_file_json(const std::string& file, const nlohmann::json& j, int indent) {
    std::ofstream ofs(file);
    if (!ofs) throw ConfigError("Failed to open for write: " + file);
    ofs << std::setw(indent) << j << "\n";
}

void Config::apply_env_prefix(const std::string& prefix) {
    // Prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) continue;

        const auto tokens = split(to_lower(name.substr(normalized.size())), '_');
        if (tokens.empty()) continue;
        set_by_dot(data_, remap_env_key(tokens, data_), parse_value(value));
    }
}

void Config::apply_overrides(const std::map<std::string, nlohmann::json>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

} // namespace fieldmerge
