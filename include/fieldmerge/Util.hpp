#ifndef FIELDMERGE_UTIL_HPP
#define FIELDMERGE_UTIL_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <vector>
#include <utility>

namespace fieldmerge {

// Merge b into a (recursively). Values in b take precedence.
void deep_merge(nlohmann::json& a, const nlohmann::json& b);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);

// Parse an --overrides string: "k1:value, k2:value, ..."
// Values are typed with parse_value; commas inside quotes, {} and [] are kept.
std::map<std::string, nlohmann::json> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace fieldmerge

#endif // FIELDMERGE_UTIL_HPP
