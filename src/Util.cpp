#include "fieldmerge/Util.hpp"
#include "fieldmerge/Parse.hpp"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <unistd.h>

extern char **environ;

namespace fieldmerge {

void deep_merge(nlohmann::json& a, const nlohmann::json& b) {
    if (!a.is_object() || !b.is_object()) {
        a = b;
        return;
    }
    for (auto it = b.begin(); it != b.end(); ++it) {
        const auto& key = it.key();
        const auto& bv  = it.value();
        if (a.contains(key) && a[key].is_object() && bv.is_object()) {
            deep_merge(a[key], bv);
        } else {
            a[key] = bv;
        }
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

std::map<std::string, nlohmann::json> parse_overrides(const std::string& s) {
    std::map<std::string, nlohmann::json> out;
    if (s.empty()) return out;

    int depth = 0;
    bool in_str = false;
    char str_ch = '\0';
    std::string buf;
    auto flush = [&](){
        std::string pair = buf;
        buf.clear();
        auto pos = pair.find(':');
        if (pos == std::string::npos) return;
        std::string k = trim(pair.substr(0, pos));
        std::string v = trim(pair.substr(pos + 1));
        if (k.empty()) return;
        out[k] = parse_value(v);
    };
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (in_str) {
            buf += c;
            if (c == str_ch && s[i - 1] != '\\') in_str = false;
            continue;
        }
        if (c == '"' || c == '\'') { in_str = true; str_ch = c; buf += c; continue; }
        if (c == '{' || c == '[') { depth++; buf += c; continue; }
        if (c == '}' || c == ']') { depth--; buf += c; continue; }
        if (c == ',' && depth == 0) { flush(); continue; }
        buf += c;
    }
    if (!buf.empty()) flush();
    return out;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> envs;
    if (environ) {
        for (char **env = environ; *env; ++env) {
            std::string entry(*env);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
    }
    return envs;
}

} // namespace fieldmerge
