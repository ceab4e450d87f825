/**
 * @file Parse.cpp
 * @brief Implementation of type parsing
 */

#include "fieldmerge/Parse.hpp"
#include "fieldmerge/Util.hpp"
#include <cerrno>
#include <cstdlib>
#include <regex>

namespace fieldmerge {

namespace {
    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    // Boolean
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }

    // Null
    if (lower == "null") {
        return nullptr;
    }

    // Integer; out of range falls through to string
    if (std::regex_match(str, integer_pattern())) {
        errno = 0;
        char* end = nullptr;
        const long long val = std::strtoll(str.c_str(), &end, 10);
        if (errno != ERANGE && end == str.c_str() + str.size()) {
            return static_cast<int64_t>(val);
        }
    }

    // Float
    if (std::regex_match(str, float_pattern())) {
        errno = 0;
        char* end = nullptr;
        const double val = std::strtod(str.c_str(), &end);
        if (errno != ERANGE && end == str.c_str() + str.size()) {
            return val;
        }
    }

    // JSON compound
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // Quoted string
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    // Raw string
    return str;
}

} // namespace fieldmerge
