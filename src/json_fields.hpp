#pragma once

#include <string>
#include "paperdesk/types.hpp"
#include "paperdesk/util.hpp"

namespace paperdesk {
namespace json_fields {

// Tolerant readers for snapshot and collaborator records: missing keys and
// wrong types read as the fallback instead of throwing.

inline std::string string_of(const Json& value) {
    if (value.is_string()) return trim(value.get<std::string>());
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    return "";
}

inline std::string get_string(const Json& object, const char* key) {
    if (!object.is_object()) return "";
    auto it = object.find(key);
    return it != object.end() ? string_of(*it) : "";
}

inline double get_double(const Json& object, const char* key, double fallback = 0.0) {
    if (!object.is_object()) return fallback;
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

inline bool get_bool(const Json& object, const char* key, bool fallback = false) {
    if (!object.is_object()) return fallback;
    auto it = object.find(key);
    if (it == object.end()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return fallback;
}

inline long long get_int(const Json& object, const char* key, long long fallback = 0) {
    if (!object.is_object()) return fallback;
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) return fallback;
    return it->get<long long>();
}

inline const Json& get_object(const Json& object, const char* key) {
    static const Json empty = Json::object();
    if (!object.is_object()) return empty;
    auto it = object.find(key);
    return (it != object.end() && it->is_object()) ? *it : empty;
}

inline const Json& get_array(const Json& object, const char* key) {
    static const Json empty = Json::array();
    if (!object.is_object()) return empty;
    auto it = object.find(key);
    return (it != object.end() && it->is_array()) ? *it : empty;
}

} // namespace json_fields
} // namespace paperdesk
