#pragma once

// json_util.h
//
// Thin RAII layer over json-c for the engine's JSON concerns: the snippet
// context, the child handshake line and the audit log.

#include <json-c/json.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>

namespace capsule::json_util {

// Nesting ceilings for parse(). Contexts come from callers; documents cover
// results and child messages, whose values nest up to 256 levels.
constexpr int kMaxContextDepth = 64;
constexpr int kMaxDocumentDepth = 260;

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Releases ownership to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Parses a complete JSON text. Trailing non-whitespace is an error. On
// failure returns an empty Doc and, if `error` is given, a short reason.
// A literal `null` document parses to an empty Doc with no error set.
inline Doc parse(const std::string& text, std::string* error = nullptr, int max_depth = kMaxDocumentDepth) {
    if (error) error->clear();
    json_tokener* tok = json_tokener_new_ex(max_depth);
    if (!tok) {
        if (error) *error = "out of memory";
        return Doc{};
    }
    const int len = static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);

    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (error) {
            *error = jerr == json_tokener_continue ? "unexpected end of input" : json_tokener_error_desc(jerr);
        }
        return Doc{};
    }
    for (size_t i = end; i < text.size(); i++) {
        if (!std::isspace(static_cast<unsigned char>(text[i]))) {
            if (obj) json_object_put(obj);
            if (error) *error = "trailing characters after JSON value";
            return Doc{};
        }
    }
    return Doc{obj};
}

inline bool is_object(const Doc& d) {
    return d.root && json_object_is_type(d.root, json_type_object);
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return std::string(json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE));
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = nullptr;
    if (!obj || !json_object_object_get_ex(obj, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = nullptr;
    if (!obj || !json_object_object_get_ex(obj, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = nullptr;
    if (!obj || !json_object_object_get_ex(obj, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// Present key (possibly JSON null) -> raw JSON text of its value.
inline std::optional<std::string> get_raw(json_object* obj, const char* key) {
    json_object* v = nullptr;
    if (!obj || !json_object_object_get_ex(obj, key, &v)) return std::nullopt;
    return to_string(v);
}

inline void put_string(json_object* obj, const char* key, const std::string& s) {
    json_object_object_add(obj, key, json_object_new_string_len(s.c_str(), static_cast<int>(s.size())));
}

} // namespace capsule::json_util
