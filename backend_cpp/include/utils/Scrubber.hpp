#pragma once
#include <string>
#include <algorithm>
#include <cctype>

namespace code_validation {

// JSON-safe string scrubber: keeps tab/newline/CR and printable ASCII, blanks the rest.
inline std::string scrub_json_string(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (unsigned char c : str) {
        if (c == 0x09 || c == 0x0A || c == 0x0D || (c >= 32 && c <= 126)) {
            out += (char)c;
            continue;
        }
        out += ' ';
    }
    return out;
}

// Reduces an uploaded filename to a safe base name.
// Directory components are dropped, anything outside [A-Za-z0-9._-] becomes '_',
// and leading dots/underscores are stripped. Returns "" when nothing usable is left.
inline std::string secure_filename(const std::string& filename) {
    std::string name = filename;
    std::replace(name.begin(), name.end(), '\\', '/');
    size_t slash = name.rfind('/');
    if (slash != std::string::npos) name = name.substr(slash + 1);

    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        bool keep = std::isalnum(c) || c == '.' || c == '-' || c == '_';
        out += keep ? (char)c : '_';
    }

    size_t start = out.find_first_not_of("._");
    if (start == std::string::npos) return "";
    out = out.substr(start);
    if (out == "." || out == "..") return "";
    return out;
}

// Single-quote for /bin/sh.
inline std::string shell_quote(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

}
