#pragma once
#include <string>
#include <random>
#include <mutex>
#include <cstdio>
#include <cstdint>
#include <cctype>

namespace code_validation {

inline std::mt19937_64& id_engine() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

// Random RFC 4122 version-4 UUID, lowercase.
inline std::string generate_uuid() {
    static std::mutex mtx;
    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(mtx);
        hi = id_engine()();
        lo = id_engine()();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  (unsigned)(hi >> 32), (unsigned)((hi >> 16) & 0xFFFF), (unsigned)(hi & 0xFFFF),
                  (unsigned)(lo >> 48), (unsigned long long)(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

inline std::string short_hex_id() {
    return generate_uuid().substr(0, 8);
}

// Execution ids are UUIDs; anything else could smuggle path components.
inline bool is_valid_execution_id(const std::string& id) {
    if (id.empty() || id.size() > 64) return false;
    for (unsigned char c : id) {
        if (!(std::isalnum(c) || c == '-')) return false;
    }
    return true;
}

}
