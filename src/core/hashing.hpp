/**
 * Fast non-cryptographic digests used for configuration identity.
 *
 * XXH3 is stable across library versions (>= 0.8), which matters here:
 * fingerprints are persisted in checkpoint files and compared on resume.
 */

#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

#define XXH_INLINE_ALL
#include <xxhash.h>

namespace seedhound {

inline std::string xxh3_128_hex(std::string_view data) {
    XXH128_hash_t h = XXH3_128bits(data.data(), data.size());
    char hex[33];
    std::snprintf(hex, sizeof(hex), "%016llx%016llx",
                  static_cast<unsigned long long>(h.high64),
                  static_cast<unsigned long long>(h.low64));
    return std::string(hex);
}

inline std::string xxh3_64_hex(std::string_view data) {
    uint64_t h = XXH3_64bits(data.data(), data.size());
    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(h));
    return std::string(hex);
}

/**
 * Append a length-prefixed field so that concatenated fields cannot collide
 * ("ab"+"c" vs "a"+"bc").
 */
inline void append_field(std::string& out, std::string_view field) {
    out += std::to_string(field.size());
    out += ':';
    out.append(field.data(), field.size());
    out += ';';
}

}  // namespace seedhound
