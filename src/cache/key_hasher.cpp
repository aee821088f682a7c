#include "key_hasher.hpp"
#include "../util.hpp"
#include <cstdint>
#include <cstdio>

namespace hookcache {

std::string normalize_query(const std::string& query) {
    return to_lower(trim(query));
}

std::string fingerprint(const std::string& query, const std::string& scope) {
    constexpr uint64_t fnv_offset = 14695981039346656037ULL;
    constexpr uint64_t fnv_prime  = 1099511628211ULL;

    uint64_t hash = fnv_offset;

    for (unsigned char byte : normalize_query(query)) {
        hash ^= byte;
        hash *= fnv_prime;
    }

    // Separator byte between fields
    hash ^= static_cast<unsigned char>('\x01');
    hash *= fnv_prime;

    for (unsigned char byte : scope) {
        hash ^= byte;
        hash *= fnv_prime;
    }

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

} // namespace hookcache
