#pragma once
#include <cstdint>
#include <map>
#include <string>

namespace hookcache {

struct CacheEntry {
    std::string key;          // fingerprint of (normalized query, scope)
    std::string query;
    std::string scope;
    std::string result;
    double created_at = 0.0;  // epoch seconds, immutable once stored
    uint64_t hit_count = 0;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t saves = 0;
};

// Ordered so iteration, tie-breaks and eviction are reproducible.
using EntryMap = std::map<std::string, CacheEntry>;

struct CacheStore {
    EntryMap entries;
    CacheStats stats;
};

} // namespace hookcache
