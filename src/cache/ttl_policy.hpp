#pragma once
#include "cache_entry.hpp"
#include <cstddef>
#include <cstdint>

namespace hookcache {

// Valid iff now - created_at < ttl_seconds. Always evaluated against the
// caller's "now"; never cached on the entry.
bool is_entry_valid(const CacheEntry& entry, double now, uint32_t ttl_seconds);

// Drop expired entries. Returns the number removed.
size_t prune_expired(EntryMap& entries, double now, uint32_t ttl_seconds);

} // namespace hookcache
