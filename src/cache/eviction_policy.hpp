#pragma once
#include "cache_entry.hpp"
#include <cstddef>
#include <cstdint>

namespace hookcache {

// Keep the max_entries most recently *created* entries and drop the rest.
// Hit counts and access times play no part. Entries with equal created_at
// keep their map order, so the outcome is reproducible.
// Returns the number of entries evicted.
size_t evict_oldest(EntryMap& entries, uint32_t max_entries);

} // namespace hookcache
