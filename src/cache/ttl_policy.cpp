#include "ttl_policy.hpp"

namespace hookcache {

bool is_entry_valid(const CacheEntry& entry, double now, uint32_t ttl_seconds) {
    return (now - entry.created_at) < static_cast<double>(ttl_seconds);
}

size_t prune_expired(EntryMap& entries, double now, uint32_t ttl_seconds) {
    size_t removed = 0;
    for (auto it = entries.begin(); it != entries.end(); ) {
        if (!is_entry_valid(it->second, now, ttl_seconds)) {
            it = entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace hookcache
