#pragma once
#include "cache_entry.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace hookcache {

enum class LoadStatus { Loaded, Missing, Corrupt, Unreadable };

// Anything but Loaded carries an empty store with zeroed stats.
struct LoadResult {
    CacheStore store;
    LoadStatus status = LoadStatus::Missing;
    size_t pruned = 0;  // expired entries dropped while loading
};

// JSON snapshot of one cache instance. Persistence is best-effort: load
// degrades to an empty store and save reports failure instead of throwing.
class EntryStore {
public:
    EntryStore(const std::string& path, uint32_t ttl_seconds);

    // Read the snapshot and drop entries already expired at `now`.
    LoadResult load(double now) const;

    // Atomic temp-file + rename. Returns false if the snapshot was not written.
    bool save(const CacheStore& store) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    uint32_t ttl_seconds_;
};

std::string load_status_to_string(LoadStatus status);

} // namespace hookcache
