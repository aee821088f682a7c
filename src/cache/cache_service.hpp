#pragma once
#include "cache_entry.hpp"
#include "entry_store.hpp"
#include "../config.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace hookcache {

// One logical cache (exploration results, fetched pages, ...). Every call is
// a load-mutate-save cycle against the instance's snapshot file, so separate
// processes sharing a path see each other's writes.
class CacheService {
public:
    // Epoch seconds; tests substitute a fixed clock.
    using Clock = std::function<double()>;

    explicit CacheService(const CacheSettings& settings, Clock clock = epoch_clock());

    // Look up a cached result for query within scope. Returns nullopt on miss.
    // Hit and miss counters are persisted either way.
    std::optional<CacheEntry> lookup(const std::string& query, const std::string& scope);

    // Store a result. Empty or oversized results are silently dropped.
    void store(const std::string& query,
               const std::string& scope,
               const std::string& result);

    CacheStats stats() const;
    uint32_t size() const;

    // Reset entries and stats.
    void clear();

    const CacheSettings& settings() const { return settings_; }

    static Clock epoch_clock();

private:
    LoadResult load_snapshot(double now) const;
    void persist(const CacheStore& store) const;
    std::string log_tag() const;

    CacheSettings settings_;
    Clock clock_;
    EntryStore snapshot_;
    mutable std::mutex mutex_;
};

} // namespace hookcache
