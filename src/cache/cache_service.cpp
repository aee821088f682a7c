#include "cache_service.hpp"
#include "eviction_policy.hpp"
#include "key_hasher.hpp"
#include "similarity.hpp"
#include "ttl_policy.hpp"
#include "../file_lock.hpp"
#include "../util.hpp"
#include <iostream>
#include <utility>

namespace hookcache {

CacheService::Clock CacheService::epoch_clock() {
    return [] { return epoch_time(); };
}

CacheService::CacheService(const CacheSettings& settings, Clock clock)
    : settings_(settings),
      clock_(std::move(clock)),
      snapshot_(settings.path, settings.ttl_seconds) {}

std::string CacheService::log_tag() const {
    return "[cache:" + settings_.name + "] ";
}

void CacheService::persist(const CacheStore& store) const {
    // Must be called with mutex_ and the file lock held.
    if (!snapshot_.save(store)) {
        std::cerr << log_tag() << "Warning: failed to write " << snapshot_.path() << "\n";
    }
}

LoadResult CacheService::load_snapshot(double now) const {
    LoadResult loaded = snapshot_.load(now);
    if (loaded.status == LoadStatus::Corrupt || loaded.status == LoadStatus::Unreadable) {
        std::cerr << log_tag() << "Warning: " << load_status_to_string(loaded.status)
                  << " snapshot " << snapshot_.path() << ", starting empty\n";
    }
    return loaded;
}

std::optional<CacheEntry> CacheService::lookup(const std::string& query,
                                               const std::string& scope) {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(snapshot_.path() + ".lock", settings_.lock_timeout_ms);

    double now = clock_();
    LoadResult loaded = load_snapshot(now);
    CacheStore& current = loaded.store;

    MatchOptions options;
    options.ttl_seconds = settings_.ttl_seconds;
    options.threshold = settings_.similarity_threshold;
    options.fuzzy = settings_.fuzzy_match;

    std::optional<CacheEntry> found;
    auto match = find_match(query, scope, current, now, options);
    if (match) {
        CacheEntry& entry = current.entries[match->key];
        entry.hit_count++;
        current.stats.hits++;
        found = entry;
        std::cerr << log_tag() << match_kind_to_string(match->kind) << " hit (score "
                  << match->score << ", age " << static_cast<int64_t>(now - entry.created_at)
                  << "s)\n";
    } else {
        current.stats.misses++;
    }

    persist(current);
    return found;
}

void CacheService::store(const std::string& query,
                         const std::string& scope,
                         const std::string& result) {
    if (query.empty() || result.empty()) return;
    if (result.size() > settings_.max_content_size) {
        std::cerr << log_tag() << "Skipping oversized result (" << result.size()
                  << " > " << settings_.max_content_size << " bytes)\n";
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(snapshot_.path() + ".lock", settings_.lock_timeout_ms);

    double now = clock_();
    CacheStore current = load_snapshot(now).store;

    CacheEntry entry;
    entry.key = fingerprint(query, scope);
    entry.query = truncate_utf8(query, settings_.max_query_chars);
    entry.scope = scope;
    entry.result = truncate_utf8(result, settings_.max_result_chars);
    entry.created_at = now;
    entry.hit_count = 0;
    std::string key = entry.key;
    current.entries[key] = std::move(entry);

    prune_expired(current.entries, now, settings_.ttl_seconds);
    evict_oldest(current.entries, settings_.max_entries);
    current.stats.saves++;

    persist(current);
}

CacheStats CacheService::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_snapshot(clock_()).store.stats;
}

uint32_t CacheService::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(load_snapshot(clock_()).store.entries.size());
}

void CacheService::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    FileLock file_lock(snapshot_.path() + ".lock", settings_.lock_timeout_ms);
    persist(CacheStore{});
}

} // namespace hookcache
