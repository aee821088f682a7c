#pragma once
#include "cache_entry.hpp"
#include <nlohmann/json.hpp>

namespace hookcache {

// JSON <-> CacheStore conversion for the on-disk snapshot.
// Readers never throw: wrong-typed fields fall back to defaults.

inline std::string json_string_field(const nlohmann::json& obj, const char* name) {
    auto it = obj.find(name);
    if (it != obj.end() && it->is_string()) return it->get<std::string>();
    return {};
}

inline uint64_t json_count_field(const nlohmann::json& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer() && it->get<int64_t>() > 0)
        return static_cast<uint64_t>(it->get<int64_t>());
    return 0;
}

inline CacheEntry entry_from_json(const std::string& key, const nlohmann::json& item) {
    CacheEntry entry;
    entry.key = key;
    entry.query = json_string_field(item, "query");
    entry.scope = json_string_field(item, "scope");
    entry.result = json_string_field(item, "result");
    if (entry.result.empty()) {
        entry.result = json_string_field(item, "summary");
    }
    auto ts = item.find("createdAt");
    if (ts != item.end() && ts->is_number()) {
        entry.created_at = ts->get<double>();
    }
    entry.hit_count = json_count_field(item, "hitCount");
    return entry;
}

inline nlohmann::json entry_to_json(const CacheEntry& entry) {
    return {
        {"query", entry.query},
        {"result", entry.result},
        {"scope", entry.scope},
        {"createdAt", entry.created_at},
        {"hitCount", entry.hit_count}
    };
}

inline CacheStats stats_from_json(const nlohmann::json& j) {
    CacheStats stats;
    if (!j.is_object()) return stats;
    stats.hits = json_count_field(j, "hits");
    stats.misses = json_count_field(j, "misses");
    stats.saves = json_count_field(j, "saves");
    return stats;
}

inline nlohmann::json stats_to_json(const CacheStats& stats) {
    return {
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"saves", stats.saves}
    };
}

inline CacheStore store_from_json(const nlohmann::json& j) {
    CacheStore store;
    auto entries = j.find("entries");
    if (entries != j.end() && entries->is_object()) {
        for (auto& [key, item] : entries->items()) {
            if (!item.is_object()) continue;
            store.entries[key] = entry_from_json(key, item);
        }
    }
    auto stats = j.find("stats");
    if (stats != j.end()) {
        store.stats = stats_from_json(*stats);
    }
    return store;
}

inline nlohmann::json store_to_json(const CacheStore& store) {
    nlohmann::json entries = nlohmann::json::object();
    for (const auto& [key, entry] : store.entries) {
        entries[key] = entry_to_json(entry);
    }
    return {
        {"entries", entries},
        {"stats", stats_to_json(store.stats)}
    };
}

} // namespace hookcache
