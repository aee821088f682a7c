#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace hookcache {

// Fixed for the lifetime of a cache instance.
struct CacheSettings {
    std::string name = "exploration";
    std::string path;                    // snapshot file; empty = <data_dir>/cache/<name>.json
    uint32_t ttl_seconds = 3600;
    uint32_t max_entries = 50;
    uint32_t max_content_size = 50000;   // larger results are not cached at all
    uint32_t max_query_chars = 100;
    uint32_t max_result_chars = 500;
    double similarity_threshold = 0.6;
    bool fuzzy_match = true;
    uint32_t lock_timeout_ms = 2000;
};

// "exploration" (fuzzy, 1h) and "research" (exact only, 24h)
std::unordered_map<std::string, CacheSettings> builtin_cache_settings();

struct Config {
    std::string data_dir;  // empty = ~/.hookcache/data
    std::unordered_map<std::string, CacheSettings> caches = builtin_cache_settings();

    // Load from ~/.hookcache/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Settings for a named cache with its snapshot path resolved.
    std::optional<CacheSettings> cache(const std::string& name) const;

    std::string resolved_data_dir() const;
};

// Parse one entry of the "caches" object over the given defaults.
CacheSettings cache_settings_from_json(const std::string& name,
                                       const nlohmann::json& obj,
                                       CacheSettings base = {});

} // namespace hookcache
