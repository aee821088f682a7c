#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

namespace hookcache {

std::unordered_map<std::string, CacheSettings> builtin_cache_settings() {
    CacheSettings exploration;
    exploration.name = "exploration";
    exploration.ttl_seconds = 3600;
    exploration.max_entries = 50;
    exploration.max_content_size = 50000;
    exploration.max_query_chars = 100;
    exploration.max_result_chars = 500;
    exploration.similarity_threshold = 0.6;
    exploration.fuzzy_match = true;

    // Keyed by URL: exact matches only, longer-lived
    CacheSettings research;
    research.name = "research";
    research.ttl_seconds = 86400;
    research.max_entries = 100;
    research.max_content_size = 50000;
    research.max_query_chars = 2048;
    research.max_result_chars = 2000;
    research.similarity_threshold = 0.6;
    research.fuzzy_match = false;

    return {{exploration.name, exploration}, {research.name, research}};
}

static nlohmann::json cache_settings_to_json(const CacheSettings& s) {
    return {
        {"path", s.path},
        {"ttl_seconds", s.ttl_seconds},
        {"max_entries", s.max_entries},
        {"max_content_size", s.max_content_size},
        {"max_query_chars", s.max_query_chars},
        {"max_result_chars", s.max_result_chars},
        {"similarity_threshold", s.similarity_threshold},
        {"fuzzy_match", s.fuzzy_match},
        {"lock_timeout_ms", s.lock_timeout_ms}
    };
}

nlohmann::json Config::defaults_json() {
    nlohmann::json caches = nlohmann::json::object();
    for (const auto& [name, settings] : builtin_cache_settings()) {
        caches[name] = cache_settings_to_json(settings);
    }
    return {
        {"data_dir", ""},
        {"caches", caches}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (!obj.contains(name) || !obj[name].is_number_unsigned()) return;
    uint64_t value = obj[name].get<uint64_t>();
    if (value > std::numeric_limits<uint32_t>::max()) {
        std::cerr << "[config] Ignoring out-of-range " << name << ": " << value << "\n";
        return;
    }
    out = static_cast<uint32_t>(value);
}

CacheSettings cache_settings_from_json(const std::string& name,
                                       const nlohmann::json& obj,
                                       CacheSettings base) {
    base.name = name;
    if (!obj.is_object()) return base;

    if (obj.contains("path") && obj["path"].is_string())
        base.path = obj["path"].get<std::string>();
    read_u32(obj, "ttl_seconds", base.ttl_seconds);
    read_u32(obj, "max_entries", base.max_entries);
    read_u32(obj, "max_content_size", base.max_content_size);
    read_u32(obj, "max_query_chars", base.max_query_chars);
    read_u32(obj, "max_result_chars", base.max_result_chars);
    read_u32(obj, "lock_timeout_ms", base.lock_timeout_ms);
    if (obj.contains("similarity_threshold") && obj["similarity_threshold"].is_number())
        base.similarity_threshold = obj["similarity_threshold"].get<double>();
    if (obj.contains("fuzzy_match") && obj["fuzzy_match"].is_boolean())
        base.fuzzy_match = obj["fuzzy_match"].get<bool>();
    return base;
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.hookcache/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("data_dir") && j["data_dir"].is_string())
        cfg.data_dir = j["data_dir"].get<std::string>();

    // Named caches layer over the built-in settings of the same name
    if (j.contains("caches") && j["caches"].is_object()) {
        for (auto& [name, obj] : j["caches"].items()) {
            if (!obj.is_object()) continue;
            CacheSettings base;
            auto it = cfg.caches.find(name);
            if (it != cfg.caches.end()) base = it->second;
            cfg.caches[name] = cache_settings_from_json(name, obj, base);
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("HOOKCACHE_DATA_DIR"))
        cfg.data_dir = v;

    return cfg;
}

std::string Config::resolved_data_dir() const {
    if (data_dir.empty()) return expand_home("~/.hookcache/data");
    return expand_home(data_dir);
}

std::optional<CacheSettings> Config::cache(const std::string& name) const {
    auto it = caches.find(name);
    if (it == caches.end()) return std::nullopt;

    CacheSettings settings = it->second;
    if (settings.path.empty()) {
        settings.path = resolved_data_dir() + "/cache/" + name + ".json";
    } else {
        settings.path = expand_home(settings.path);
    }
    return settings;
}

} // namespace hookcache
