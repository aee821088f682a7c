#include "entry_store.hpp"
#include "entry_json.hpp"
#include "ttl_policy.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

namespace hookcache {

EntryStore::EntryStore(const std::string& path, uint32_t ttl_seconds)
    : path_(path), ttl_seconds_(ttl_seconds) {}

LoadResult EntryStore::load(double now) const {
    LoadResult result;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        result.status = ec ? LoadStatus::Unreadable : LoadStatus::Missing;
        return result;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        result.status = LoadStatus::Unreadable;
        return result;
    }

    // Non-throwing parse: a torn or hand-edited file reads as discarded
    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        result.status = LoadStatus::Corrupt;
        return result;
    }

    result.store = store_from_json(j);
    result.pruned = prune_expired(result.store.entries, now, ttl_seconds_);
    result.status = LoadStatus::Loaded;
    return result;
}

bool EntryStore::save(const CacheStore& store) const {
    // Replace invalid UTF-8 rather than throwing from dump()
    std::string body = store_to_json(store).dump(
        2, ' ', false, nlohmann::json::error_handler_t::replace);
    return atomic_write_file(path_, body + "\n");
}

std::string load_status_to_string(LoadStatus status) {
    switch (status) {
        case LoadStatus::Loaded:     return "loaded";
        case LoadStatus::Missing:    return "missing";
        case LoadStatus::Corrupt:    return "corrupt";
        case LoadStatus::Unreadable: return "unreadable";
    }
    return "missing";
}

} // namespace hookcache
