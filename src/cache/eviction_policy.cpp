#include "eviction_policy.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace hookcache {

size_t evict_oldest(EntryMap& entries, uint32_t max_entries) {
    if (entries.size() <= max_entries) return 0;

    // {created_at, key}, most recent first
    std::vector<std::pair<double, std::string>> by_age;
    by_age.reserve(entries.size());
    for (const auto& [key, entry] : entries) {
        by_age.emplace_back(entry.created_at, key);
    }

    std::stable_sort(by_age.begin(), by_age.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    size_t to_remove = entries.size() - max_entries;
    for (size_t i = max_entries; i < by_age.size(); ++i) {
        entries.erase(by_age[i].second);
    }
    return to_remove;
}

} // namespace hookcache
