#include "similarity.hpp"
#include "key_hasher.hpp"
#include "ttl_policy.hpp"
#include "../util.hpp"

namespace hookcache {

std::set<std::string> token_set(const std::string& text) {
    auto tokens = split_whitespace(to_lower(text));
    return std::set<std::string>(tokens.begin(), tokens.end());
}

std::optional<double> jaccard(const std::set<std::string>& a,
                              const std::set<std::string>& b) {
    size_t overlap = 0;
    for (const auto& token : a) {
        if (b.count(token)) overlap++;
    }
    size_t total = a.size() + b.size() - overlap;
    if (total == 0) return std::nullopt;
    return static_cast<double>(overlap) / static_cast<double>(total);
}

std::optional<Match> find_match(const std::string& query,
                                const std::string& scope,
                                const CacheStore& store,
                                double now,
                                const MatchOptions& options) {
    std::string key = fingerprint(query, scope);
    auto it = store.entries.find(key);
    if (it != store.entries.end() && it->second.scope == scope &&
        is_entry_valid(it->second, now, options.ttl_seconds)) {
        return Match{key, MatchKind::Exact, 1.0};
    }

    if (!options.fuzzy) return std::nullopt;

    auto query_tokens = token_set(query);
    std::optional<Match> best;

    for (const auto& [candidate_key, entry] : store.entries) {
        if (entry.scope != scope) continue;
        if (!is_entry_valid(entry, now, options.ttl_seconds)) continue;

        auto score = jaccard(query_tokens, token_set(entry.query));
        if (!score) continue;

        // Strictly greater: the first candidate seen keeps a tie
        if (*score > options.threshold && (!best || *score > best->score)) {
            best = Match{candidate_key, MatchKind::Fuzzy, *score};
        }
    }
    return best;
}

std::string match_kind_to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::Exact: return "exact";
        case MatchKind::Fuzzy: return "fuzzy";
    }
    return "exact";
}

} // namespace hookcache
