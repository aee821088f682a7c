#pragma once
#include "cache_entry.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace hookcache {

enum class MatchKind { Exact, Fuzzy };

struct Match {
    std::string key;
    MatchKind kind = MatchKind::Exact;
    double score = 1.0;
};

struct MatchOptions {
    uint32_t ttl_seconds = 3600;
    double threshold = 0.6;   // fuzzy score must be strictly above this
    bool fuzzy = true;
};

// Lower-cased whitespace-separated tokens.
std::set<std::string> token_set(const std::string& text);

// |a ∩ b| / |a ∪ b|. Empty when both sets are empty.
std::optional<double> jaccard(const std::set<std::string>& a,
                              const std::set<std::string>& b);

// Exact fingerprint match first, then the best same-scope token overlap.
// Expired entries and entries from other scopes never match.
std::optional<Match> find_match(const std::string& query,
                                const std::string& scope,
                                const CacheStore& store,
                                double now,
                                const MatchOptions& options);

std::string match_kind_to_string(MatchKind kind);

} // namespace hookcache
