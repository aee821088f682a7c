#pragma once
#include <string>

namespace hookcache {

// Lower-case and trim, so requests differing only in case or surrounding
// whitespace share a fingerprint.
std::string normalize_query(const std::string& query);

// 16 hex chars: FNV-1a over normalized query, separator byte, scope.
std::string fingerprint(const std::string& query, const std::string& scope);

} // namespace hookcache
