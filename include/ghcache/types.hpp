#pragma once

#include <ghcache/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ghcache {

using Bytes = std::vector<std::uint8_t>;

// Longest key the service accepts.
inline constexpr size_t kMaxKeyLength = 512;

struct CacheHit {
    std::string key;    // full key the matched entry was stored under
    std::string scope;  // branch/scope that stored the entry
};

// Result of a lookup: what matched and where to download it from.
// The location is a short-lived pre-signed URL; do not persist it.
struct CacheLookup {
    CacheHit hit;
    std::string archive_location;
};

struct CacheEntry {
    CacheHit hit;
    Bytes data;
};

// Server-side handle for one in-progress store.
struct CacheReservation {
    std::int64_t id = 0;
    std::string key;
    std::string version;
};

// Keys must be non-empty, at most kMaxKeyLength bytes, and free of ','
// (the lookup delimiter). Violations are TransportError{InvalidRequest}.
Status validate_key(const std::string& key);

} // namespace ghcache
