#pragma once

#include <ghcache/api_session.hpp>
#include <ghcache/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ghcache {

// Read side of the cache protocol.
//
// Which entry matches is decided by the server: an exact match of the first
// prefix wins, then the newest entry matching a prefix, trying prefixes in
// the order given. The client passes the prefixes through unchanged.
class LookupProtocol {
public:
    explicit LookupProtocol(const ApiSession& session) : session_(session) {}

    // GET /cache?keys=<p1,p2,...>&version=<key_space>
    // nullopt on 204 (no match). Empty or invalid prefixes are rejected
    // without sending anything.
    Result<std::optional<CacheLookup>> get_url(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const;

    // get_url() followed by an unauthenticated download of the archive.
    Result<std::optional<CacheEntry>> get_bytes(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const;

private:
    const ApiSession& session_;
};

} // namespace ghcache
