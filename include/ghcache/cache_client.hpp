#pragma once

#include <ghcache/api_session.hpp>
#include <ghcache/config.hpp>
#include <ghcache/http.hpp>
#include <ghcache/types.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ghcache {

// Client for the build-pipeline artifact cache.
//
// Holds a validated configuration and one pooled transport; nothing else is
// mutable, so one instance can be shared by concurrent operations. Errors are
// returned, never retried: on RateLimited the caller decides when to retry.
class CacheClient {
public:
    // Uses a BeastTransport whose User-Agent is the configured label.
    static Result<CacheClient> create(ClientConfig config);

    CacheClient(ClientConfig config, std::shared_ptr<HttpTransport> transport);

    // Looks up the entry matching `key_prefixes` (in order of preference)
    // within `key_space`, which must match exactly. nullopt on a miss.
    Result<std::optional<CacheLookup>> get_url(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const;

    // As get_url(), then downloads the entry.
    Result<std::optional<CacheEntry>> get_bytes(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const;

    // Stores `data` under `key` in `key_space`.
    Status put_bytes(const std::string& key_space,
                     const std::string& key,
                     Bytes data) const;

    const ClientConfig& config() const { return session_.config(); }

private:
    ApiSession session_;
};

} // namespace ghcache
