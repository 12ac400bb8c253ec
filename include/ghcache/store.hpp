#pragma once

#include <ghcache/api_session.hpp>
#include <ghcache/types.hpp>
#include <string>

namespace ghcache {

// Write side of the cache protocol: reserve -> upload -> finalize.
//
// The phases run strictly in order and the first failure aborts the store.
// A reservation left behind by a failed upload or finalize is not cleaned
// up; the service owns its lifecycle.
class StoreProtocol {
public:
    explicit StoreProtocol(const ApiSession& session) : session_(session) {}

    // Ok only once finalize has succeeded. An empty payload skips the upload
    // and finalizes with size 0.
    Status put_bytes(const std::string& key_space,
                     const std::string& key,
                     Bytes data) const;

    // POST /caches {key, version}
    Result<CacheReservation> reserve(const std::string& key_space,
                                     const std::string& key) const;

    // PATCH /caches/<id>, whole payload in one request. An empty payload is
    // rejected; such an entry goes straight to finalize.
    Status upload(const CacheReservation& reservation, Bytes data) const;

    // POST /caches/<id> {size}
    Status finalize(const CacheReservation& reservation, std::uint64_t size) const;

private:
    std::string cache_url(const CacheReservation& reservation) const;

    const ApiSession& session_;
};

// "bytes 0-<size-1>/*"; size must be non-zero.
std::string content_range(std::uint64_t size);

} // namespace ghcache
