#include <ghcache/store.hpp>
#include <ghcache/classify.hpp>
#include <ghcache/log.hpp>
#include "wire.hpp"

namespace ghcache {

std::string content_range(std::uint64_t size) {
    return "bytes 0-" + std::to_string(size - 1) + "/*";
}

std::string StoreProtocol::cache_url(const CacheReservation& reservation) const {
    return session_.api_url("/caches/" + std::to_string(reservation.id));
}

Result<CacheReservation> StoreProtocol::reserve(const std::string& key_space,
                                                const std::string& key) const {
    HttpRequest request(Method::Post, session_.api_url("/caches"));
    wire::set_json_body(request, {{"key", key}, {"version", key_space}});

    auto sent = session_.send_api(std::move(request));
    if (sent.is_err()) return std::move(sent).error();

    auto response = classify_response(std::move(sent).value());
    if (response.is_err()) return std::move(response).error();

    auto doc = wire::parse_object(response.value(), "cache reservation");
    GHCACHE_TRY(doc);
    auto id = wire::integer_field(doc.value(), "cacheId", "cache reservation");
    GHCACHE_TRY(id);

    CacheReservation reservation;
    reservation.id = id.value();
    reservation.key = key;
    reservation.version = key_space;
    log::debug("reserved cache id %lld for %s",
               static_cast<long long>(reservation.id), key.c_str());
    return Result<CacheReservation>::ok(std::move(reservation));
}

Status StoreProtocol::upload(const CacheReservation& reservation, Bytes data) const {
    const std::uint64_t size = data.size();
    if (size == 0) {
        return CacheError{TransportError{TransportError::InvalidRequest, 0,
            "upload to cache id " + std::to_string(reservation.id) +
            " has no data; an empty entry is finalized without uploading"}};
    }

    HttpRequest request(Method::Patch, cache_url(reservation));
    set_header(request.headers, "Content-Range", content_range(size));
    set_header(request.headers, "Content-Type", "application/octet-stream");
    request.body.assign(data.begin(), data.end());
    Bytes().swap(data);  // only the request copy is needed from here on

    auto sent = session_.send_api(std::move(request));
    if (sent.is_err()) return std::move(sent).error();

    auto response = classify_response(std::move(sent).value());
    if (response.is_err()) return std::move(response).error();

    log::debug("uploaded %llu bytes to cache id %lld",
               static_cast<unsigned long long>(size),
               static_cast<long long>(reservation.id));
    return ok_status();
}

Status StoreProtocol::finalize(const CacheReservation& reservation,
                               std::uint64_t size) const {
    HttpRequest request(Method::Post, cache_url(reservation));
    wire::set_json_body(request, {{"size", size}});

    auto sent = session_.send_api(std::move(request));
    if (sent.is_err()) return std::move(sent).error();

    auto response = classify_response(std::move(sent).value());
    if (response.is_err()) return std::move(response).error();

    log::debug("committed cache id %lld (%llu bytes)",
               static_cast<long long>(reservation.id),
               static_cast<unsigned long long>(size));
    return ok_status();
}

Status StoreProtocol::put_bytes(const std::string& key_space,
                                const std::string& key,
                                Bytes data) const {
    GHCACHE_TRY(validate_key(key));

    auto reservation = reserve(key_space, key);
    GHCACHE_TRY(reservation);
    const CacheReservation& r = reservation.value();

    const std::uint64_t size = data.size();

    if (size > 0) {
        auto uploaded = upload(r, std::move(data));
        if (uploaded.is_err()) {
            log::warn("upload for %s failed, cache id %lld left unfinalized",
                      key.c_str(), static_cast<long long>(r.id));
            return std::move(uploaded).error();
        }
    }

    // The declared size must equal what was uploaded (0 when skipped).
    auto finalized = finalize(r, size);
    if (finalized.is_err()) {
        log::warn("finalize for %s failed, cache id %lld left unfinalized",
                  key.c_str(), static_cast<long long>(r.id));
        return std::move(finalized).error();
    }

    log::info("stored %s (%llu bytes)", key.c_str(),
              static_cast<unsigned long long>(size));
    return ok_status();
}

} // namespace ghcache
