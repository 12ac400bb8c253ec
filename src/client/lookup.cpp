#include <ghcache/lookup.hpp>
#include <ghcache/classify.hpp>
#include <ghcache/log.hpp>
#include "wire.hpp"

namespace ghcache {

static std::string join_prefixes(const std::vector<std::string>& prefixes) {
    std::string out;
    for (size_t i = 0; i < prefixes.size(); ++i) {
        if (i > 0) out += ',';
        out += prefixes[i];
    }
    return out;
}

Result<std::optional<CacheLookup>> LookupProtocol::get_url(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const {
    using R = Result<std::optional<CacheLookup>>;

    if (key_prefixes.empty()) {
        return CacheError{TransportError{TransportError::InvalidRequest, 0,
                                         "lookup needs at least one key prefix"}};
    }
    for (const auto& prefix : key_prefixes) {
        GHCACHE_TRY(validate_key(prefix));
    }

    // Order matters: it is the precedence the server applies.
    std::string keys = join_prefixes(key_prefixes);
    HttpRequest request(Method::Get, with_query(session_.api_url("/cache"),
                                                {{"keys", keys}, {"version", key_space}}));

    auto sent = session_.send_api(std::move(request));
    if (sent.is_err()) return std::move(sent).error();

    if (sent.value().status == 204) {
        log::debug("cache miss for [%s]", keys.c_str());
        return R::ok(std::nullopt);
    }

    auto response = classify_response(std::move(sent).value());
    if (response.is_err()) return std::move(response).error();

    auto doc = wire::parse_object(response.value(), "cache lookup");
    GHCACHE_TRY(doc);

    auto key = wire::string_field(doc.value(), "cacheKey", "cache lookup");
    GHCACHE_TRY(key);
    auto scope = wire::string_field(doc.value(), "scope", "cache lookup");
    GHCACHE_TRY(scope);
    auto location = wire::string_field(doc.value(), "archiveLocation", "cache lookup");
    GHCACHE_TRY(location);

    log::debug("cache hit: %s (scope %s)", key.value().c_str(), scope.value().c_str());

    CacheLookup found;
    found.hit.key = std::move(key).value();
    found.hit.scope = std::move(scope).value();
    found.archive_location = std::move(location).value();
    return R::ok(std::move(found));
}

Result<std::optional<CacheEntry>> LookupProtocol::get_bytes(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const {
    using R = Result<std::optional<CacheEntry>>;

    auto found = get_url(key_space, key_prefixes);
    GHCACHE_TRY(found);
    if (!found.value().has_value()) {
        return R::ok(std::nullopt);
    }

    CacheLookup lookup = std::move(*found.value());

    // The archive location is pre-signed; it must not see our bearer token.
    auto downloaded = session_.send_plain(HttpRequest(Method::Get, lookup.archive_location));
    if (downloaded.is_err()) return std::move(downloaded).error();

    // Archives can be large; move instead of letting GHCACHE_TRY copy them.
    auto response = classify_response(std::move(downloaded).value());
    if (response.is_err()) return std::move(response).error();

    const std::string& body = response.value().body;
    log::debug("downloaded %zu bytes for %s", body.size(), lookup.hit.key.c_str());

    CacheEntry entry;
    entry.hit = std::move(lookup.hit);
    entry.data.assign(body.begin(), body.end());
    return R::ok(std::move(entry));
}

} // namespace ghcache
