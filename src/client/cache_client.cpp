#include <ghcache/cache_client.hpp>
#include <ghcache/beast_transport.hpp>
#include <ghcache/lookup.hpp>
#include <ghcache/store.hpp>

namespace ghcache {

Result<CacheClient> CacheClient::create(ClientConfig config) {
    TransportOptions options;
    options.user_agent = config.label();

    auto transport = BeastTransport::create(std::move(options));
    GHCACHE_TRY(transport);

    return Result<CacheClient>::ok(
        CacheClient(std::move(config), std::move(transport).value()));
}

CacheClient::CacheClient(ClientConfig config, std::shared_ptr<HttpTransport> transport)
    : session_(std::move(config), std::move(transport)) {}

Result<std::optional<CacheLookup>> CacheClient::get_url(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const {
    return LookupProtocol(session_).get_url(key_space, key_prefixes);
}

Result<std::optional<CacheEntry>> CacheClient::get_bytes(
        const std::string& key_space,
        const std::vector<std::string>& key_prefixes) const {
    return LookupProtocol(session_).get_bytes(key_space, key_prefixes);
}

Status CacheClient::put_bytes(const std::string& key_space,
                              const std::string& key,
                              Bytes data) const {
    return StoreProtocol(session_).put_bytes(key_space, key, std::move(data));
}

} // namespace ghcache
