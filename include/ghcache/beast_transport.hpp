#pragma once

#include <ghcache/http.hpp>
#include <cstddef>
#include <memory>
#include <string>

namespace ghcache {

struct TransportOptions {
    std::string user_agent;
    int max_redirects = 10;             // GET only
    std::size_t max_idle_per_origin = 8;
    bool verify_peer = true;
    std::string ca_file;                // extra trust anchors; empty = system store
};

// HttpTransport over Boost.Beast with a keep-alive connection pool.
//
// Connections are pooled per origin and handed to one request at a time, so
// a single instance can serve many threads. There are no timeouts; callers
// that need a deadline must impose it themselves.
class BeastTransport : public HttpTransport {
public:
    static Result<std::shared_ptr<BeastTransport>> create(TransportOptions options);

    ~BeastTransport() override;
    BeastTransport(const BeastTransport&) = delete;
    BeastTransport& operator=(const BeastTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;

    // Idle pooled connections across all origins
    std::size_t idle_connections() const;

private:
    struct Impl;
    explicit BeastTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace ghcache
