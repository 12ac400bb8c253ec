#pragma once

#include <ghcache/config.hpp>
#include <ghcache/http.hpp>
#include <memory>
#include <string>

namespace ghcache {

inline constexpr char kApiAccept[] = "application/json;api-version=6.0-preview.1";

// Binds a ClientConfig to a transport and knows how to address and
// authenticate requests against the artifact-cache API.
class ApiSession {
public:
    ApiSession(ClientConfig config, std::shared_ptr<HttpTransport> transport);

    // <endpoint>/_apis/artifactcache<path>
    std::string api_url(const std::string& path) const;

    // Adds bearer authorization and the versioned JSON accept header.
    HttpRequest authorize(HttpRequest request) const;

    // authorize() + send
    Result<HttpResponse> send_api(HttpRequest request) const;

    // Send as-is, for pre-signed URLs that carry their own credentials
    Result<HttpResponse> send_plain(const HttpRequest& request) const;

    const ClientConfig& config() const { return config_; }

private:
    Result<HttpResponse> send(const HttpRequest& request,
                              const std::string& log_url) const;

    ClientConfig config_;
    std::string api_root_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace ghcache
