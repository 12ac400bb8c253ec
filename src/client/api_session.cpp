#include <ghcache/api_session.hpp>
#include <ghcache/log.hpp>

namespace ghcache {

ApiSession::ApiSession(ClientConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)),
      api_root_(config_.endpoint() + "/_apis/artifactcache"),
      transport_(std::move(transport)) {}

std::string ApiSession::api_url(const std::string& path) const {
    return api_root_ + path;
}

HttpRequest ApiSession::authorize(HttpRequest request) const {
    set_header(request.headers, "Authorization", "Bearer " + config_.token());
    set_header(request.headers, "Accept", kApiAccept);
    return request;
}

Result<HttpResponse> ApiSession::send_api(HttpRequest request) const {
    HttpRequest authed = authorize(std::move(request));
    return send(authed, authed.url);
}

Result<HttpResponse> ApiSession::send_plain(const HttpRequest& request) const {
    // Pre-signed URLs carry their signature in the query string.
    return send(request, request.url.substr(0, request.url.find('?')));
}

Result<HttpResponse> ApiSession::send(const HttpRequest& request,
                                      const std::string& log_url) const {
    auto response = transport_->send(request);
    if (response.is_err()) {
        log::debug("%s %s failed: %s", method_name(request.method),
                   log_url.c_str(), response.error().message().c_str());
        return response;
    }

    const auto& r = response.value();
    log::debug("%s %s -> %d", method_name(request.method), log_url.c_str(), r.status);
    if (log::enabled(log::Trace)) {
        for (const auto& [name, value] : r.headers) {
            log::trace("  %s: %s", name.c_str(), value.c_str());
        }
    }
    return response;
}

} // namespace ghcache
