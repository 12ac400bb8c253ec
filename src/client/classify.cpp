#include <ghcache/classify.hpp>
#include <ghcache/log.hpp>

#include <charconv>

namespace ghcache {

std::optional<std::uint64_t> parse_retry_after(const std::string& value) {
    if (value.empty()) return std::nullopt;

    std::uint64_t seconds = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return seconds;
}

static std::string describe(const HttpResponse& response) {
    std::string msg = "HTTP status " + std::to_string(response.status);
    if (!response.reason.empty()) {
        msg += " " + response.reason;
    }
    // Error bodies are usually a short JSON message; keep enough to debug.
    if (!response.body.empty()) {
        constexpr size_t kMaxBody = 512;
        msg += ": ";
        msg += response.body.substr(0, kMaxBody);
        if (response.body.size() > kMaxBody) msg += "...";
    }
    return msg;
}

Result<HttpResponse> classify_response(HttpResponse response) {
    if (response.is_success()) {
        return Result<HttpResponse>::ok(std::move(response));
    }

    // Rate-limit detection is kept on purpose: the service signals throttling
    // with an error status plus Retry-After, on any endpoint, and callers need
    // the wait time to schedule their own retry.
    if (response.is_client_error() || response.is_server_error()) {
        if (auto retry = response.header("Retry-After")) {
            if (auto seconds = parse_retry_after(*retry)) {
                log::debug("rate limited (HTTP %d), retry after %llu s",
                           response.status,
                           static_cast<unsigned long long>(*seconds));
                return CacheError{RateLimited{*seconds, response.status,
                                              describe(response)}};
            }
        }
    }

    return CacheError{TransportError{TransportError::Status, response.status,
                                     describe(response)}};
}

} // namespace ghcache
