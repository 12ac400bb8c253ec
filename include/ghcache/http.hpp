#pragma once

#include <ghcache/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ghcache {

enum class Method { Get, Post, Patch };

const char* method_name(Method m);

using Headers = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive header lookup; returns the first match.
std::optional<std::string> find_header(const Headers& headers, const std::string& name);

// Replaces every existing value of `name` (case-insensitive) with one value.
void set_header(Headers& headers, const std::string& name, std::string value);

void remove_header(Headers& headers, const std::string& name);

struct HttpRequest {
    Method method = Method::Get;
    std::string url;
    Headers headers;
    std::string body;

    HttpRequest() = default;
    HttpRequest(Method m, std::string u) : method(m), url(std::move(u)) {}

    std::optional<std::string> header(const std::string& name) const {
        return find_header(headers, name);
    }
};

struct HttpResponse {
    int status = 0;
    std::string reason;
    Headers headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const {
        return find_header(headers, name);
    }

    bool is_success() const { return status >= 200 && status < 300; }
    bool is_client_error() const { return status >= 400 && status < 500; }
    bool is_server_error() const { return status >= 500 && status < 600; }
};

// Absolute http(s) URL split into the parts a connection needs.
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port = 0;
    std::string target;   // path + query, always starts with '/'

    bool is_tls() const { return scheme == "https"; }
    // scheme://host:port, the connection-pool key
    std::string origin() const;
};

Result<Url> parse_url(const std::string& url);

// Resolves a Location header against the URL it was returned for.
Result<std::string> resolve_location(const Url& base, const std::string& location);

// RFC 3986 percent-encoding of everything except unreserved characters.
std::string url_encode(const std::string& value);

// Appends `?k=v&...` (or `&k=v...` when a query is present) with encoded values.
std::string with_query(const std::string& url,
                       const std::vector<std::pair<std::string, std::string>>& params);

// Sends one request and returns the response, whatever its status.
// Implementations must be safe to call from several threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

} // namespace ghcache
