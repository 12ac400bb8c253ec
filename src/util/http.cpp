#include <ghcache/http.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ghcache {

const char* method_name(Method m) {
    switch (m) {
        case Method::Get:   return "GET";
        case Method::Post:  return "POST";
        case Method::Patch: return "PATCH";
    }
    return "GET";
}

static bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

std::optional<std::string> find_header(const Headers& headers, const std::string& name) {
    for (const auto& [k, v] : headers) {
        if (iequals(k, name)) return v;
    }
    return std::nullopt;
}

void remove_header(Headers& headers, const std::string& name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                      [&](const auto& h) { return iequals(h.first, name); }),
                  headers.end());
}

void set_header(Headers& headers, const std::string& name, std::string value) {
    remove_header(headers, name);
    headers.emplace_back(name, std::move(value));
}

std::string Url::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

static TransportError invalid_url(const std::string& url, const std::string& why) {
    return TransportError{TransportError::InvalidRequest, 0,
        "invalid URL '" + url + "': " + why};
}

Result<Url> parse_url(const std::string& url) {
    Url out;

    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return CacheError{invalid_url(url, "missing scheme")};
    }
    for (size_t i = 0; i < scheme_end; ++i) {
        out.scheme.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(url[i]))));
    }
    if (out.scheme != "http" && out.scheme != "https") {
        return CacheError{invalid_url(url, "unsupported scheme '" + out.scheme + "'")};
    }

    size_t auth_start = scheme_end + 3;
    size_t auth_end = url.find_first_of("/?#", auth_start);
    std::string authority = url.substr(auth_start,
        auth_end == std::string::npos ? std::string::npos : auth_end - auth_start);

    // Userinfo is never used by this service; drop it rather than send it.
    if (auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_str;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return CacheError{invalid_url(url, "unterminated IPv6 literal")};
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return CacheError{invalid_url(url, "garbage after IPv6 literal")};
            }
            port_str = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            out.host = authority.substr(0, colon);
            port_str = authority.substr(colon + 1);
        } else {
            out.host = authority;
        }
    }

    if (out.host.empty()) {
        return CacheError{invalid_url(url, "missing host")};
    }

    if (port_str.empty()) {
        out.port = out.is_tls() ? 443 : 80;
    } else {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(),
                                         port_str.data() + port_str.size(), value);
        if (ec != std::errc() || ptr != port_str.data() + port_str.size() ||
            value == 0 || value > 65535) {
            return CacheError{invalid_url(url, "bad port '" + port_str + "'")};
        }
        out.port = static_cast<std::uint16_t>(value);
    }

    if (auth_end == std::string::npos) {
        out.target = "/";
    } else {
        out.target = url.substr(auth_end);
        // The fragment is client-side only.
        if (auto hash = out.target.find('#'); hash != std::string::npos) {
            out.target.erase(hash);
        }
        if (out.target.empty() || out.target.front() != '/') {
            out.target.insert(out.target.begin(), '/');
        }
    }

    return Result<Url>::ok(std::move(out));
}

Result<std::string> resolve_location(const Url& base, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        GHCACHE_TRY(parse_url(location));
        return Result<std::string>::ok(location);
    }

    bool default_port = (base.is_tls() && base.port == 443) ||
                        (!base.is_tls() && base.port == 80);
    std::string host = base.host.find(':') != std::string::npos
        ? "[" + base.host + "]" : base.host;
    std::string prefix = base.scheme + "://" + host;
    if (!default_port) prefix += ":" + std::to_string(base.port);

    if (location.rfind("//", 0) == 0) {
        return Result<std::string>::ok(base.scheme + ":" + location);
    }
    if (!location.empty() && location.front() == '/') {
        return Result<std::string>::ok(prefix + location);
    }

    // Relative path: replace the last segment of the base path.
    std::string path = base.target.substr(0, base.target.find('?'));
    path = path.substr(0, path.rfind('/') + 1);
    return Result<std::string>::ok(prefix + path + location);
}

std::string url_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string with_query(const std::string& url,
                       const std::vector<std::pair<std::string, std::string>>& params) {
    std::string out = url;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [k, v] : params) {
        out += sep;
        out += url_encode(k);
        out += '=';
        out += url_encode(v);
        sep = '&';
    }
    return out;
}

} // namespace ghcache
