#include <ghcache/beast_transport.hpp>
#include <ghcache/log.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <mutex>
#include <unordered_map>
#include <vector>

namespace ghcache {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

struct Connection {
    std::string origin;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
    beast::flat_buffer buffer;

    template<typename F>
    auto with_stream(F&& f) {
        if (tls) return f(*tls);
        return f(*plain);
    }
};

CacheError network_error(const std::string& what, const beast::error_code& ec) {
    return CacheError{TransportError{TransportError::Network, 0,
                                     what + ": " + ec.message()}};
}

http::verb to_verb(Method m) {
    switch (m) {
        case Method::Get:   return http::verb::get;
        case Method::Post:  return http::verb::post;
        case Method::Patch: return http::verb::patch;
    }
    return http::verb::get;
}

std::string host_header(const Url& url) {
    std::string host = url.host.find(':') != std::string::npos
        ? "[" + url.host + "]" : url.host;
    bool default_port = (url.is_tls() && url.port == 443) ||
                        (!url.is_tls() && url.port == 80);
    if (!default_port) host += ":" + std::to_string(url.port);
    return host;
}

bool is_redirect(int status) {
    return status == 301 || status == 302 || status == 303 ||
           status == 307 || status == 308;
}

} // namespace

struct BeastTransport::Impl {
    TransportOptions options;
    net::io_context ioc;
    ssl::context tls_ctx{ssl::context::tls_client};

    mutable std::mutex mutex;
    std::unordered_map<std::string, std::vector<std::unique_ptr<Connection>>> idle;

    std::unique_ptr<Connection> take_idle(const std::string& origin);
    void release(std::unique_ptr<Connection> conn);
    Result<std::unique_ptr<Connection>> connect(const Url& url);

    // `stale` is set when the pooled connection turned out to be closed by
    // the peer: the write failed, or, for GET only, the connection ended
    // before any response byte. A POST or PATCH that was written is never
    // stale.
    Result<HttpResponse> exchange(Connection& conn, const Url& url,
                                  const HttpRequest& request,
                                  bool& keep_alive, bool& stale);

    Result<HttpResponse> send_once(const Url& url, const HttpRequest& request);
};

std::unique_ptr<Connection> BeastTransport::Impl::take_idle(const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = idle.find(origin);
    if (it == idle.end() || it->second.empty()) return nullptr;
    auto conn = std::move(it->second.back());
    it->second.pop_back();
    return conn;
}

void BeastTransport::Impl::release(std::unique_ptr<Connection> conn) {
    conn->buffer.clear();
    std::lock_guard<std::mutex> lock(mutex);
    auto& pool = idle[conn->origin];
    if (pool.size() < options.max_idle_per_origin) {
        pool.push_back(std::move(conn));
    }
}

Result<std::unique_ptr<Connection>> BeastTransport::Impl::connect(const Url& url) {
    using R = Result<std::unique_ptr<Connection>>;
    beast::error_code ec;

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(url.host, std::to_string(url.port), ec);
    if (ec) return network_error("resolve " + url.host, ec);

    auto conn = std::make_unique<Connection>();
    conn->origin = url.origin();

    if (!url.is_tls()) {
        conn->plain = std::make_unique<beast::tcp_stream>(ioc);
        conn->plain->connect(endpoints, ec);
        if (ec) return network_error("connect " + url.origin(), ec);
        log::trace("connected to %s", conn->origin.c_str());
        return R::ok(std::move(conn));
    }

    try {
        conn->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc, tls_ctx);
    } catch (const boost::system::system_error& e) {
        return network_error("create TLS stream", e.code());
    }

    // SNI
    if (!SSL_set_tlsext_host_name(conn->tls->native_handle(), url.host.c_str())) {
        ec.assign(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return network_error("set TLS server name", ec);
    }
    if (options.verify_peer) {
        conn->tls->set_verify_mode(ssl::verify_peer);
        conn->tls->set_verify_callback(ssl::host_name_verification(url.host));
    } else {
        conn->tls->set_verify_mode(ssl::verify_none);
    }

    beast::get_lowest_layer(*conn->tls).connect(endpoints, ec);
    if (ec) return network_error("connect " + url.origin(), ec);

    conn->tls->handshake(ssl::stream_base::client, ec);
    if (ec) return network_error("TLS handshake with " + url.host, ec);

    log::trace("connected to %s (TLS)", conn->origin.c_str());
    return R::ok(std::move(conn));
}

Result<HttpResponse> BeastTransport::Impl::exchange(Connection& conn, const Url& url,
                                                    const HttpRequest& request,
                                                    bool& keep_alive, bool& stale) {
    keep_alive = false;
    stale = false;

    // Body is referenced in place, not copied.
    http::request<http::span_body<char const>> req{to_verb(request.method), url.target, 11};
    req.set(http::field::host, host_header(url));
    if (!options.user_agent.empty()) {
        req.set(http::field::user_agent, options.user_agent);
    }
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    req.body() = beast::span<char const>(request.body.data(), request.body.size());
    req.keep_alive(true);
    req.prepare_payload();

    beast::error_code ec;
    conn.with_stream([&](auto& stream) { http::write(stream, req, ec); });
    if (ec) {
        stale = true;
        return network_error(std::string(method_name(request.method)) + " " +
                             url.origin() + " write", ec);
    }

    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);
    conn.with_stream([&](auto& stream) { http::read(stream, conn.buffer, parser, ec); });
    if (ec) {
        stale = request.method == Method::Get && !parser.got_some() &&
                (ec == http::error::end_of_stream || ec == net::error::connection_reset);
        return network_error(std::string(method_name(request.method)) + " " +
                             url.origin() + " read", ec);
    }

    auto res = parser.release();
    keep_alive = res.keep_alive() && !res.need_eof();

    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.reason = std::string(res.reason());
    for (const auto& field : res) {
        out.headers.emplace_back(std::string(field.name_string()),
                                 std::string(field.value()));
    }
    out.body = std::move(res.body());
    return Result<HttpResponse>::ok(std::move(out));
}

Result<HttpResponse> BeastTransport::Impl::send_once(const Url& url,
                                                     const HttpRequest& request) {
    std::unique_ptr<Connection> conn = take_idle(url.origin());
    bool reused = conn != nullptr;
    if (!conn) {
        auto fresh = connect(url);
        if (fresh.is_err()) return std::move(fresh).error();
        conn = std::move(fresh).value();
    }

    bool keep_alive = false;
    bool stale = false;
    auto response = exchange(*conn, url, request, keep_alive, stale);

    // An idle connection the server already closed: the request is sent once
    // more on a new connection.
    if (response.is_err() && reused && stale) {
        log::trace("pooled connection to %s was closed, reconnecting",
                   url.origin().c_str());
        auto fresh = connect(url);
        if (fresh.is_err()) return std::move(fresh).error();
        conn = std::move(fresh).value();
        response = exchange(*conn, url, request, keep_alive, stale);
    }

    if (response.is_ok() && keep_alive) {
        release(std::move(conn));
    }
    return response;
}

BeastTransport::BeastTransport(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

BeastTransport::~BeastTransport() = default;

Result<std::shared_ptr<BeastTransport>> BeastTransport::create(TransportOptions options) {
    std::unique_ptr<Impl> impl;
    try {
        impl = std::make_unique<Impl>();
    } catch (const boost::system::system_error& e) {
        return network_error("initialize TLS context", e.code());
    }
    impl->options = std::move(options);

    beast::error_code ec;
    impl->tls_ctx.set_default_verify_paths(ec);
    if (ec) return network_error("load system trust store", ec);
    if (!impl->options.ca_file.empty()) {
        impl->tls_ctx.load_verify_file(impl->options.ca_file, ec);
        if (ec) return network_error("load CA file " + impl->options.ca_file, ec);
    }

    return Result<std::shared_ptr<BeastTransport>>::ok(
        std::shared_ptr<BeastTransport>(new BeastTransport(std::move(impl))));
}

Result<HttpResponse> BeastTransport::send(const HttpRequest& request) {
    auto parsed = parse_url(request.url);
    GHCACHE_TRY(parsed);
    Url url = std::move(parsed).value();

    auto response = impl_->send_once(url, request);
    if (request.method != Method::Get) return response;

    const std::string first_origin = url.origin();
    HttpRequest current = request;
    for (int hop = 0;; ++hop) {
        if (response.is_err()) return response;

        const HttpResponse& r = response.value();
        if (!is_redirect(r.status)) return response;
        auto location = r.header("Location");
        if (!location) return response;

        if (hop >= impl_->options.max_redirects) {
            return CacheError{TransportError{TransportError::Network, r.status,
                "too many redirects fetching " + request.url.substr(0, request.url.find('?'))}};
        }

        auto next = resolve_location(url, *location);
        GHCACHE_TRY(next);
        current.url = next.value();
        auto next_url = parse_url(current.url);
        GHCACHE_TRY(next_url);
        url = std::move(next_url).value();

        if (url.origin() != first_origin) {
            remove_header(current.headers, "Authorization");
        }
        log::trace("following redirect (%d)", r.status);
        response = impl_->send_once(url, current);
    }
}

std::size_t BeastTransport::idle_connections() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::size_t total = 0;
    for (const auto& [origin, pool] : impl_->idle) {
        total += pool.size();
    }
    return total;
}

} // namespace ghcache
