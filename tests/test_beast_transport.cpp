#include <catch2/catch.hpp>
#include <ghcache/beast_transport.hpp>
#include <ghcache/classify.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <thread>

using namespace ghcache;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

using ServerRequest = http::request<http::string_body>;
using ServerResponse = http::response<http::string_body>;

// Single-threaded HTTP/1.1 server on 127.0.0.1 serving one connection at a
// time. `close_after` in the handler drops the connection after replying
// even though the response advertised keep-alive. Requests matching
// `hang_up` are recorded and the connection is closed without a reply.
class LoopbackServer {
public:
    using Handler = std::function<void(const ServerRequest&, ServerResponse&, bool& close_after)>;
    using HangUp = std::function<bool(const ServerRequest&)>;

    explicit LoopbackServer(Handler handler, HangUp hang_up = nullptr)
        : handler_(std::move(handler)),
          hang_up_(std::move(hang_up)),
          acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this] { run(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        // Unblock accept()
        beast::error_code ec;
        tcp::socket poke(ioc_);
        poke.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
        thread_.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    int connections() const { return connections_; }

    std::vector<ServerRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    void run() {
        while (!stop_) {
            beast::error_code ec;
            tcp::socket socket(ioc_);
            acceptor_.accept(socket, ec);
            if (ec || stop_) break;
            ++connections_;

            beast::flat_buffer buffer;
            for (;;) {
                ServerRequest req;
                http::read(socket, buffer, req, ec);
                if (ec) break;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    requests_.push_back(req);
                }
                if (hang_up_ && hang_up_(req)) break;

                ServerResponse res{http::status::ok, req.version()};
                res.keep_alive(req.keep_alive());
                bool close_after = false;
                handler_(req, res, close_after);
                res.prepare_payload();

                http::write(socket, res, ec);
                if (ec || close_after || !res.keep_alive()) break;
            }
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    }

    Handler handler_;
    HangUp hang_up_;
    net::io_context ioc_;
    tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::thread thread_;
    std::atomic<bool> stop_{false};
    std::atomic<int> connections_{0};
    mutable std::mutex mutex_;
    std::vector<ServerRequest> requests_;
};

std::shared_ptr<BeastTransport> make_transport() {
    TransportOptions options;
    options.user_agent = "ghcache-tests/1.0";
    return BeastTransport::create(options).value();
}

} // namespace

TEST_CASE("GET round trip with headers", "[beast]") {
    LoopbackServer server([](const ServerRequest& req, ServerResponse& res, bool&) {
        res.set("X-Seen-Agent", std::string(req[http::field::user_agent]));
        res.set("X-Seen-Auth", std::string(req[http::field::authorization]));
        res.set(http::field::content_type, "text/plain");
        res.body() = "pong " + std::string(req.target());
    });
    auto transport = make_transport();

    HttpRequest request(Method::Get, server.url("/ping?x=1"));
    set_header(request.headers, "Authorization", "Bearer abc");

    auto r = transport->send(request);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().status == 200);
    REQUIRE(r.value().body == "pong /ping?x=1");
    REQUIRE(r.value().header("x-seen-agent") == std::string("ghcache-tests/1.0"));
    REQUIRE(r.value().header("X-Seen-Auth") == std::string("Bearer abc"));
}

TEST_CASE("keep-alive connections are reused", "[beast]") {
    LoopbackServer server([](const ServerRequest&, ServerResponse& res, bool&) {
        res.body() = "ok";
    });
    auto transport = make_transport();

    for (int i = 0; i < 3; ++i) {
        auto r = transport->send(HttpRequest(Method::Get, server.url("/")));
        REQUIRE(r.is_ok());
    }
    REQUIRE(server.connections() == 1);
    REQUIRE(transport->idle_connections() == 1);
}

TEST_CASE("Connection: close is not pooled", "[beast]") {
    LoopbackServer server([](const ServerRequest&, ServerResponse& res, bool&) {
        res.keep_alive(false);
        res.body() = "bye";
    });
    auto transport = make_transport();

    REQUIRE(transport->send(HttpRequest(Method::Get, server.url("/"))).is_ok());
    REQUIRE(transport->idle_connections() == 0);
    REQUIRE(transport->send(HttpRequest(Method::Get, server.url("/"))).is_ok());
    REQUIRE(server.connections() == 2);
}

TEST_CASE("connection closed while idle is replaced", "[beast]") {
    LoopbackServer server([](const ServerRequest&, ServerResponse& res, bool& close_after) {
        res.body() = "ok";
        close_after = true;
    });
    auto transport = make_transport();

    REQUIRE(transport->send(HttpRequest(Method::Get, server.url("/a"))).is_ok());
    auto second = transport->send(HttpRequest(Method::Get, server.url("/b")));
    REQUIRE(second.is_ok());
    REQUIRE(second.value().body == "ok");
    REQUIRE(server.connections() == 2);
}

TEST_CASE("POST on a pooled connection closed after the write is not resent", "[beast]") {
    LoopbackServer server(
        [](const ServerRequest&, ServerResponse& res, bool&) { res.body() = "warm"; },
        [](const ServerRequest& req) { return req.method() == http::verb::post; });
    auto transport = make_transport();

    REQUIRE(transport->send(HttpRequest(Method::Get, server.url("/warm"))).is_ok());
    REQUIRE(transport->idle_connections() == 1);

    HttpRequest reserve(Method::Post, server.url("/caches"));
    reserve.body = R"({"key":"k","version":"v1"})";
    auto r = transport->send(reserve);
    REQUIRE(r.is_err());
    REQUIRE(r.error().get_if<TransportError>()->kind == TransportError::Network);

    std::size_t posts = 0;
    for (const auto& req : server.requests()) {
        if (req.method() == http::verb::post) ++posts;
    }
    REQUIRE(posts == 1);
    REQUIRE(server.connections() == 1);
    REQUIRE(transport->idle_connections() == 0);
}

TEST_CASE("GET on a pooled connection closed before the reply is resent once", "[beast]") {
    std::atomic<int> gets{0};
    LoopbackServer server(
        [](const ServerRequest&, ServerResponse& res, bool&) { res.body() = "ok"; },
        [&gets](const ServerRequest& req) { return req.target() == "/gone" && gets++ == 0; });
    auto transport = make_transport();

    REQUIRE(transport->send(HttpRequest(Method::Get, server.url("/warm"))).is_ok());
    auto r = transport->send(HttpRequest(Method::Get, server.url("/gone")));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().body == "ok");
    REQUIRE(server.connections() == 2);
}

TEST_CASE("PATCH sends the body and headers intact", "[beast]") {
    LoopbackServer server([](const ServerRequest&, ServerResponse& res, bool&) {
        res.result(http::status::no_content);
    });
    auto transport = make_transport();

    HttpRequest request(Method::Patch, server.url("/caches/42"));
    request.body = std::string("\x00\x01\x02\xff", 4);
    set_header(request.headers, "Content-Range", "bytes 0-3/*");
    set_header(request.headers, "Content-Type", "application/octet-stream");

    auto r = transport->send(request);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().status == 204);
    REQUIRE(r.value().body.empty());

    auto seen = server.requests();
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].method() == http::verb::patch);
    REQUIRE(seen[0].target() == "/caches/42");
    REQUIRE(seen[0].body() == std::string("\x00\x01\x02\xff", 4));
    REQUIRE(seen[0][http::field::content_range] == "bytes 0-3/*");
    REQUIRE(seen[0][http::field::content_length] == "4");
}

TEST_CASE("error statuses and Retry-After are returned, not interpreted", "[beast]") {
    LoopbackServer server([](const ServerRequest&, ServerResponse& res, bool&) {
        res.result(http::status::too_many_requests);
        res.set(http::field::retry_after, "7");
    });
    auto transport = make_transport();

    auto r = transport->send(HttpRequest(Method::Post, server.url("/caches")));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().status == 429);

    auto classified = classify_response(std::move(r).value());
    REQUIRE(classified.error().retry_after() == 7u);
}

TEST_CASE("GET follows redirects, POST does not", "[beast]") {
    LoopbackServer server([](const ServerRequest& req, ServerResponse& res, bool&) {
        if (req.target() == "/old") {
            res.result(http::status::found);
            res.set(http::field::location, "/new");
        } else {
            res.body() = "moved here";
        }
    });
    auto transport = make_transport();

    auto get = transport->send(HttpRequest(Method::Get, server.url("/old")));
    REQUIRE(get.is_ok());
    REQUIRE(get.value().status == 200);
    REQUIRE(get.value().body == "moved here");

    auto post = transport->send(HttpRequest(Method::Post, server.url("/old")));
    REQUIRE(post.is_ok());
    REQUIRE(post.value().status == 302);
}

TEST_CASE("redirect loops stop", "[beast]") {
    LoopbackServer server([](const ServerRequest&, ServerResponse& res, bool&) {
        res.result(http::status::found);
        res.set(http::field::location, "/loop");
    });
    TransportOptions options;
    options.max_redirects = 3;
    auto transport = BeastTransport::create(options).value();

    auto r = transport->send(HttpRequest(Method::Get, server.url("/loop")));
    REQUIRE(r.is_err());
    REQUIRE(r.error().get_if<TransportError>()->kind == TransportError::Network);
    REQUIRE(server.requests().size() == 4);
}

TEST_CASE("large bodies are not limited", "[beast]") {
    const std::string big(9 * 1024 * 1024, 'z');
    LoopbackServer server([&](const ServerRequest&, ServerResponse& res, bool&) {
        res.body() = big;
    });
    auto transport = make_transport();

    auto r = transport->send(HttpRequest(Method::Get, server.url("/archive")));
    REQUIRE(r.is_ok());
    REQUIRE(r.value().body.size() == big.size());
}

TEST_CASE("connection refused is a network error", "[beast]") {
    std::uint16_t port = 0;
    {
        net::io_context ioc;
        tcp::acceptor unused(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = unused.local_endpoint().port();
    }
    auto transport = make_transport();

    auto r = transport->send(HttpRequest(Method::Get,
        "http://127.0.0.1:" + std::to_string(port) + "/"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().get_if<TransportError>()->kind == TransportError::Network);
    REQUIRE(r.error().status() == 0);
}

TEST_CASE("invalid URL is rejected before connecting", "[beast]") {
    auto transport = make_transport();
    auto r = transport->send(HttpRequest(Method::Get, "not a url"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().get_if<TransportError>()->kind == TransportError::InvalidRequest);
}
