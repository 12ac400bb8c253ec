#include <catch2/catch.hpp>
#include <ghcache/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>

#include <unistd.h>

using namespace ghcache::log;

// Helper: capture stderr output from a callable
static std::string capture_stderr(std::function<void()> fn) {
    std::fflush(stderr);
    int saved_stderr = dup(fileno(stderr));

    int pipefd[2];
    REQUIRE(pipe(pipefd) == 0);
    dup2(pipefd[1], fileno(stderr));
    close(pipefd[1]);

    fn();

    std::fflush(stderr);
    dup2(saved_stderr, fileno(stderr));
    close(saved_stderr);

    std::string output;
    char buf[1024];
    ssize_t n;
    while ((n = read(pipefd[0], buf, sizeof(buf))) > 0) {
        output.append(buf, static_cast<size_t>(n));
    }
    close(pipefd[0]);
    return output;
}

TEST_CASE("set_level / get_level roundtrip", "[log]") {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Off}) {
        set_level(lvl);
        REQUIRE(get_level() == lvl);
    }
    set_level(Info);
}

TEST_CASE("parse_level accepts names in any case", "[log]") {
    REQUIRE(parse_level("trace") == Trace);
    REQUIRE(parse_level("DEBUG") == Debug);
    REQUIRE(parse_level("Info") == Info);
    REQUIRE(parse_level("warning") == Warn);
    REQUIRE(parse_level("error") == Error);
    REQUIRE(parse_level("off") == Off);
    REQUIRE_FALSE(parse_level("verbose").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("init_from_env applies a valid level only", "[log]") {
    set_level(Info);

    setenv("GHCACHE_TEST_LOG", "debug", 1);
    REQUIRE(init_from_env("GHCACHE_TEST_LOG"));
    REQUIRE(get_level() == Debug);

    setenv("GHCACHE_TEST_LOG", "chatty", 1);
    REQUIRE_FALSE(init_from_env("GHCACHE_TEST_LOG"));
    REQUIRE(get_level() == Debug);

    unsetenv("GHCACHE_TEST_LOG");
    REQUIRE_FALSE(init_from_env("GHCACHE_TEST_LOG"));

    set_level(Info);
}

TEST_CASE("Messages below threshold are suppressed", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { info("should not appear"); });
    REQUIRE(output.empty());

    set_level(Info);
}

TEST_CASE("Off silences everything", "[log]") {
    set_level(Off);
    set_color_enabled(false);

    auto output = capture_stderr([] { error("should not appear"); });
    REQUIRE(output.empty());
    REQUIRE_FALSE(enabled(Error));

    set_level(Info);
}

TEST_CASE("Messages at threshold are emitted with prefix", "[log]") {
    set_level(Warn);
    set_color_enabled(false);

    auto output = capture_stderr([] { warn("cache id %d left unfinalized", 12); });
    REQUIRE(output == "warn ghcache: cache id 12 left unfinalized\n");

    set_level(Info);
}

TEST_CASE("Long messages are not truncated", "[log]") {
    set_level(Info);
    set_color_enabled(false);

    std::string big(5000, 'x');
    auto output = capture_stderr([&] { info("%s", big.c_str()); });
    REQUIRE(output.find(big) != std::string::npos);
}

TEST_CASE("Color codes when enabled", "[log]") {
    set_level(Info);
    set_color_enabled(true);

    auto output = capture_stderr([] { error("boom"); });
    REQUIRE(output.find("\033[31merror\033[0m") != std::string::npos);

    set_color_enabled(false);
}
