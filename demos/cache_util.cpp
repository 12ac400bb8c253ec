// cache_util.cpp
//
// Stores or fetches one entry in the artifact cache, using the same
// configuration a pipeline job would.  Run it with:
//
//     ./cache_util deps-linux-abc123                 # look up, print the entry
//     ./cache_util deps-linux-abc123,deps-linux-     # prefixes, in order
//     ./cache_util deps-linux-abc123 "some bytes"    # store a string
//     ./cache_util deps-linux-abc123 @archive.tar    # store a file
//
// Credentials come from ACTIONS_RUNTIME_TOKEN / ACTIONS_CACHE_URL or from
// ~/.ghcache/config.toml; set GHCACHE_LOG=debug to watch the requests.

#include <ghcache/cache_client.hpp>
#include <ghcache/config.hpp>
#include <ghcache/log.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ghcache;

static const char* kKeySpace =
    "9796546c64ab15ab7468b479f3b3c20d5840af05ac0f999ad7a089512d01572e";

struct Args {
    std::string config_path;
    std::string key_space = kKeySpace;
    std::vector<std::string> keys;
    std::optional<std::string> data;
};

static std::vector<std::string> split_keys(const std::string& raw) {
    std::vector<std::string> keys;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) keys.push_back(item);
    }
    return keys;
}

static Result<Args> parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "--config" || a == "--key-space") && i + 1 < argc) {
            (a == "--config" ? args.config_path : args.key_space) = argv[++i];
        } else {
            positional.push_back(a);
        }
    }

    if (positional.empty() || positional.size() > 2) {
        return CacheError{TransportError{TransportError::InvalidRequest, 0,
                              "expected <keys> [data|@file]"},
                          "usage: cache_util [--config F] [--key-space V] <keys> [data]"};
    }

    args.keys = split_keys(positional[0]);
    if (positional.size() == 2) args.data = positional[1];
    return Result<Args>::ok(std::move(args));
}

static Result<Bytes> read_payload(const std::string& arg) {
    if (arg.empty() || arg.front() != '@') {
        return Result<Bytes>::ok(Bytes(arg.begin(), arg.end()));
    }

    std::string path = arg.substr(1);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return CacheError{TransportError{TransportError::InvalidRequest, 0,
                              "cannot open payload file: " + path}};
    }
    Bytes data((std::istreambuf_iterator<char>(file)),
               std::istreambuf_iterator<char>());
    return Result<Bytes>::ok(std::move(data));
}

static Result<ClientConfig> load_config(const Args& args) {
    std::optional<ClientSettings> file;
    std::string path = args.config_path.empty() ? default_config_path() : args.config_path;
    if (!path.empty() && (fs::exists(path) || !args.config_path.empty())) {
        auto loaded = ClientSettings::load(path);
        GHCACHE_TRY(loaded);
        file = loaded.value();
    }

    auto settings = ClientSettings::effective(file, ClientSettings::from_env(), {});
    if (settings.log_level) log::set_level(*settings.log_level);
    return settings.resolve();
}

static Status run(const Args& args) {
    auto config = load_config(args);
    GHCACHE_TRY(config);

    auto client = CacheClient::create(std::move(config).value());
    GHCACHE_TRY(client);

    if (args.data) {
        if (args.keys.size() != 1) {
            return CacheError{TransportError{TransportError::InvalidRequest, 0,
                                             "store takes exactly one key"}};
        }
        auto payload = read_payload(*args.data);
        GHCACHE_TRY(payload);

        auto stored = client.value().put_bytes(args.key_space, args.keys[0],
                                               std::move(payload).value());
        GHCACHE_TRY(stored);
        std::cout << "stored " << args.keys[0] << "\n";
        return ok_status();
    }

    auto entry = client.value().get_bytes(args.key_space, args.keys);
    GHCACHE_TRY(entry);
    if (!entry.value()) {
        std::cout << "miss\n";
        return ok_status();
    }

    const CacheEntry& e = *entry.value();
    std::cout << "hit: " << e.hit.key << " (scope " << e.hit.scope << ", "
              << e.data.size() << " bytes)\n";
    std::cout.write(reinterpret_cast<const char*>(e.data.data()),
                    static_cast<std::streamsize>(e.data.size()));
    std::cout << "\n";
    return ok_status();
}

int main(int argc, char** argv) {
    log::init_from_env("GHCACHE_LOG");

    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 2;
    }

    auto status = run(args.value());
    if (status.is_err()) {
        std::cerr << status.error().format() << "\n";
        // EX_TEMPFAIL
        if (auto wait = status.error().retry_after()) {
            std::cerr << "retry after " << *wait << "s\n";
            return 75;
        }
        return 1;
    }
    return 0;
}
