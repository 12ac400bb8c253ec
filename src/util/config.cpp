#include <ghcache/config.hpp>
#include <ghcache/http.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ghcache {

Result<ClientConfig> ClientConfig::create(std::string token,
                                          std::string endpoint,
                                          std::string label) {
    if (token.empty()) {
        return CacheError{ConfigurationError{ConfigurationError::MissingToken,
                              "no runtime token configured"},
                          "set ACTIONS_RUNTIME_TOKEN or [cache] token"};
    }
    if (endpoint.empty()) {
        return CacheError{ConfigurationError{ConfigurationError::MissingEndpoint,
                              "no cache endpoint URL configured"},
                          "set ACTIONS_CACHE_URL or [cache] url"};
    }

    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    auto url = parse_url(endpoint);
    if (url.is_err()) {
        return CacheError{ConfigurationError{ConfigurationError::InvalidEndpoint,
                              url.error().message()}};
    }

    if (label.empty()) label = kDefaultLabel;

    return Result<ClientConfig>::ok(
        ClientConfig(std::move(token), std::move(endpoint), std::move(label)));
}

static CacheError invalid_file(std::string detail) {
    return CacheError{ConfigurationError{ConfigurationError::InvalidFile,
                                         std::move(detail)}};
}

Result<ClientSettings> ClientSettings::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return invalid_file(std::string("settings TOML parse error: ") +
                            std::string(e.description()));
    }

    ClientSettings s;

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["url"].value<std::string>())
            s.endpoint = *v;
        if (auto v = (*cache)["token"].value<std::string>())
            s.token = *v;
        if (auto v = (*cache)["label"].value<std::string>())
            s.label = *v;
    }

    // [log] section
    if (auto logt = doc["log"].as_table()) {
        if (auto v = (*logt)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return invalid_file("unknown log level '" + *v + "'");
            }
            s.log_level = *lvl;
        }
    }

    return Result<ClientSettings>::ok(std::move(s));
}

Result<ClientSettings> ClientSettings::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return invalid_file("cannot open settings file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ClientSettings::parse(ss.str()).map_err([&](CacheError e) {
        e.hint = "in " + path;
        return e;
    });
}

static std::optional<std::string> env_value(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

ClientSettings ClientSettings::from_env() {
    ClientSettings s;
    s.token = env_value("ACTIONS_RUNTIME_TOKEN");
    s.endpoint = env_value("ACTIONS_CACHE_URL");
    s.label = env_value("GHCACHE_LABEL");
    if (auto lvl = env_value("GHCACHE_LOG")) {
        s.log_level = log::parse_level(*lvl);
    }
    return s;
}

void ClientSettings::merge(const ClientSettings& other) {
    if (other.token) token = other.token;
    if (other.endpoint) endpoint = other.endpoint;
    if (other.label) label = other.label;
    if (other.log_level) log_level = other.log_level;
}

ClientSettings ClientSettings::effective(const std::optional<ClientSettings>& file,
                                         const ClientSettings& env,
                                         const ClientSettings& overrides) {
    ClientSettings result;
    if (file.has_value()) result.merge(file.value());
    result.merge(env);
    result.merge(overrides);
    return result;
}

Result<ClientConfig> ClientSettings::resolve() const {
    return ClientConfig::create(token.value_or(""),
                                endpoint.value_or(""),
                                label.value_or(""));
}

std::string default_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ghcache/config.toml";
}

} // namespace ghcache
