#pragma once

#include <ghcache/result.hpp>
#include <ghcache/log.hpp>
#include <optional>
#include <string>

namespace ghcache {

inline constexpr char kDefaultLabel[] = "ghcache/0.1.0";

// Everything the client needs from its environment. Validated on creation
// and immutable afterwards.
class ClientConfig {
public:
    // Fails with ConfigurationError{MissingToken} / {MissingEndpoint} when a
    // value is empty, {InvalidEndpoint} when the endpoint is not an http(s)
    // URL. Trailing slashes are trimmed from the endpoint. An empty label
    // falls back to kDefaultLabel.
    static Result<ClientConfig> create(std::string token,
                                       std::string endpoint,
                                       std::string label = "");

    const std::string& token() const { return token_; }
    const std::string& endpoint() const { return endpoint_; }
    const std::string& label() const { return label_; }

private:
    ClientConfig(std::string token, std::string endpoint, std::string label)
        : token_(std::move(token)), endpoint_(std::move(endpoint)),
          label_(std::move(label)) {}

    std::string token_;
    std::string endpoint_;
    std::string label_;
};

// Layered settings: file < environment < explicit values.
// Unset fields stay nullopt so a later layer only overrides what it sets.
struct ClientSettings {
    std::optional<std::string> token;
    std::optional<std::string> endpoint;
    std::optional<std::string> label;
    std::optional<log::Level> log_level;

    // Load from a TOML settings file
    static Result<ClientSettings> load(const std::string& path);

    // Parse from TOML string ([cache] url/token/label, [log] level)
    static Result<ClientSettings> parse(const std::string& toml_str);

    // ACTIONS_RUNTIME_TOKEN, ACTIONS_CACHE_URL, GHCACHE_LABEL, GHCACHE_LOG
    static ClientSettings from_env();

    // Merge another layer on top (other's set values override this)
    void merge(const ClientSettings& other);

    static ClientSettings effective(const std::optional<ClientSettings>& file,
                                    const ClientSettings& env,
                                    const ClientSettings& overrides);

    Result<ClientConfig> resolve() const;
};

// ~/.ghcache/config.toml, or "" when HOME is unset
std::string default_config_path();

} // namespace ghcache
