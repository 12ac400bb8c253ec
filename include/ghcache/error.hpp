#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ghcache {

// Required configuration was absent or malformed. Only produced while
// building a ClientConfig, never by a network operation.
struct ConfigurationError {
    enum Cause {
        MissingToken,
        MissingEndpoint,
        InvalidEndpoint,
        InvalidFile
    };

    Cause cause;
    std::string detail;
};

// Error status with a parseable Retry-After header.
struct RateLimited {
    std::uint64_t retry_after = 0;  // seconds
    int status = 0;
    std::string message;
};

// Any other failed request: error status, network failure, undecodable body,
// or a request rejected before it was sent.
struct TransportError {
    enum Kind {
        Status,
        Network,
        Decode,
        InvalidRequest
    };

    Kind kind;
    int status = 0;  // 0 when no response was received
    std::string message;
};

struct CacheError {
    using Detail = std::variant<ConfigurationError, RateLimited, TransportError>;

    Detail detail;
    std::string hint;

    CacheError(ConfigurationError e) : detail(std::move(e)) {}
    CacheError(RateLimited e) : detail(std::move(e)) {}
    CacheError(TransportError e) : detail(std::move(e)) {}
    CacheError(Detail d, std::string h)
        : detail(std::move(d)), hint(std::move(h)) {}

    template<typename T>
    bool is() const { return std::holds_alternative<T>(detail); }

    template<typename T>
    const T* get_if() const { return std::get_if<T>(&detail); }

    // Seconds to wait before retrying, only set for RateLimited.
    std::optional<std::uint64_t> retry_after() const;

    // HTTP status of the failed response, 0 if there was none.
    int status() const;

    const std::string& message() const;
    const char* kind_name() const;
    std::string format() const;

    static const char* cause_name(ConfigurationError::Cause c);
    static const char* kind_name(TransportError::Kind k);
};

} // namespace ghcache
