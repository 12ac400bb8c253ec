#include <ghcache/error.hpp>

namespace ghcache {

namespace {

template<typename... Fs>
struct overloaded : Fs... { using Fs::operator()...; };
template<typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace

const char* CacheError::cause_name(ConfigurationError::Cause c) {
    switch (c) {
        case ConfigurationError::MissingToken:    return "MissingToken";
        case ConfigurationError::MissingEndpoint: return "MissingEndpoint";
        case ConfigurationError::InvalidEndpoint: return "InvalidEndpoint";
        case ConfigurationError::InvalidFile:     return "InvalidFile";
    }
    return "Unknown";
}

const char* CacheError::kind_name(TransportError::Kind k) {
    switch (k) {
        case TransportError::Status:         return "Status";
        case TransportError::Network:        return "Network";
        case TransportError::Decode:         return "Decode";
        case TransportError::InvalidRequest: return "InvalidRequest";
    }
    return "Unknown";
}

std::optional<std::uint64_t> CacheError::retry_after() const {
    if (auto rl = std::get_if<RateLimited>(&detail)) {
        return rl->retry_after;
    }
    return std::nullopt;
}

int CacheError::status() const {
    return std::visit(overloaded{
        [](const ConfigurationError&) { return 0; },
        [](const RateLimited& e) { return e.status; },
        [](const TransportError& e) { return e.status; },
    }, detail);
}

const std::string& CacheError::message() const {
    return std::visit(overloaded{
        [](const ConfigurationError& e) -> const std::string& { return e.detail; },
        [](const RateLimited& e) -> const std::string& { return e.message; },
        [](const TransportError& e) -> const std::string& { return e.message; },
    }, detail);
}

const char* CacheError::kind_name() const {
    return std::visit(overloaded{
        [](const ConfigurationError&) { return "Configuration"; },
        [](const RateLimited&) { return "RateLimited"; },
        [](const TransportError&) { return "Transport"; },
    }, detail);
}

std::string CacheError::format() const {
    std::string result = "error[";
    result += kind_name();
    result += "]: ";

    std::visit(overloaded{
        [&](const ConfigurationError& e) {
            result += cause_name(e.cause);
            if (!e.detail.empty()) {
                result += ": ";
                result += e.detail;
            }
        },
        [&](const RateLimited& e) {
            result += "server rate limited the request, asking to wait ";
            result += std::to_string(e.retry_after);
            result += " seconds (HTTP ";
            result += std::to_string(e.status);
            result += ")";
            if (!e.message.empty()) {
                result += ": ";
                result += e.message;
            }
        },
        [&](const TransportError& e) {
            result += kind_name(e.kind);
            if (e.status != 0) {
                result += " (HTTP ";
                result += std::to_string(e.status);
                result += ")";
            }
            if (!e.message.empty()) {
                result += ": ";
                result += e.message;
            }
        },
    }, detail);

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace ghcache
