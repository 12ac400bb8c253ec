#pragma once

#include <ghcache/error.hpp>
#include <variant>
#include <functional>

namespace ghcache {

template<typename T>
class Result {
    std::variant<T, CacheError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from CacheError so GHCACHE_TRY can return errors across Result<T> types
    Result(CacheError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(CacheError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<CacheError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    CacheError& error() & { return std::get<CacheError>(data_); }
    const CacheError& error() const& { return std::get<CacheError>(data_); }
    CacheError&& error() && { return std::get<CacheError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    // Rewrites the error (e.g. to attach a hint); Ok passes through.
    template<typename F>
    Result map_err(F&& f) && {
        if (is_err()) {
            return Result(f(std::move(*this).error()));
        }
        return std::move(*this);
    }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define GHCACHE_TRY(expr) \
    do { \
        auto _ghcache_result = (expr); \
        if (_ghcache_result.is_err()) return std::move(_ghcache_result).error(); \
    } while(0)

} // namespace ghcache
