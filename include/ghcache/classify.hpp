#pragma once

#include <ghcache/http.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ghcache {

// Parses a Retry-After value given as a non-negative number of seconds.
// HTTP-date values and anything that is not plain decimal digits yield nullopt.
std::optional<std::uint64_t> parse_retry_after(const std::string& value);

// Passes 2xx responses through. A 4xx/5xx carrying a parseable Retry-After
// becomes RateLimited; every other non-2xx becomes TransportError{Status}.
// Must run before the body is decoded: error bodies do not follow the
// success schema.
Result<HttpResponse> classify_response(HttpResponse response);

} // namespace ghcache
