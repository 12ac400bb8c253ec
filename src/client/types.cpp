#include <ghcache/types.hpp>

namespace ghcache {

static CacheError invalid_key(const std::string& key, const char* why) {
    return CacheError{TransportError{TransportError::InvalidRequest, 0,
                          "invalid cache key '" + key + "': " + why}};
}

Status validate_key(const std::string& key) {
    if (key.empty()) {
        return invalid_key(key, "key is empty");
    }
    if (key.size() > kMaxKeyLength) {
        return invalid_key(key.substr(0, 32) + "...",
                           "key is longer than 512 bytes");
    }
    if (key.find(',') != std::string::npos) {
        return invalid_key(key, "key contains ','");
    }
    return ok_status();
}

} // namespace ghcache
