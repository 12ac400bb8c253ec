#pragma once

#include <optional>
#include <string>
#include <cstdio>

namespace ghcache::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Case-insensitive: "trace", "debug", "info", "warn"/"warning", "error", "off".
std::optional<Level> parse_level(const std::string& name);

// Applies the level named by an environment variable (e.g. GHCACHE_LOG).
// Unset or unrecognized values leave the current level unchanged.
bool init_from_env(const char* var);

} // namespace ghcache::log
