#include <ghcache/log.hpp>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace ghcache::log {

// Cache operations may log from several threads at once.
static std::atomic<Level> s_level{Info};
static std::atomic<int> s_color{-1};  // -1 = not yet detected

static bool color_on() {
    int c = s_color.load(std::memory_order_relaxed);
    if (c < 0) {
        c = isatty(fileno(stderr)) ? 1 : 0;
        s_color.store(c, std::memory_order_relaxed);
    }
    return c == 1;
}

void set_level(Level lvl) {
    s_level.store(lvl, std::memory_order_relaxed);
}

Level get_level() {
    return s_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return lvl != Off && lvl >= get_level();
}

void set_color_enabled(bool enabled) {
    s_color.store(enabled ? 1 : 0, std::memory_order_relaxed);
}

bool is_color_enabled() {
    return color_on();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
        case Off:   return "off";
    }
    return "unknown";
}

std::optional<Level> parse_level(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace") return Trace;
    if (lower == "debug") return Debug;
    if (lower == "info") return Info;
    if (lower == "warn" || lower == "warning") return Warn;
    if (lower == "error") return Error;
    if (lower == "off" || lower == "none") return Off;
    return std::nullopt;
}

bool init_from_env(const char* var) {
    const char* value = std::getenv(var);
    if (!value) return false;
    auto lvl = parse_level(value);
    if (!lvl) return false;
    set_level(*lvl);
    return true;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
        case Off:   return "";
    }
    return "";
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    // Format the whole line first so concurrent writers do not interleave.
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (n < 0) return;

    std::string body(static_cast<size_t>(n), '\0');
    std::vsnprintf(body.data(), body.size() + 1, fmt, args);

    std::string line;
    if (color_on()) {
        line += level_color(lvl);
        line += level_name(lvl);
        line += "\033[0m";
    } else {
        line += level_name(lvl);
    }
    line += " ghcache: ";
    line += body;
    line += '\n';

    std::fwrite(line.data(), 1, line.size(), stderr);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace ghcache::log
