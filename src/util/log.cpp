#include <pepver/log.hpp>
#include <pepver/text.hpp>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace pepver::log {

// Level and color are set once at startup (Config::apply_logging) and only
// read afterwards, so concurrent log calls need no locking.
static Level s_level = Info;
static int s_color_mode = -1;  // -1: detect from stderr, 0: off, 1: on

static bool stderr_is_tty() {
    static const bool tty = isatty(fileno(stderr)) != 0;
    return tty;
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_mode = enabled ? 1 : 0;
}

bool is_color_enabled() {
    if (s_color_mode < 0) return stderr_is_tty();
    return s_color_mode != 0;
}

struct LevelInfo {
    Level level;
    const char* name;
    const char* color;
};

static const LevelInfo kLevels[] = {
    {Trace, "trace", "\033[90m"},   // gray
    {Debug, "debug", "\033[36m"},   // cyan
    {Info,  "info",  "\033[32m"},   // green
    {Warn,  "warn",  "\033[33m"},   // yellow
    {Error, "error", "\033[31m"},   // red
};

static const LevelInfo* find_level(Level lvl) {
    for (const auto& info : kLevels) {
        if (info.level == lvl) return &info;
    }
    return nullptr;
}

const char* level_name(Level lvl) {
    const LevelInfo* info = find_level(lvl);
    return info ? info->name : "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "warning") lower = "warn";

    for (const auto& info : kLevels) {
        if (lower == info.name) return Result<Level>::ok(info.level);
    }

    return PepverError{PepverError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;

    const LevelInfo* info = find_level(lvl);
    const char* name = info ? info->name : "unknown";
    if (is_color_enabled() && info) {
        std::fprintf(stderr, "%s%s\033[0m: ", info->color, name);
    } else {
        std::fprintf(stderr, "%s: ", name);
    }

    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
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

} // namespace pepver::log
