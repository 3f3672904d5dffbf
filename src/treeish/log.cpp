#include <treeish/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace treeish::log {

static Level s_level = Warn;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

struct LevelInfo {
    const char* name;
    const char* color;
};

static const LevelInfo s_levels[] = {
    {"trace", "\033[90m"},   // gray
    {"debug", "\033[36m"},   // cyan
    {"info",  "\033[32m"},   // green
    {"warn",  "\033[33m"},   // yellow
    {"error", "\033[31m"},   // red
};

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

bool enabled(Level lvl) {
    return lvl >= s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Error) return "unknown";
    return s_levels[lvl].name;
}

bool parse_level(const std::string& name, Level& out) {
    for (int i = Trace; i <= Error; ++i) {
        if (name == s_levels[i].name) {
            out = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

void init_from_env() {
    const char* env = std::getenv("TREEISH_LOG");
    if (!env) return;
    Level lvl;
    if (parse_level(env, lvl)) {
        s_level = lvl;
    }
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    init_color();

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", s_levels[lvl].color, s_levels[lvl].name);
    } else {
        std::fprintf(stderr, "%s: ", s_levels[lvl].name);
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

} // namespace treeish::log
