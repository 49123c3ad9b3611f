#include <pkglint/log.hpp>
#include <cstdarg>
#include <cstdio>
#include <unistd.h>

namespace pkglint::log {

namespace {

Level s_level = Info;
std::FILE* s_sink = nullptr;

// -1 = decide from isatty on first use
int s_color = -1;

std::FILE* sink() {
    return s_sink ? s_sink : stderr;
}

bool color_on() {
    if (s_color < 0) {
        s_color = isatty(fileno(sink())) ? 1 : 0;
    }
    return s_color == 1;
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[1;31m";
        case Off:   return "";
    }
    return "";
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level || lvl == Off) return;

    std::FILE* out = sink();
    if (color_on()) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
    std::fflush(out);
}

} // namespace

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

Result<Level> parse_level(const std::string& name) {
    if (name == "trace") return Result<Level>::ok(Trace);
    if (name == "debug") return Result<Level>::ok(Debug);
    if (name == "info")  return Result<Level>::ok(Info);
    if (name == "warn")  return Result<Level>::ok(Warn);
    if (name == "error") return Result<Level>::ok(Error);
    if (name == "off")   return Result<Level>::ok(Off);
    return LintError{LintError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, off"};
}

void set_color_enabled(bool enabled) {
    s_color = enabled ? 1 : 0;
}

bool is_color_enabled() {
    return color_on();
}

void set_sink(std::FILE* out) {
    s_sink = out;
}

std::FILE* get_sink() {
    return sink();
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

#define PKGLINT_LOG_FN(fn, lvl)          \
    void fn(const char* fmt, ...) {      \
        va_list args;                    \
        va_start(args, fmt);             \
        emit(lvl, fmt, args);            \
        va_end(args);                    \
    }

PKGLINT_LOG_FN(trace, Trace)
PKGLINT_LOG_FN(debug, Debug)
PKGLINT_LOG_FN(info, Info)
PKGLINT_LOG_FN(warn, Warn)
PKGLINT_LOG_FN(error, Error)

#undef PKGLINT_LOG_FN

} // namespace pkglint::log
