#include <stacy/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <unistd.h>

namespace stacy::log {

namespace {

struct Sink {
    std::mutex mu;
    Level level = Info;
    int color = -1;          // -1 until probed
};

Sink& sink() {
    static Sink s;
    return s;
}

thread_local std::string t_tag;

// Caller holds the sink lock
bool color_locked(Sink& s) {
    if (s.color < 0) s.color = isatty(fileno(stderr)) ? 1 : 0;
    return s.color == 1;
}

const char* const kColors[] = {
    "\033[90m",   // trace
    "\033[36m",   // debug
    "\033[32m",   // info
    "\033[33m",   // warn
    "\033[31m",   // error
};

void emit(Level lvl, const char* fmt, va_list args) {
    Sink& s = sink();
    std::lock_guard<std::mutex> guard(s.mu);
    if (lvl < s.level || lvl == Off) return;

    if (color_locked(s)) {
        std::fprintf(stderr, "%s%s\033[0m: ", kColors[lvl], level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }
    if (!t_tag.empty()) std::fprintf(stderr, "[%s] ", t_tag.c_str());
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace

void set_level(Level lvl) {
    std::lock_guard<std::mutex> guard(sink().mu);
    sink().level = lvl;
}

Level get_level() {
    std::lock_guard<std::mutex> guard(sink().mu);
    return sink().level;
}

bool enabled(Level lvl) {
    return lvl != Off && lvl >= get_level();
}

bool parse_level(const std::string& name, Level& out) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const struct { const char* name; Level lvl; } kNames[] = {
        {"trace", Trace}, {"debug", Debug}, {"info", Info},
        {"warn", Warn},   {"warning", Warn}, {"error", Error},
        {"off", Off},     {"quiet", Off},
    };
    for (const auto& e : kNames) {
        if (n == e.name) {
            out = e.lvl;
            return true;
        }
    }
    return false;
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

void set_color_enabled(bool on) {
    std::lock_guard<std::mutex> guard(sink().mu);
    sink().color = on ? 1 : 0;
}

bool is_color_enabled() {
    std::lock_guard<std::mutex> guard(sink().mu);
    return color_locked(sink());
}

#define STACY_LOG_FN(fn, lvl)           \
    void fn(const char* fmt, ...) {     \
        va_list args;                   \
        va_start(args, fmt);            \
        emit(lvl, fmt, args);           \
        va_end(args);                   \
    }

STACY_LOG_FN(trace, Trace)
STACY_LOG_FN(debug, Debug)
STACY_LOG_FN(info, Info)
STACY_LOG_FN(warn, Warn)
STACY_LOG_FN(error, Error)

#undef STACY_LOG_FN

void raw(const std::string& line) {
    std::lock_guard<std::mutex> guard(sink().mu);
    std::fwrite(line.data(), 1, line.size(), stderr);
    if (line.empty() || line.back() != '\n') std::fputc('\n', stderr);
    std::fflush(stderr);
}

ScopedTag::ScopedTag(std::string tag) : previous_(std::move(t_tag)) {
    t_tag = std::move(tag);
}

ScopedTag::~ScopedTag() {
    t_tag = std::move(previous_);
}

} // namespace stacy::log
