#pragma once

#include <string>

namespace stacy::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

// "trace", "debug", "info", "warn"/"warning", "error", "off"/"quiet",
// case-insensitive. Leaves `out` untouched on an unknown name.
bool parse_level(const std::string& name, Level& out);
const char* level_name(Level lvl);

// Defaults to whether stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Interpreter output tee'd through the log lock, without a level prefix
void raw(const std::string& line);

// Prefixes this thread's log lines with "[tag] " while alive. Parallel
// workers tag their lines with the script they are running.
class ScopedTag {
public:
    explicit ScopedTag(std::string tag);
    ~ScopedTag();

    ScopedTag(const ScopedTag&) = delete;
    ScopedTag& operator=(const ScopedTag&) = delete;

private:
    std::string previous_;
};

} // namespace stacy::log
