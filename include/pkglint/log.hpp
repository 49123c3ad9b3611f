#pragma once

#include <pkglint/result.hpp>
#include <string>
#include <cstdio>

namespace pkglint::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn", "error" or "off"
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for all messages; stderr unless redirected. Passing nullptr
// restores stderr.
void set_sink(std::FILE* sink);
std::FILE* get_sink();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace pkglint::log
