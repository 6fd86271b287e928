#pragma once

#include <string>
#include <cstdio>

namespace sexpr::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Parse "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves `out` untouched on anything else.
bool parse_level(const std::string& name, Level& out);

// Apply the SEXPR_LOG environment variable, if set and valid.
void init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace sexpr::log
