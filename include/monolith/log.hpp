#pragma once

#include <string>
#include <cstdio>

namespace monolith::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn", "error" or "off" (case-insensitive).
// Returns false and leaves `out` untouched on an unknown name.
bool parse_level(const std::string& name, Level& out);

// Apply MONOLITH_LOG from the environment, if set to a known level name.
void init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace monolith::log
