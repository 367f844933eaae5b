#pragma once

#include <optional>
#include <string>
#include <cstdio>

namespace cc::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Destination of all messages; stderr unless redirected. Color
// auto-detection follows the destination.
void set_stream(std::FILE* out);
std::FILE* get_stream();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Level chosen at run time, e.g. from a config value
void emit(Level lvl, const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); empty for an unknown name
std::optional<Level> parse_level(const std::string& name);

} // namespace cc::log
