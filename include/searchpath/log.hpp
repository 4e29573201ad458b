#pragma once

#include <optional>
#include <string>

namespace searchpath::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Accepts "trace", "debug", "info", "warn"/"warning", "error" (any case)
std::optional<Level> parse_level(const std::string& name);

// Apply SEARCHPATH_LOG if it names a valid level; returns true if applied
bool init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace searchpath::log
