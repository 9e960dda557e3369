#pragma once

#include <optional>
#include <string>

namespace strata::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// "trace", "debug", "info", "warn"/"warning", "error" (case-insensitive)
std::optional<Level> parse_level(const std::string& name);

// Apply STRATA_LOG if it is set to a known level name. Returns true if applied.
bool init_from_env();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace strata::log
