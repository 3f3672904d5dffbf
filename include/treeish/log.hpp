#pragma once

#include <string>

namespace treeish::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse a level name ("trace" .. "error"). Leaves `out` untouched on failure.
bool parse_level(const std::string& name, Level& out);

// Apply TREEISH_LOG from the environment, if set to a valid level name.
void init_from_env();

} // namespace treeish::log
