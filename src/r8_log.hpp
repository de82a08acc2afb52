#pragma once

#include <string>

namespace r8::log {

enum class level { debug, info, error, off };

void set_level(level new_level);
level get_level(void);
bool enabled(level l);

// printf-style messages to stderr, dropped when below the current level
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void error(const char* fmt, ...);

// printf-style formatting into a std::string
std::string format(const char* fmt, ...);

} // namespace r8::log
