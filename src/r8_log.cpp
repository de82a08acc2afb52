#include "r8_log.hpp"

#include <cstdarg>
#include <cstdio>
#include <vector>

namespace r8::log {

namespace {

#ifdef R8_DEBUG
level current_level = level::debug;
#else
level current_level = level::info;
#endif

void vprint(level l, const char* prefix, const char* fmt, va_list args)
{
    if (!enabled(l)) return;

    fprintf(stderr, "%s", prefix);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
}

} // namespace

void set_level(level new_level) { current_level = new_level; }

level get_level(void) { return current_level; }

bool enabled(level l) { return l != level::off && l >= current_level; }

void debug(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    vprint(level::debug, "[debug] ", fmt, args);
    va_end(args);
}

void info(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    vprint(level::info, "[info] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    vprint(level::error, "[error] ", fmt, args);
    va_end(args);
}

std::string format(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    va_list args_copy;
    va_copy(args_copy, args);
    const int size = vsnprintf(nullptr, 0, fmt, args_copy);
    va_end(args_copy);

    if (size <= 0) {
        va_end(args);
        return {};
    }

    std::vector<char> buf(static_cast<size_t>(size) + 1); // Extra space for '\0'
    vsnprintf(buf.data(), buf.size(), fmt, args);
    va_end(args);

    return std::string(buf.data(), static_cast<size_t>(size));
}

} // namespace r8::log
