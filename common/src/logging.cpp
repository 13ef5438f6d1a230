#include "t5backbone/logging.hpp"
#include <cstdarg>
#include <cstdio>

namespace t5backbone {
namespace log {

namespace {
Level current_level = Level::Info;
std::string line_prefix;

const char* level_tag(Level level)
{
    switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warning: return "WARN";
    case Level::Error: return "ERROR";
    }
    return "?";
}
}

void set_level(Level level) { current_level = level; }

Level level() { return current_level; }

bool enabled(Level level)
{
    return static_cast<int>(level) >= static_cast<int>(current_level);
}

void set_prefix(const std::string& prefix) { line_prefix = prefix; }

void write(Level level, const char* fmt, ...)
{
    FILE* stream = (level >= Level::Warning) ? stderr : stdout;

    std::fprintf(stream, "%s[%s] ", line_prefix.c_str(), level_tag(level));

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stream, fmt, args);
    va_end(args);

    std::fprintf(stream, "\n");
    std::fflush(stream);
}

}
}
