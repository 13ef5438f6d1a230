#ifndef T5BACKBONE_LOGGING_HPP
#define T5BACKBONE_LOGGING_HPP

#include <string>

namespace t5backbone {
namespace log {

enum class Level { Debug = 0, Info = 1, Warning = 2, Error = 3 };

void set_level(Level level);
Level level();
bool enabled(Level level);

// Text placed before every line, e.g. "[RANK 1] " under MPI.
void set_prefix(const std::string& prefix);

// printf-style; Debug/Info go to stdout, Warning/Error to stderr.
void write(Level level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}
}

#define T5BACKBONE_LOG(lvl, ...)                                  \
    do {                                                          \
        if (::t5backbone::log::enabled(lvl))                      \
            ::t5backbone::log::write(lvl, __VA_ARGS__);           \
    } while (0)

#define T5BACKBONE_LOG_DEBUG(...) T5BACKBONE_LOG(::t5backbone::log::Level::Debug, __VA_ARGS__)
#define T5BACKBONE_LOG_INFO(...) T5BACKBONE_LOG(::t5backbone::log::Level::Info, __VA_ARGS__)
#define T5BACKBONE_LOG_WARN(...) T5BACKBONE_LOG(::t5backbone::log::Level::Warning, __VA_ARGS__)
#define T5BACKBONE_LOG_ERROR(...) T5BACKBONE_LOG(::t5backbone::log::Level::Error, __VA_ARGS__)

#endif
