#include "hostcaps/core/logging.h"

#include <cstdarg>
#include <cstdio>

namespace hostcaps::log {

#if defined(HC_DEBUG)

static const char* level_to_str(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

// stdout carries command results, so every level goes to stderr.
static FILE* stream_for(Level)
{
    return stderr;
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    FILE* out = stream_for(level);

    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

#endif // defined(HC_DEBUG)

} // namespace hostcaps::log
