#pragma once

#include <cstdarg>

namespace hostcaps::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

#if defined(HC_DEBUG)

// Real functions exist only in debug builds.
void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);

#else

// In non-debug builds, provide inline no-op stubs so
// any direct calls still compile but vanish.
inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

#endif // HC_DEBUG

} // namespace hostcaps::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#if defined(HC_DEBUG)

#define HC_LOGE(tag, fmt, ...) \
    ::hostcaps::log::logf(::hostcaps::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define HC_LOGW(tag, fmt, ...) \
    ::hostcaps::log::logf(::hostcaps::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define HC_LOGI(tag, fmt, ...) \
    ::hostcaps::log::logf(::hostcaps::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define HC_LOGD(tag, fmt, ...) \
    ::hostcaps::log::logf(::hostcaps::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define HC_LOGV(tag, fmt, ...) \
    ::hostcaps::log::logf(::hostcaps::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time.

#define HC_LOGE(tag, fmt, ...) ((void)0)
#define HC_LOGW(tag, fmt, ...) ((void)0)
#define HC_LOGI(tag, fmt, ...) ((void)0)
#define HC_LOGD(tag, fmt, ...) ((void)0)
#define HC_LOGV(tag, fmt, ...) ((void)0)

#endif // HC_DEBUG
