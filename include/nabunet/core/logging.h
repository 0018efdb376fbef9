#pragma once

#include <cstdarg>
#include <string_view>

namespace nabunet::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

// Parse "error", "warn", "info", "debug", "verbose" (case-insensitive).
// Returns false and leaves `out` untouched on anything else.
bool parse_level(std::string_view name, Level& out);

#if defined(NN_DEBUG)

// Messages above the threshold are dropped. Default: Info.
void set_level(Level level);
Level level();

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

// In non-debug builds, provide inline no-op stubs so
// any direct calls from core still compile but vanish.
inline void set_level(Level) {}
inline Level level() { return Level::Error; }

inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // NN_DEBUG

} // namespace nabunet::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define NN_ELOG(fmt, ...) ::nabunet::log::early_logf(fmt "\n", ##__VA_ARGS__)

#if defined(NN_DEBUG)

#define NN_LOGE(tag, fmt, ...) \
    ::nabunet::log::logf(::nabunet::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define NN_LOGW(tag, fmt, ...) \
    ::nabunet::log::logf(::nabunet::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define NN_LOGI(tag, fmt, ...) \
    ::nabunet::log::logf(::nabunet::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define NN_LOGD(tag, fmt, ...) \
    ::nabunet::log::logf(::nabunet::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define NN_LOGV(tag, fmt, ...) \
    ::nabunet::log::logf(::nabunet::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// In non-debug builds they compile to a single no-op expression.
// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time, so no strings or code remain.

#define NN_LOGE(tag, fmt, ...) ((void)0)
#define NN_LOGW(tag, fmt, ...) ((void)0)
#define NN_LOGI(tag, fmt, ...) ((void)0)
#define NN_LOGD(tag, fmt, ...) ((void)0)
#define NN_LOGV(tag, fmt, ...) ((void)0)

#endif // NN_DEBUG
