#include "nabunet/core/logging.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace nabunet::log {

void early_logf(const char* fmt, ...)
{
    if (!fmt) {
        return;
    }

    std::va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

bool parse_level(std::string_view name, Level& out)
{
    std::string s(name);
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    if (s == "error" || s == "critical") { out = Level::Error;   return true; }
    if (s == "warn" || s == "warning")   { out = Level::Warn;    return true; }
    if (s == "info")                     { out = Level::Info;    return true; }
    if (s == "debug")                    { out = Level::Debug;   return true; }
    if (s == "verbose")                  { out = Level::Verbose; return true; }
    return false;
}

#if !defined(NN_DEBUG)

// Non-debug build: nothing else here. Inline stubs in the header handle log calls.

#else

static Level g_threshold = Level::Info;

void set_level(Level lvl)
{
    g_threshold = lvl;
}

Level level()
{
    return g_threshold;
}

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

static bool enabled(Level lvl)
{
    return static_cast<int>(lvl) <= static_cast<int>(g_threshold);
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    if (!enabled(level)) {
        return;
    }

    FILE* out = (level == Level::Error || level == Level::Warn)
        ? stderr
        : stdout;

    std::fprintf(out, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
    std::fflush(out);
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    if (!enabled(level)) {
        return;
    }

    FILE* out = (level == Level::Error || level == Level::Warn)
        ? stderr
        : stdout;

    std::fprintf(out, "[%s] %s: %.*s\n",
                 level_to_str(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // defined(NN_DEBUG)

} // namespace nabunet::log
