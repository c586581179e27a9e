#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <string>

namespace btreconnect
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Allow callers to pass string literals or other non-owning strings.
inline void set_log_level_by_name(const char *name)
{
    std::string level = std::string(name);
    if (level == "debug" || level == "DEBUG")
        set_log_level(Level::Debug);
    else if (level == "info" || level == "INFO")
        set_log_level(Level::Info);
    else if (level == "warn" || level == "warning" || level == "WARN" || level == "WARNING")
        set_log_level(Level::Warning);
    else if (level == "error" || level == "err" || level == "ERROR" || level == "ERR")
        set_log_level(Level::Error);
    else
        set_log_level(Level::Info);  // default
}

inline bool log_enabled(Level lv)
{
    return (int)lv >= (int)global_level();
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
    }
    return "?";
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

// debug/info -> stdout, warn/error -> stderr
inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if (!log_enabled(lv))
        return;

    FILE *out = (lv >= Level::Warning) ? stderr : stdout;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(out, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(out, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', out);
    std::fflush(out);
}

#define LOG_DEBUG(...) ::btreconnect::logf(::btreconnect::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::btreconnect::logf(::btreconnect::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::btreconnect::logf(::btreconnect::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::btreconnect::logf(::btreconnect::Level::Error, __func__, __VA_ARGS__)

}  // namespace btreconnect
