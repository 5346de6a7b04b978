#pragma once

#include <atomic>
#include <cstdio>

namespace lazy
{

enum class LogLevel : int
{
    off   = 0,
    error = 1,
    warn  = 2,
    info  = 3,
    debug = 4
};

/// Single global log level - defined in lazy.cpp. Defaults to LogLevel::off.
extern std::atomic<LogLevel> gLogLevel;

inline void setLogLevel(LogLevel level)
{
    gLogLevel.store(level, std::memory_order_relaxed);
}

inline LogLevel getLogLevel()
{
    return gLogLevel.load(std::memory_order_relaxed);
}

} // namespace lazy

#define LAZY_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(lazy::gLogLevel.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LAZY_LOG_ERROR(tag, fmt, ...) LAZY_LOG(lazy::LogLevel::error, tag, fmt, ##__VA_ARGS__)
#define LAZY_LOG_WARN(tag, fmt, ...)  LAZY_LOG(lazy::LogLevel::warn, tag, fmt, ##__VA_ARGS__)
#define LAZY_LOG_INFO(tag, fmt, ...)  LAZY_LOG(lazy::LogLevel::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LAZY_LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LAZY_LOG_DEBUG(tag, fmt, ...) LAZY_LOG(lazy::LogLevel::debug, tag, fmt, ##__VA_ARGS__)
#endif
