#pragma once

#ifdef __cplusplus

#include <atomic>
#include <cstdio>
#include <functional>

namespace chronicle {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Process-wide threshold, defined in ChronicleCore/src/log.cpp. Defaults to off.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

inline bool log_enabled(log_level level) {
    return static_cast<int>(level) <= static_cast<int>(g_log_level.load(std::memory_order_relaxed));
}

/// Receives every emitted line. The default sink writes "[tag] message" to stderr.
using log_sink_t = std::function<void(log_level level, const char* tag, const char* message)>;

/// Replace the sink. Passing an empty function restores the stderr sink.
void set_log_sink(log_sink_t sink);

/// printf-style entry point used by the LOG_* macros.
void log_message(log_level level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

const char* to_string(log_level level);

}  // namespace chronicle

#define CHRONICLE_LOG(level, tag, fmt, ...) \
    do { \
        if (chronicle::log_enabled(level)) { \
            chronicle::log_message(level, tag, fmt, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) CHRONICLE_LOG(chronicle::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  CHRONICLE_LOG(chronicle::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  CHRONICLE_LOG(chronicle::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) CHRONICLE_LOG(chronicle::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif

#endif // __cplusplus
