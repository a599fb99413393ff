#include "chronicle/log.hpp"
#include <cstdarg>
#include <mutex>
#include <string>
#include <vector>

namespace chronicle {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

namespace {

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

log_sink_t& sink_slot() {
    static log_sink_t sink;
    return sink;
}

} // namespace

void set_log_sink(log_sink_t sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink_slot() = std::move(sink);
}

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "unknown";
}

void log_message(log_level level, const char* tag, const char* fmt, ...) {
    char stack_buf[512];
    std::va_list args;
    va_start(args, fmt);
    std::va_list copy;
    va_copy(copy, args);
    int needed = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, args);
    va_end(args);

    std::string message;
    if (needed < 0) {
        message = fmt;
    } else if (static_cast<size_t>(needed) < sizeof(stack_buf)) {
        message.assign(stack_buf, static_cast<size_t>(needed));
    } else {
        std::vector<char> heap_buf(static_cast<size_t>(needed) + 1);
        std::vsnprintf(heap_buf.data(), heap_buf.size(), fmt, copy);
        message.assign(heap_buf.data(), static_cast<size_t>(needed));
    }
    va_end(copy);

    // Called without the lock held so a sink may log in turn
    log_sink_t sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex());
        sink = sink_slot();
    }
    if (sink) {
        sink(level, tag, message.c_str());
    } else {
        std::fprintf(stderr, "[%s] %s\n", tag, message.c_str());
    }
}

} // namespace chronicle
