#ifndef LATTICE_DEBUG_LOG_HPP
#define LATTICE_DEBUG_LOG_HPP

#include <cstdio>
#include <thread>
#include <sstream>
#include <cstdarg>
#include <atomic>

namespace lattice {
namespace debug {

// Receives one formatted message (no trailing newline)
using DebugCallback = void (*)(const char* message);

// Host-installed sink. When null, DEBUG lines go to stdout and WARN lines to stderr.
inline std::atomic<DebugCallback> g_debug_callback{nullptr};

inline void set_debug_callback(DebugCallback cb) {
    g_debug_callback.store(cb, std::memory_order_release);
}

inline void clear_debug_callback() {
    g_debug_callback.store(nullptr, std::memory_order_release);
}

inline void vlog_output(const char* tag, FILE* fallback, const char* fmt, va_list args) {
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), fmt, args);

    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s", tag, oss.str().c_str(), buffer);

    DebugCallback cb = g_debug_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(full_message);
    } else {
        fprintf(fallback, "%s\n", full_message);
        fflush(fallback);
    }
}

inline void debug_output(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog_output("DEBUG", stdout, fmt, args);
    va_end(args);
}

inline void warn_output(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog_output("WARN", stderr, fmt, args);
    va_end(args);
}

} // namespace debug
} // namespace lattice

// Compiled out unless ENABLE_DEBUG_OUTPUT is defined
#ifdef ENABLE_DEBUG_OUTPUT
    #define DEBUG_LOG(fmt, ...) ::lattice::debug::debug_output(fmt, ##__VA_ARGS__)
#else
    #define DEBUG_LOG(fmt, ...) ((void)0)
#endif

// Always on: dropped records, truncated exports
#define WARN_LOG(fmt, ...) ::lattice::debug::warn_output(fmt, ##__VA_ARGS__)

#endif // LATTICE_DEBUG_LOG_HPP
