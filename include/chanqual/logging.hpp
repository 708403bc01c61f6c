#pragma once

#include <cstdio>
#include <cstdarg>
#include <cstring>

namespace chanqual {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
// Default to INFO for release, DEBUG for debug builds
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Log category enable flags for fine-grained control
struct LogCategories {
    bool gen = true;        // Waveform and noise generators
    bool spectrum = true;   // FFT / PSD
    bool metrics = true;    // SNR / THD
    bool filter = true;     // Notch filter
    bool sim = true;        // Channel simulation
};

inline LogCategories g_log_categories;

// Set log level
inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

// Parse "none", "error", "warn", "info", "debug" or "trace"
// Returns false and leaves `out` untouched on an unknown name
inline bool parseLogLevel(const char* name, LogLevel& out) {
    static const struct { const char* name; LogLevel level; } table[] = {
        {"none", LogLevel::NONE}, {"error", LogLevel::ERROR},
        {"warn", LogLevel::WARN}, {"info", LogLevel::INFO},
        {"debug", LogLevel::DEBUG}, {"trace", LogLevel::TRACE},
    };
    for (const auto& entry : table) {
        if (strcmp(entry.name, name) == 0) {
            out = entry.level;
            return true;
        }
    }
    return false;
}

// Core logging function
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when CHANQUAL_LOG_DISABLE is defined
#ifdef CHANQUAL_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    chanqual::log(chanqual::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    chanqual::log(chanqual::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    chanqual::log(chanqual::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (chanqual::g_log_level >= chanqual::LogLevel::DEBUG) \
        chanqual::log(chanqual::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (chanqual::g_log_level >= chanqual::LogLevel::TRACE) \
        chanqual::log(chanqual::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_GEN(level, fmt, ...) \
    do { if (chanqual::g_log_categories.gen) LOG_##level("GEN", fmt, ##__VA_ARGS__); } while(0)

#define LOG_SPEC(level, fmt, ...) \
    do { if (chanqual::g_log_categories.spectrum) LOG_##level("SPEC", fmt, ##__VA_ARGS__); } while(0)

#define LOG_METRIC(level, fmt, ...) \
    do { if (chanqual::g_log_categories.metrics) LOG_##level("METRIC", fmt, ##__VA_ARGS__); } while(0)

#define LOG_FILT(level, fmt, ...) \
    do { if (chanqual::g_log_categories.filter) LOG_##level("FILT", fmt, ##__VA_ARGS__); } while(0)

#define LOG_SIM(level, fmt, ...) \
    do { if (chanqual::g_log_categories.sim) LOG_##level("SIM", fmt, ##__VA_ARGS__); } while(0)

} // namespace chanqual
