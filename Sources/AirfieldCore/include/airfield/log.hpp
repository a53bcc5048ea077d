#pragma once

#include <cstdio>
#include <atomic>
#include <optional>
#include <string>

namespace airfield {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

/// Single global log level - defined in AirfieldCore/src/airfield.cpp.
extern std::atomic<log_level> g_log_level;

inline void set_log_level(log_level level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return g_log_level.load(std::memory_order_relaxed);
}

/// "off", "error", "warn", "info" or "debug" (case-insensitive).
std::optional<log_level> parse_log_level(const std::string& name);

const char* log_level_name(log_level level);

}  // namespace airfield

#define AIRFIELD_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(airfield::g_log_level.load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) AIRFIELD_LOG(airfield::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  AIRFIELD_LOG(airfield::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  AIRFIELD_LOG(airfield::log_level::info, tag, fmt, ##__VA_ARGS__)

#ifdef NDEBUG
#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#else
#define LOG_DEBUG(tag, fmt, ...) AIRFIELD_LOG(airfield::log_level::debug, tag, fmt, ##__VA_ARGS__)
#endif
