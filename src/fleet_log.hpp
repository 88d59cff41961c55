// =============================================================================
// FleetDeck - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: FLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <atomic>

namespace fleetdeck::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// Accepts the config spelling ("trace".."fatal"); unknown names map to Info.
inline Level parseLevel(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite mode: one file per console run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline unsigned long threadTag() {
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
}

// "HH:MM:SS.mmm" local time
inline void formatClock(char* out, size_t size) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const int ms = static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm local{};
    localtime_r(&secs, &local);
    std::snprintf(out, size, "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min, local.tm_sec, ms);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;

    char clock[16];
    formatClock(clock, sizeof(clock));

    char msg[2048];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    char line[2200];
    std::snprintf(line, sizeof(line), "%s [%s] [%s] (T%lu) %s\n", clock, levelStr(level), tag, threadTag(), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fputs(line, stderr);
    if (g_log_file) {
        std::fputs(line, g_log_file);
        std::fflush(g_log_file);
    }
}

} // namespace fleetdeck::log

#define FLOG_TRACE(tag, fmt, ...) fleetdeck::log::write(fleetdeck::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define FLOG_DEBUG(tag, fmt, ...) fleetdeck::log::write(fleetdeck::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define FLOG_INFO(tag, fmt, ...)  fleetdeck::log::write(fleetdeck::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define FLOG_WARN(tag, fmt, ...)  fleetdeck::log::write(fleetdeck::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define FLOG_ERROR(tag, fmt, ...) fleetdeck::log::write(fleetdeck::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define FLOG_FATAL(tag, fmt, ...) fleetdeck::log::write(fleetdeck::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
