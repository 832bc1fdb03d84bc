#pragma once

#include <chrono>
#include <cstdio>
#include <string>

namespace gattbench {

// Higher value = more verbose
enum class LogLevel : int {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4,
};

// Per-subsystem enables, all on by default
struct LogCategories {
    bool periph = true;   // Simulated peripheral (scheduler, commands, RSSI)
    bool client = true;   // Connection manager, metrics, trial runner
    bool runner = true;   // Sweep orchestrator, lock, manifest
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);

// Redirect output (nullptr restores stderr). The caller keeps ownership of the FILE.
void setLogFile(FILE* file);

// printf-style log line: "[sss.mmm][LEVEL][CAT   ] message"
void log(LogLevel level, const char* category, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

const char* logLevelToString(LogLevel level);
bool parseLogLevel(const std::string& str, LogLevel& out);

} // namespace gattbench

#define GATTBENCH_LOG_CAT(flag, tag, level, ...)                                  \
    do {                                                                          \
        if (gattbench::g_log_categories.flag &&                                   \
            gattbench::g_log_level >= gattbench::LogLevel::level) {               \
            gattbench::log(gattbench::LogLevel::level, tag, __VA_ARGS__);         \
        }                                                                         \
    } while (0)

#define LOG_PERIPH(level, ...) GATTBENCH_LOG_CAT(periph, "PERIPH", level, __VA_ARGS__)
#define LOG_CLIENT(level, ...) GATTBENCH_LOG_CAT(client, "CLIENT", level, __VA_ARGS__)
#define LOG_RUNNER(level, ...) GATTBENCH_LOG_CAT(runner, "RUNNER", level, __VA_ARGS__)
