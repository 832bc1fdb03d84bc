#include "gattbench/logging.hpp"

#include <cstdarg>
#include <mutex>

namespace gattbench {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

namespace {
std::mutex g_log_mutex;
FILE* g_log_file = nullptr;
}

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "?";
    }
}

bool parseLogLevel(const std::string& str, LogLevel& out) {
    if (str == "error") { out = LogLevel::ERROR; return true; }
    if (str == "warn" || str == "warning") { out = LogLevel::WARN; return true; }
    if (str == "info") { out = LogLevel::INFO; return true; }
    if (str == "debug") { out = LogLevel::DEBUG; return true; }
    if (str == "trace") { out = LogLevel::TRACE; return true; }
    return false;
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed_ms / 1000);
    int millis = static_cast<int>(elapsed_ms % 1000);

    char message[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;
    fprintf(out, "[%3d.%03d][%-5s][%-6s] %s\n",
            secs, millis, logLevelToString(level), category, message);
    fflush(out);
}

} // namespace gattbench
