#pragma once
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace pcex {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_.load(); }
    void log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

// Accepts trace, debug, info, warn and error (case-insensitive).
bool parse_log_level(const std::string& s, LogLevel& out);

} // namespace pcex
