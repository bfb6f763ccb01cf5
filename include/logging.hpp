
#pragma once
#include <cstdio>
#include <cstdarg>
#include <atomic>
#include <mutex>
#include <string>

namespace hdlcd {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

bool parse_log_level(const std::string& name, LogLevel& lvl);

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    LogLevel level() const { return level_; }
    bool enabled(LogLevel lvl) const { return lvl >= level_; }
    void log(LogLevel lvl, const char* fmt, ...);
private:
    Logger();
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace hdlcd
