#ifndef SITEMIRROR_CORE_LOGGER_HPP
#define SITEMIRROR_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>

namespace sitemirror {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Maps "debug", "info", "warn", "error" (any case); anything else is INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(const char* level_str, const char* fmt, va_list args);
    
    LogLevel level_;
    FILE* out_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) sitemirror::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  sitemirror::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  sitemirror::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) sitemirror::Logger::instance().error(__VA_ARGS__)

} // namespace sitemirror

#endif // SITEMIRROR_CORE_LOGGER_HPP
