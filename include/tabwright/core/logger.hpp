#ifndef TABWRIGHT_CORE_LOGGER_HPP
#define TABWRIGHT_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace tabwright {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

class Logger {
public:
    static Logger& instance();
    
    void set_level(LogLevel level);
    LogLevel level() const;

    // Accepts debug/info/warn/warning/error in any case.
    // Returns false and keeps the current level for anything else.
    bool set_level_from_string(const std::string& name);
    
    // Reads TABWRIGHT_LOG_LEVEL if set
    void init_from_env();
    
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

    static bool parse_level(const std::string& name, LogLevel& out);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);
    
    void log_impl(const char* level_str, const char* fmt, va_list args);
    
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) tabwright::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  tabwright::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  tabwright::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) tabwright::Logger::instance().error(__VA_ARGS__)

} // namespace tabwright

#endif // TABWRIGHT_CORE_LOGGER_HPP
