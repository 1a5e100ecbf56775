#include <tabwright/core/logger.hpp>
#include <tabwright/core/utils.hpp>
#include <cstdlib>

namespace tabwright {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

bool Logger::parse_level(const std::string& name, LogLevel& out) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") { out = LogLevel::DEBUG; return true; }
    if (lower == "info") { out = LogLevel::INFO; return true; }
    if (lower == "warn" || lower == "warning") { out = LogLevel::WARN; return true; }
    if (lower == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

bool Logger::set_level_from_string(const std::string& name) {
    LogLevel parsed;
    if (!parse_level(name, parsed)) return false;
    level_ = parsed;
    return true;
}

void Logger::init_from_env() {
    const char* env = std::getenv("TABWRIGHT_LOG_LEVEL");
    if (env && *env) {
        set_level_from_string(env);
    }
}

void Logger::debug(const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl("DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl("INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl("WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl("ERROR", fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO) {}

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);
    
    // Routine threads log concurrently; keep each line whole
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] [%s] ", timestamp, level_str);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    fflush(stderr);
}

} // namespace tabwright
