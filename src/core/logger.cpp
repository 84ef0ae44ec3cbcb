#include <clawsuite/core/logger.hpp>

#include <ctime>

namespace clawsuite {

LogLevel parse_log_level(const std::string& name, LogLevel def) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return def;
}

const char* log_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), out_(stderr) {}

void Logger::set_level(LogLevel level) { level_.store(level); }

LogLevel Logger::level() const { return level_.load(); }

void Logger::set_output(FILE* out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : stderr;
}

void Logger::debug(const char* fmt, ...) {
    if (level_.load() > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_.load() > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_.load() > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_impl(LogLevel::ERROR, fmt, args);
    va_end(args);
}

void Logger::log_impl(LogLevel level, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    // One lock per line so reader, supervisor and Crow threads don't interleave
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(out_, "[%s] [%s] ", timestamp, log_level_str(level));
    vfprintf(out_, fmt, args);
    fprintf(out_, "\n");
    fflush(out_);
}

} // namespace clawsuite
