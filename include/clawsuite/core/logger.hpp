#ifndef CLAWSUITE_CORE_LOGGER_HPP
#define CLAWSUITE_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace clawsuite {

#ifdef __GNUC__
#  define CLAWSUITE_PRINTF(fmt_idx, arg_idx) __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#  define CLAWSUITE_PRINTF(fmt_idx, arg_idx)
#endif

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// "debug", "info", "warn"/"warning", "error"; anything else yields def
LogLevel parse_log_level(const std::string& name, LogLevel def = LogLevel::INFO);
const char* log_level_str(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    // Lines go to stderr unless redirected
    void set_output(FILE* out);

    void debug(const char* fmt, ...) CLAWSUITE_PRINTF(2, 3);
    void info(const char* fmt, ...) CLAWSUITE_PRINTF(2, 3);
    void warn(const char* fmt, ...) CLAWSUITE_PRINTF(2, 3);
    void error(const char* fmt, ...) CLAWSUITE_PRINTF(2, 3);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(LogLevel level, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    FILE* out_;
    std::mutex mutex_;
};

#define LOG_DEBUG(...) clawsuite::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  clawsuite::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  clawsuite::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) clawsuite::Logger::instance().error(__VA_ARGS__)

} // namespace clawsuite

#endif // CLAWSUITE_CORE_LOGGER_HPP
