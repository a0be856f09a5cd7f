#pragma once

#include <fmt/format.h>
#include <atomic>
#include <string>
#include <utility>

namespace paircorr {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4, OFF = 5 };

/**
 * Process-wide logger writing to stderr.
 * Messages use fmt placeholders: Logger::get().info("{} pairs", n);
 */
class Logger {
public:
    static Logger& get();

    void set_level(LogLevel level);
    LogLevel get_level() const;
    bool enabled(LogLevel level) const { return level >= level_.load() && level != LogLevel::OFF; }

    template <typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::TRACE)) write(LogLevel::TRACE, fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::DEBUG)) write(LogLevel::DEBUG, fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::INFO)) write(LogLevel::INFO, fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::WARN)) write(LogLevel::WARN, fmt::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) {
        if (enabled(LogLevel::ERROR)) write(LogLevel::ERROR, fmt::format(fmt, std::forward<Args>(args)...));
    }

    void flush();

private:
    Logger() = default;
    ~Logger() = default;
    void write(LogLevel level, const std::string& message);

    // Written from Python while workers read it
    std::atomic<LogLevel> level_{LogLevel::WARN};
};

/** Parse "trace", "debug", "info", "warn", "error" or "off". Throws ConfigurationError. */
LogLevel parse_log_level(const std::string& name);

} // namespace paircorr
