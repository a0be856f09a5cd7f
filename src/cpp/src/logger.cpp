#include "paircorr_log.hpp"
#include "paircorr_errors.hpp"
#include <fmt/chrono.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace paircorr {

namespace {

const char* level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

} // anonymous namespace

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::get_level() const {
    return level_.load();
}

void Logger::write(LogLevel level, const std::string& message) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(log_mutex());
    fmt::print(stderr, "[{:%H:%M:%S}] paircorr {}: {}\n",
               fmt::localtime(now), level_strings[static_cast<int>(level)], message);
}

void Logger::flush() {
    std::fflush(stderr);
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off") return LogLevel::OFF;

    throw ConfigurationError(fmt::format("unknown log level '{}'", name));
}

} // namespace paircorr
