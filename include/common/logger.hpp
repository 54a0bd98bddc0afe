#ifndef LANSHARE_LOGGER_HPP
#define LANSHARE_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <atomic>

// Ordered by verbosity so the minimum level can be compared directly.
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Accepts "debug", "info", "warn"/"warning", "error" (any case).
LogLevel log_level_from_string(const std::string& name);

class Logger {
public:
    static Logger& instance();

    void init(const std::string& filename, LogLevel min_level = LogLevel::INFO);
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) { min_level_.store(level); }
    LogLevel level() const { return min_level_.load(); }
    bool enabled(LogLevel level) const { return level >= min_level_.load(); }

    void set_console(bool enabled) { console_.store(enabled); }

    // Helper for easy logging
    template<typename... Args>
    void log_args(LogLevel level, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::ofstream log_file_;
    std::mutex mutex_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::atomic<bool> console_{true};

    std::string level_to_string(LogLevel level);
    std::string get_timestamp();
};

// Global macros for easier usage
#define LOG_INFO(...) Logger::instance().log_args(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log_args(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERR(...)  Logger::instance().log_args(LogLevel::ERROR, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log_args(LogLevel::DEBUG, __VA_ARGS__)

#endif // LANSHARE_LOGGER_HPP
