#include "common/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

LogLevel log_level_from_string(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + name);
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::init(const std::string& filename, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_.store(min_level);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (!filename.empty()) {
        log_file_.open(filename, std::ios::app);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string timestamp = get_timestamp();
    std::string level_str = level_to_string(level);

    std::stringstream ss;
    ss << "[" << timestamp << "] [" << level_str << "] " << message << "\n";
    std::string log_line = ss.str();

    if (log_file_.is_open()) {
        log_file_ << log_line;
        log_file_.flush();
    }

    if (!console_.load()) {
        return;
    }

    std::string color_code;
    switch (level) {
        case LogLevel::DEBUG:   color_code = "\033[36m"; break; // Cyan
        case LogLevel::INFO:    color_code = "\033[32m"; break; // Green
        case LogLevel::WARNING: color_code = "\033[33m"; break; // Yellow
        case LogLevel::ERROR:   color_code = "\033[31m"; break; // Red
    }
    std::cout << color_code << log_line << "\033[0m";
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&in_time_t, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    return ss.str();
}
