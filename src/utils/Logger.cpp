#include "utils/Logger.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Tmber {
namespace Utils {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : use_color_(isatty(STDERR_FILENO) != 0) {
}

void Logger::set_log_level(LogLevel level) {
    current_level_.store(level);
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.open(filename, std::ios::app);
    if (!log_file_.is_open()) {
        throw ConfigError("Cannot open log file: " + filename);
    }
}

std::optional<LogLevel> Logger::parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "error") return LogLevel::LOG_ERROR;
    if (lower == "warn") return LogLevel::LOG_WARN;
    if (lower == "info") return LogLevel::LOG_INFO;
    if (lower == "debug") return LogLevel::LOG_DEBUG;
    return std::nullopt;
}

const char* Logger::level_label(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO:  return "INFO ";
        case LogLevel::LOG_WARN:  return "WARN ";
        case LogLevel::LOG_ERROR: return "ERROR";
    }
    return "?    ";
}

const char* Logger::color_code(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG: return "\033[36m";
        case LogLevel::LOG_INFO:  return "\033[32m";
        case LogLevel::LOG_WARN:  return "\033[33m";
        case LogLevel::LOG_ERROR: return "\033[31m";
    }
    return "";
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line) {
    // ERROR=0 ... DEBUG=3
    if (static_cast<int>(level) > static_cast<int>(current_level_.load())) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    struct tm time_info;
    localtime_r(&now_time, &time_info);

    std::ostringstream ss;
    ss << "[" << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
       << ms.count() << "]";
#ifdef _OPENMP
    ss << "[T" << omp_get_thread_num() << "]";
#endif
    ss << "[" << level_label(level) << "] " << message;
    if (file && (level == LogLevel::LOG_DEBUG || level == LogLevel::LOG_ERROR)) {
        ss << " (" << std::filesystem::path(file).filename().string() << ":" << line << ")";
    }
    ss << "\n";
    const std::string text = ss.str();

    std::lock_guard<std::mutex> lock(mutex_);
    // stdout is reserved for the ">>" result lines
    if (use_color_) {
        std::cerr << color_code(level) << text << "\033[0m" << std::flush;
    } else {
        std::cerr << text << std::flush;
    }
    if (log_file_.is_open()) {
        log_file_ << text << std::flush;
    }
}

void Logger::debug(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_DEBUG, msg, file, line);
}

void Logger::info(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_INFO, msg, file, line);
}

void Logger::warning(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_WARN, msg, file, line);
}

void Logger::error(const std::string& msg, const char* file, int line) {
    instance().log(LogLevel::LOG_ERROR, msg, file, line);
}

ScopedLogger::ScopedLogger(const std::string& action_name, LogLevel level)
    : action_name_(action_name), level_(level), start_time_(std::chrono::steady_clock::now()) {
    Logger::instance().log(level_, "START: " + action_name_);
}

ScopedLogger::~ScopedLogger() {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         start_time_).count();
    Logger::instance().log(level_, "DONE : " + action_name_ + " (" + std::to_string(elapsed) + " ms)");
}

}  // namespace Utils
}  // namespace Tmber
