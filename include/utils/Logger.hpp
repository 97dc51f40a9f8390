#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "core/Types.hpp"

namespace Tmber {
namespace Utils {

/**
 * @brief Process-wide logger writing to stderr and, optionally, a log file.
 *
 * Line format: [YYYY-mm-dd HH:MM:SS.mmm][T<omp thread>][LEVEL] message
 * DEBUG and ERROR lines also carry the source file and line. Console lines
 * are colored only when stderr is a terminal. Safe to call from OpenMP
 * worker threads.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const { return current_level_.load(); }

    /**
     * @brief Also appends every line to @p filename.
     * @throws ConfigError if the file cannot be opened.
     */
    void set_log_file(const std::string& filename);

    /**
     * @brief Maps "error", "warn", "info" or "debug" (any case) to a level.
     */
    static std::optional<LogLevel> parse_log_level(const std::string& name);

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> current_level_{LogLevel::LOG_WARN};
    std::ofstream log_file_;
    std::mutex mutex_;
    bool use_color_ = false;

    static const char* level_label(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief Logs "START: <action>" on construction and "DONE : <action> (N ms)"
 * when the scope ends.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace Tmber

#define LOG_DEBUG(msg) Tmber::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) Tmber::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) Tmber::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) Tmber::Utils::Logger::error(msg, __FILE__, __LINE__)
