#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "utils/Logger.hpp"

#ifdef USE_JEMALLOC
#include <jemalloc/jemalloc.h>
#endif

namespace Tmber {
namespace Utils {

/**
 * @brief Wall-clock timer with optional jemalloc allocation statistics.
 */
class ResourceMonitor {
public:
    ResourceMonitor() {
        reset();
    }

    void reset() {
        start_time_ = std::chrono::steady_clock::now();
    }

    double get_elapsed_seconds() const {
        auto end_time = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = end_time - start_time_;
        return elapsed.count();
    }

    // Returns allocated memory in bytes (0 without jemalloc)
    size_t get_memory_usage() const {
        size_t allocated = 0;
#ifdef USE_JEMALLOC
        size_t sz = sizeof(size_t);
        // epoch needs to be advanced to get up-to-date stats
        uint64_t epoch = 1;
        mallctl("epoch", &epoch, &sz, &epoch, sizeof(epoch));

        if (mallctl("stats.allocated", &allocated, &sz, NULL, 0) != 0) {
            allocated = 0;
        }
#endif
        return allocated;
    }

    std::string format_stats(const std::string& label = "Execution") const {
        std::ostringstream ss;
        ss << "[" << label << "] Time: " << std::fixed << std::setprecision(4) << get_elapsed_seconds() << " s";
#ifdef USE_JEMALLOC
        ss << ", Memory: " << std::fixed << std::setprecision(2) << (get_memory_usage() / 1024.0 / 1024.0) << " MB";
#endif
        return ss.str();
    }

    void print_stats(const std::string& label = "Execution", LogLevel level = LogLevel::LOG_INFO) const {
        Logger::instance().log(level, format_stats(label));
    }

private:
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace Utils
} // namespace Tmber
