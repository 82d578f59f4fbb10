#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mlld {
namespace logging {

// Read by the reader threads and the LOG_* fast path without taking the output mutex
std::atomic<Level> Logger::threshold_{Level::LVL_INFO};
std::mutex Logger::mutex_;

void Logger::init(Level threshold) {
    set_level(threshold);
}

void Logger::set_level(Level level) {
    threshold_.store(level, std::memory_order_relaxed);
}

Level Logger::level() {
    return threshold_.load(std::memory_order_relaxed);
}

void Logger::init_from_env() {
    const char* env = std::getenv("MLLD_LOG_LEVEL");
    if (env == nullptr || *env == '\0') {
        return;
    }
    set_level(string_to_level(env));
}

void Logger::log(Level level, const char* file, int line, const std::string& message) {
    (void)file;
    (void)line;
    if (level < Logger::level() || level == Level::LVL_NONE) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::lock_guard<std::mutex> lock(mutex_);

    std::cerr << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    std::cerr << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";

    std::cerr << " [" << level_to_string(level) << "]";
    std::cerr << (level == Level::LVL_INFO || level == Level::LVL_WARN ? "  " : " ");

    std::cerr << message << "\n";

    if (level >= Level::LVL_ERROR) {
        std::cerr << std::flush;
    }
}

Level string_to_level(const std::string& level_str) {
    std::string s = level_str;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);

    if (s == "DEBUG") return Level::LVL_DEBUG;
    if (s == "INFO") return Level::LVL_INFO;
    if (s == "WARN") return Level::LVL_WARN;
    if (s == "ERROR") return Level::LVL_ERROR;
    if (s == "NONE") return Level::LVL_NONE;

    return Level::LVL_INFO; // Default
}

const char* level_to_string(Level level) {
    switch (level) {
        case Level::LVL_DEBUG: return "DEBUG";
        case Level::LVL_INFO:  return "INFO";
        case Level::LVL_WARN:  return "WARN";
        case Level::LVL_ERROR: return "ERROR";
        case Level::LVL_NONE:  return "NONE";
        default: return "INFO";
    }
}

} // namespace logging
} // namespace mlld
