#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace mlld {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Applies MLLD_LOG_LEVEL when set; leaves the threshold untouched otherwise
    static void init_from_env();

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Helpers for config parsing and diagnostics
Level string_to_level(const std::string& level_str);
const char* level_to_string(Level level);

} // namespace logging
} // namespace mlld

#define LOG_INTERNAL(lvl, msg) \
    do { \
        if ((lvl) >= mlld::logging::Logger::level()) { \
            std::stringstream ss; \
            ss << msg; \
            mlld::logging::Logger::log(lvl, __FILE__, __LINE__, ss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(mlld::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(mlld::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(mlld::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(mlld::logging::Level::LVL_ERROR, msg)
