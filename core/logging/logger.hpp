#pragma once

#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace tangorest {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level) { return level >= level_(); }

private:
    static Level level_();

    static Level threshold_;
    static std::mutex mutex_;
};

// Case-insensitive; unknown names fall back to INFO
Level string_to_level(const std::string &level_str);

// Strict variant used by config validation
std::optional<Level> parse_level(const std::string &level_str);

const char *level_to_string(Level level);

}  // namespace logging
}  // namespace tangorest

#define TANGOREST_LOG_INTERNAL(level, msg)                                        \
    do {                                                                          \
        if (tangorest::logging::Logger::enabled(level)) {                         \
            std::stringstream tangorest_log_ss;                                   \
            tangorest_log_ss << msg;                                              \
            tangorest::logging::Logger::log(level, __FILE__, __LINE__,            \
                                            tangorest_log_ss.str());              \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) TANGOREST_LOG_INTERNAL(tangorest::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) TANGOREST_LOG_INTERNAL(tangorest::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) TANGOREST_LOG_INTERNAL(tangorest::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) TANGOREST_LOG_INTERNAL(tangorest::logging::Level::LVL_ERROR, msg)
