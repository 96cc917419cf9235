#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace coderun {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

// Process-wide stderr logger. The threshold may be changed while other
// threads are logging; line output is serialized.
class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parse a configured level name ("debug", "INFO", ...). Unknown names map to INFO.
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace coderun

#define LOG_INTERNAL(level, msg)                                                      \
    do {                                                                              \
        if (coderun::logging::Logger::enabled(level)) {                               \
            std::stringstream log_ss_;                                                \
            log_ss_ << msg;                                                           \
            coderun::logging::Logger::log(level, __FILE__, __LINE__, log_ss_.str());  \
        }                                                                             \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(coderun::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(coderun::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(coderun::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(coderun::logging::Level::LVL_ERROR, msg)
