#pragma once

#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace waterly {

enum class LogLevel { DEBUG, INFO, WARN, ERROR, NONE };

// Process-wide levelled logger. Lines go to stderr unless init() picks
// another stream:
//   Oct-19 20:30:00 [INFO] message
class Logger {
public:
    static void init(std::FILE *out = stderr, LogLevel level = LogLevel::INFO);
    static void set_level(LogLevel level);

    // "debug", "info", "warn", "error" or "none" (case-insensitive).
    static bool parse_level(const std::string &name, LogLevel &out);

    static void debug(const char *format, ...);
    static void info(const char *format, ...);
    static void warn(const char *format, ...);
    static void error(const char *format, ...);

private:
    static std::FILE *output;
    static LogLevel   current_level;
    static std::mutex log_mutex;

    static void log(LogLevel level, const char *level_str, const char *format, va_list args);
};

} // namespace waterly
