#include "log.hpp"

#include <ctime>
#include <strings.h> // strcasecmp

namespace waterly {

std::FILE *Logger::output        = stderr;
LogLevel   Logger::current_level = LogLevel::INFO;
std::mutex Logger::log_mutex;

void Logger::init(std::FILE *out, LogLevel level)
{
    std::lock_guard<std::mutex> guard(log_mutex);
    output        = out ? out : stderr;
    current_level = level;
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> guard(log_mutex);
    current_level = level;
}

bool Logger::parse_level(const std::string &name, LogLevel &out)
{
    static const struct {
        const char *name;
        LogLevel    level;
    } LEVELS[] = {
        { "debug", LogLevel::DEBUG },
        { "info",  LogLevel::INFO  },
        { "warn",  LogLevel::WARN  },
        { "error", LogLevel::ERROR },
        { "none",  LogLevel::NONE  },
    };

    for (const auto &l : LEVELS) {
        if (strcasecmp(name.c_str(), l.name) == 0) {
            out = l.level;
            return true;
        }
    }
    return false;
}

void Logger::log(LogLevel level, const char *level_str, const char *format, va_list args)
{
    std::lock_guard<std::mutex> guard(log_mutex);

    if (level < current_level || current_level == LogLevel::NONE)
        return;

    char stamp[32];
    std::time_t now = std::time(nullptr);
    std::tm lt;
    localtime_r(&now, &lt);
    std::strftime(stamp, sizeof(stamp), "%b-%d %H:%M:%S", &lt);

    char buffer[1024];
    std::vsnprintf(buffer, sizeof(buffer), format, args);

    std::fprintf(output, "%s [%s] %s\n", stamp, level_str, buffer);

    if (level == LogLevel::ERROR)
        std::fflush(output);
}

void Logger::debug(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    log(LogLevel::DEBUG, "DEBUG", format, args);
    va_end(args);
}

void Logger::info(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    log(LogLevel::INFO, "INFO", format, args);
    va_end(args);
}

void Logger::warn(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    log(LogLevel::WARN, "WARN", format, args);
    va_end(args);
}

void Logger::error(const char *format, ...)
{
    va_list args;
    va_start(args, format);
    log(LogLevel::ERROR, "ERROR", format, args);
    va_end(args);
}

} // namespace waterly
