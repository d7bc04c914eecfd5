#include "logger.h"
#include "utils.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

bool parse_log_level(const std::string &text, LogLevel &level)
{
    const std::string lower = lowercase_copy(trim_copy(text));
    if (lower == "error")
        level = LogLevel::Error;
    else if (lower == "warn" || lower == "warning")
        level = LogLevel::Warn;
    else if (lower == "info")
        level = LogLevel::Info;
    else if (lower == "verbose")
        level = LogLevel::Verbose;
    else if (lower == "debug")
        level = LogLevel::Debug;
    else
        return false;
    return true;
}

Logger &Logger::instance()
{
    static Logger s_instance;
    return s_instance;
}

void Logger::setLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = level;
}

bool Logger::shouldLog(LogLevel level) const
{
    return level <= m_level;
}

const char *Logger::prefix(LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Error:
        return "[ERROR] ";
    case LogLevel::Warn:
        return "[WARN] ";
    case LogLevel::Info:
        return "[INFO] ";
    case LogLevel::Verbose:
        return "[VERBOSE] ";
    case LogLevel::Debug:
        return "[DEBUG] ";
    default:
        return "";
    }
}

void Logger::log(LogLevel level, const char *fmt, ...) noexcept
{
    if (!fmt)
        return;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!shouldLog(level))
        return;

    // Wall-clock timestamp with millisecond precision
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);
    std::tm local{};
    localtime_r(&seconds, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    std::fprintf(stderr, "%s,%03ld ", stamp, millis);

    std::fputs(prefix(level), stderr);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);

    std::fputc('\n', stderr);
    std::fflush(stderr);
}
