#pragma once

#include <cstdarg>
#include <mutex>
#include <string>

enum class LogLevel
{
    Error,
    Warn,
    Info,
    Verbose,
    Debug
};

// Parse "error", "warn", "info", "verbose" or "debug" (case-insensitive).
// Returns false and leaves level untouched on unknown input.
bool parse_log_level(const std::string &text, LogLevel &level);

class Logger
{
public:
    static Logger &instance();

    void setLevel(LogLevel level);

    void log(LogLevel level, const char *fmt, ...) noexcept;

private:
    Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    bool shouldLog(LogLevel level) const;
    const char *prefix(LogLevel level) const;

    mutable std::mutex m_mutex;
    LogLevel m_level = LogLevel::Info;
};

#define LOG_ERROR(...) Logger::instance().log(LogLevel::Error, __VA_ARGS__)
#define LOG_WARN(...) Logger::instance().log(LogLevel::Warn, __VA_ARGS__)
#define LOG_INFO(...) Logger::instance().log(LogLevel::Info, __VA_ARGS__)
#define LOG_VERBOSE(...) Logger::instance().log(LogLevel::Verbose, __VA_ARGS__)
#define LOG_DEBUG(...) Logger::instance().log(LogLevel::Debug, __VA_ARGS__)
