#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace schemacast
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline std::string to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

/// Accepts the upper-cased names produced by Settings; unknown names map to Info.
inline LogLevel log_level_from_string(const std::string& s)
{
    if (s == "DEBUG")
        return LogLevel::Debug;
    if (s == "WARNING" || s == "WARN")
        return LogLevel::Warning;
    if (s == "ERROR")
        return LogLevel::Error;
    return LogLevel::Info;
}

using LogCallback = std::function<void(LogLevel, const std::string&)>;

/// Threshold-filtered logger. The cast and validate engines never log; callers
/// such as the CLI and the parameter adapter do.
class Logger
{
  public:
    explicit Logger(LogLevel threshold = LogLevel::Info, LogCallback callback = nullptr)
        : threshold_(threshold), callback_(std::move(callback))
    {
        if (!callback_)
        {
            callback_ = [](LogLevel level, const std::string& msg)
            { std::cerr << "[schemacast] " << to_string(level) << " " << msg << std::endl; };
        }
    }

    void log(LogLevel level, const std::string& message) const
    {
        if (static_cast<int>(level) < static_cast<int>(threshold_))
            return;
        callback_(level, message);
    }

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(LogLevel::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(LogLevel::Error, message);
    }

    LogLevel threshold() const
    {
        return threshold_;
    }

  private:
    LogLevel threshold_;
    LogCallback callback_;
};

} // namespace schemacast
