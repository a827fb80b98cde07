#pragma once

#include <chrono>
#include <string>

enum class LogLevel
{
    Info,
    Warning,
    Error
};

struct LogItem
{
    std::string message;
    std::chrono::time_point<std::chrono::system_clock> date;
    LogLevel level;
};
