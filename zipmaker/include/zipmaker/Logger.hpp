#pragma once

#include "zipmaker/LogItem.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>

/// @brief Asynchronous logger. Messages are queued by any thread and
/// written to console and/or a text file by a dedicated thread
class Logger
{
public:
    Logger();
    ~Logger();
    void Log(const LogLevel level, const std::string& message);
    void Info(const std::string& message);
    void Warning(const std::string& message);
    void Error(const std::string& message);
    const std::string& GetBaseFilename() const;
    /// @brief Read output settings from the conf file if it changed since last load
    void LoadConfig();
    /// @brief Write all queued messages and stop the logging thread
    void Stop();

private:
    void LogConsume();
    std::string FormatItem(const LogItem& item) const;
    std::string_view LevelToString(const LogLevel level) const;

private:
    std::chrono::time_point<std::chrono::system_clock> start_time;

    std::thread log_thread;
    std::mutex log_mutex;
    std::condition_variable log_condition;
    std::queue<LogItem> logging_queue;

    std::string base_filename;
    std::ofstream log_file;
    std::atomic<bool> is_running;
    std::atomic<bool> log_to_file;
    std::atomic<bool> log_to_console;

    std::time_t last_time_conf_file_loaded;
};
