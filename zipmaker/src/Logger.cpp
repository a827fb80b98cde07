#include "zipmaker/conf.hpp"
#include "zipmaker/Logger.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

Logger::Logger()
{
    start_time = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(start_time);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d-%H-%M-%S");
    base_filename = ss.str();

    log_to_file = false;
    log_to_console = true;
    last_time_conf_file_loaded = 0;

    LoadConfig();

    is_running = true;
    log_thread = std::thread(&Logger::LogConsume, this);
}

Logger::~Logger()
{
    Stop();
}

void Logger::Stop()
{
    {
        std::scoped_lock<std::mutex> lock(log_mutex);
        if (!is_running)
        {
            return;
        }
        is_running = false;
    }
    log_condition.notify_all();

    if (log_thread.joinable())
    {
        log_thread.join();
    }
}

void Logger::Log(const LogLevel level, const std::string& message)
{
    std::scoped_lock<std::mutex> lock(log_mutex);
    if (!is_running)
    {
        return;
    }
    logging_queue.push({ message, std::chrono::system_clock::now(), level });
    log_condition.notify_all();
}

void Logger::Info(const std::string& message)
{
    Log(LogLevel::Info, message);
}

void Logger::Warning(const std::string& message)
{
    Log(LogLevel::Warning, message);
}

void Logger::Error(const std::string& message)
{
    Log(LogLevel::Error, message);
}

const std::string& Logger::GetBaseFilename() const
{
    return base_filename;
}

void Logger::LoadConfig()
{
    std::time_t modification_time = Conf::GetModifiedTimestamp();
    if (modification_time != -1 &&
        modification_time == last_time_conf_file_loaded)
    {
        return;
    }

    try
    {
        std::shared_lock<std::shared_mutex> lock(Conf::conf_mutex);
        const ProtocolCraft::Json::Value conf = Conf::LoadConf();
        last_time_conf_file_loaded = Conf::GetModifiedTimestamp();
        log_to_file = Conf::GetBool(conf, Conf::text_file_log_key);
        log_to_console = Conf::GetBool(conf, Conf::console_log_key);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Error loading logger configuration, using defaults: " << e.what() << std::endl;
    }
}

void Logger::LogConsume()
{
    while (true)
    {
        LogItem item;
        {
            std::unique_lock<std::mutex> lock(log_mutex);
            log_condition.wait(lock, [this]() { return !logging_queue.empty() || !is_running; });
            if (logging_queue.empty())
            {
                // Not running anymore and everything has been written
                break;
            }
            item = std::move(logging_queue.front());
            logging_queue.pop();
        }

        const std::string output_str = FormatItem(item);

        if (log_to_file)
        {
            if (!log_file.is_open())
            {
                log_file = std::ofstream(base_filename + "_zipmaker.txt", std::ios::out);
            }
            log_file << output_str << std::endl;
        }
        if (log_to_console)
        {
            (item.level == LogLevel::Error ? std::cerr : std::cout) << output_str << std::endl;
        }
        else if (item.level == LogLevel::Error)
        {
            std::cerr << output_str << std::endl;
        }
    }

    if (log_file.is_open())
    {
        log_file.close();
    }
}

std::string Logger::FormatItem(const LogItem& item) const
{
    auto hours = std::chrono::duration_cast<std::chrono::hours>(item.date - start_time).count();
    auto min = std::chrono::duration_cast<std::chrono::minutes>(item.date - start_time).count();
    auto sec = std::chrono::duration_cast<std::chrono::seconds>(item.date - start_time).count();
    auto millisec = std::chrono::duration_cast<std::chrono::milliseconds>(item.date - start_time).count();
    millisec -= sec * 1000;
    sec -= min * 60;
    min -= hours * 60;

    std::stringstream output;
    output
        << '['
        << hours
        << ':'
        << std::setw(2) << std::setfill('0') << min
        << ':'
        << std::setw(2) << std::setfill('0') << sec
        << ':'
        << std::setw(3) << std::setfill('0') << millisec
        << "] "
        << LevelToString(item.level) << ' '
        << item.message;
    return output.str();
}

std::string_view Logger::LevelToString(const LogLevel level) const
{
    switch (level)
    {
    case LogLevel::Info:
        return "[INFO]";
    case LogLevel::Warning:
        return "[WARNING]";
    case LogLevel::Error:
        return "[ERROR]";
    }
    return "";
}
