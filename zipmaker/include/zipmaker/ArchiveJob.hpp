#pragma once

#include "zipmaker/Encoder.hpp"
#include "zipmaker/FileList.hpp"
#include "zipmaker/enums.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class Logger;

enum class JobState
{
    Idle,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

struct EntryReport
{
    std::string source;
    std::string entry_name;
    std::string label;
    std::string reason;
    uint64_t original_size;
    uint64_t stored_size;
};

struct ArchiveSummary
{
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;
    /// @brief Space saved in percents, 0 if there was nothing to compress
    double ratio = 0.0;
    std::vector<EntryReport> entries;
};

struct ArchiveRequest
{
    std::vector<FileListItem> files;
    std::filesystem::path output_path;
    CompressionChoice choice = CompressionChoice::Auto;
    EncoderSettings settings;
    bool verify = false;
    /// @brief Files bigger than that are streamed to the archive instead of being loaded in memory,
    /// if their method allows it
    uint64_t streaming_threshold = 64 * 1024 * 1024;
};

/// @brief Build a zip archive from a list of files on a worker thread
class ArchiveJob
{
public:
    ArchiveJob(const std::shared_ptr<Logger>& logger);
    ~ArchiveJob();

    /// @brief Start archiving in a background thread
    /// @param request Snapshot of the files and settings to use
    /// @param error Set to the reason if the job can't be started
    /// @return True if the job was started
    bool Start(const ArchiveRequest& request, std::string& error);

    /// @brief Same as Start but runs on the calling thread
    /// @return True if the archive was created
    bool Run(const ArchiveRequest& request, std::string& error);

    /// @brief Ask the job to stop after the current file
    void Cancel();

    /// @brief Wait for the worker thread to finish
    void Wait();

    bool IsRunning() const;
    JobState GetState() const;
    /// @brief Progress in percents
    float GetProgress() const;
    std::string GetStatus() const;
    ArchiveSummary GetSummary() const;

    /// @brief Size and ratio recap displayed to the user when the job succeeds
    static std::string FormatSummary(const ArchiveSummary& summary);

private:
    bool TryAcquire(const ArchiveRequest& request, std::string& error);
    void Process(const ArchiveRequest request);
    void SetStatus(const std::string& status);

private:
    std::shared_ptr<Logger> logger;

    std::thread worker_thread;
    std::atomic<bool> is_running;
    std::atomic<bool> cancel_requested;
    std::atomic<float> progress;
    std::atomic<JobState> state;

    mutable std::mutex status_mutex;
    std::string status;
    ArchiveSummary summary;
};
