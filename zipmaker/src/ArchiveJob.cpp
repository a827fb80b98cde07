#include "zipmaker/ArchiveJob.hpp"
#include "zipmaker/Classifier.hpp"
#include "zipmaker/FileUtilities.hpp"
#include "zipmaker/Logger.hpp"
#include "zipmaker/Zip/DosTime.hpp"
#include "zipmaker/Zip/ZipReader.hpp"
#include "zipmaker/Zip/ZipWriter.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

ArchiveJob::ArchiveJob(const std::shared_ptr<Logger>& logger_)
{
    logger = logger_;
    is_running = false;
    cancel_requested = false;
    progress = 0.0f;
    state = JobState::Idle;
    status = "Ready";
}

ArchiveJob::~ArchiveJob()
{
    Cancel();
    Wait();
}

bool ArchiveJob::Start(const ArchiveRequest& request, std::string& error)
{
    if (!TryAcquire(request, error))
    {
        return false;
    }

    // Previous job is over, but its thread still needs to be joined
    if (worker_thread.joinable())
    {
        worker_thread.join();
    }
    worker_thread = std::thread(&ArchiveJob::Process, this, request);
    return true;
}

bool ArchiveJob::Run(const ArchiveRequest& request, std::string& error)
{
    if (!TryAcquire(request, error))
    {
        return false;
    }

    Process(request);

    if (state != JobState::Succeeded)
    {
        error = GetStatus();
        return false;
    }
    return true;
}

void ArchiveJob::Cancel()
{
    if (is_running)
    {
        cancel_requested = true;
    }
}

void ArchiveJob::Wait()
{
    if (worker_thread.joinable())
    {
        worker_thread.join();
    }
}

bool ArchiveJob::IsRunning() const
{
    return is_running;
}

JobState ArchiveJob::GetState() const
{
    return state;
}

float ArchiveJob::GetProgress() const
{
    return progress;
}

std::string ArchiveJob::GetStatus() const
{
    std::scoped_lock<std::mutex> lock(status_mutex);
    return status;
}

ArchiveSummary ArchiveJob::GetSummary() const
{
    std::scoped_lock<std::mutex> lock(status_mutex);
    return summary;
}

std::string ArchiveJob::FormatSummary(const ArchiveSummary& summary)
{
    std::stringstream ss;
    ss << "Zip file created successfully!\n"
        << "Original size: " << FormatSize(summary.original_size) << "\n"
        << "Compressed size: " << FormatSize(summary.compressed_size) << "\n"
        << "Compression ratio: " << std::fixed << std::setprecision(1) << summary.ratio << "%";
    return ss.str();
}

bool ArchiveJob::TryAcquire(const ArchiveRequest& request, std::string& error)
{
    if (request.files.empty())
    {
        error = "No files selected!";
        return false;
    }
    if (request.output_path.empty())
    {
        error = "No output file selected!";
        return false;
    }

    bool expected = false;
    if (!is_running.compare_exchange_strong(expected, true))
    {
        error = "Already processing!";
        return false;
    }

    cancel_requested = false;
    progress = 0.0f;
    state = JobState::Running;
    {
        std::scoped_lock<std::mutex> lock(status_mutex);
        summary = ArchiveSummary();
    }
    return true;
}

void ArchiveJob::Process(const ArchiveRequest request)
{
    logger->Info("Creating " + request.output_path.string() + " with " + std::to_string(request.files.size()) +
        " file(s), method: " + std::string(ChoiceToString(request.choice)));

    ArchiveSummary local_summary;
    std::unique_ptr<ZipWriter> writer;
    try
    {
        writer = std::make_unique<ZipWriter>(request.output_path);

        const size_t total_files = request.files.size();
        for (size_t index = 0; index < total_files; ++index)
        {
            if (cancel_requested)
            {
                writer->Discard();
                state = JobState::Cancelled;
                SetStatus("Cancelled");
                logger->Warning("Archive creation cancelled, " + request.output_path.string() + " removed");
                break;
            }

            const std::filesystem::path& file_path = request.files[index].path;
            const std::string name = file_path.filename().u8string();
            SetStatus("Processing: " + name);

            const std::time_t modified = GetModifiedTimestamp(file_path.string());
            const uint32_t dos_time = modified == -1 ? DosTime::Now() : DosTime::FromTimeT(modified);

            EntryReport report;
            report.source = file_path.string();

            std::error_code ec;
            const uint64_t file_size = std::filesystem::file_size(file_path, ec);
            if (ec)
            {
                throw std::runtime_error("Can't access " + file_path.string() + ": " + ec.message());
            }

            // Store and big files are streamed, except if they need bzip2 or lzma
            bool streamed = false;
            CompressionMethod streamed_method = CompressionMethod::Store;
            if (request.choice == CompressionChoice::Store)
            {
                streamed = true;
                report.reason = "user choice";
            }
            else if (file_size > request.streaming_threshold && request.choice == CompressionChoice::Deflate)
            {
                streamed = true;
                streamed_method = CompressionMethod::Deflate;
                report.reason = "user choice";
            }
            else if (file_size > request.streaming_threshold && request.choice == CompressionChoice::Auto)
            {
                const std::vector<unsigned char> sample = ReadFileSample(file_path, request.settings.classifier.sample_size);
                ClassifierSettings sample_settings = request.settings.classifier;
                // Only the sample is loaded, but the file is not small
                sample_settings.small_file_threshold = 0;
                const Classification classification = Classify(sample, sample_settings);
                if (classification.method == CompressionMethod::Store || classification.method == CompressionMethod::Deflate)
                {
                    streamed = true;
                    streamed_method = classification.method;
                    report.reason = classification.reason;
                }
            }

            if (streamed)
            {
                const ZipEntry entry = writer->AddFileEntry(name, file_path, streamed_method, 9, dos_time);
                report.entry_name = entry.name;
                report.label = entry.method == CompressionMethod::Deflate ? "deflate-9" : "store";
                if (entry.method != streamed_method)
                {
                    report.reason = std::string(MethodToString(streamed_method)) + " did not reduce size";
                }
                report.original_size = entry.raw_size;
                report.stored_size = entry.compressed_size;
            }
            else
            {
                const EncodedData encoded = EncodeEntry(ReadFileContent(file_path), request.choice, request.settings);
                report.entry_name = writer->AddEntry(name, encoded, dos_time);
                report.label = encoded.label;
                report.reason = encoded.reason;
                // Normalized text is smaller than the file, but the user gave us the file
                report.original_size = file_size;
                report.stored_size = encoded.payload.size();
            }

            logger->Info(report.entry_name + ": " + report.label + " (" + report.reason + ") " +
                FormatSize(report.original_size) + " --> " + FormatSize(report.stored_size));

            local_summary.original_size += report.original_size;
            local_summary.compressed_size += report.stored_size;
            local_summary.entries.push_back(report);

            progress = static_cast<float>(index + 1) / total_files * 100.0f;
        }

        if (state == JobState::Running)
        {
            writer->Close();

            if (request.verify)
            {
                SetStatus("Verifying: " + request.output_path.filename().u8string());
                const std::vector<std::string> failed = ZipReader(request.output_path).Verify();
                if (!failed.empty())
                {
                    std::string names;
                    for (const std::string& n : failed)
                    {
                        names += (names.empty() ? "" : ", ") + n;
                    }
                    throw std::runtime_error("Verification failed for: " + names);
                }
                logger->Info("Verification of " + request.output_path.string() + " succeeded");
            }

            local_summary.ratio = local_summary.original_size == 0 ? 0.0 :
                (1.0 - static_cast<double>(local_summary.compressed_size) / local_summary.original_size) * 100.0;

            const std::string message = FormatSummary(local_summary);
            {
                std::scoped_lock<std::mutex> lock(status_mutex);
                summary = local_summary;
                status = message;
            }
            state = JobState::Succeeded;
            logger->Info(message);
        }
    }
    catch (const std::exception& e)
    {
        if (writer != nullptr)
        {
            writer->Discard();
        }
        state = JobState::Failed;
        SetStatus(std::string("Error: ") + e.what());
        logger->Error(std::string("Error creating zip file: ") + e.what());
    }

    progress = 0.0f;
    is_running = false;
}

void ArchiveJob::SetStatus(const std::string& status_)
{
    std::scoped_lock<std::mutex> lock(status_mutex);
    status = status_;
}
