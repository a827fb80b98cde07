#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct FileListItem
{
    std::filesystem::path path;
    uint64_t size;
};

/// @brief Human readable size, 1024 based with one decimal (512.0 B, 1.5 KB...)
std::string FormatSize(const uint64_t size);

/// @brief Ordered list of files to pack, without duplicates
class FileList
{
public:
    /// @brief Add a file to the list
    /// @param path File to add
    /// @param error Set to the reason if the file is rejected
    /// @return True if the file was added, false if it was already
    /// in the list or is not a regular file
    bool Add(const std::filesystem::path& path, std::string& error);
    bool Add(const std::filesystem::path& path);
    void Remove(const size_t index);
    void Clear();

    bool Empty() const;
    size_t Size() const;
    uint64_t TotalSize() const;
    const std::vector<FileListItem>& Items() const;

private:
    std::vector<FileListItem> items;
};
