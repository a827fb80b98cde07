#pragma once

#include "zipmaker/Zip/ZipEntry.hpp"

#include <filesystem>
#include <string>
#include <vector>

/// @brief Read back archives written by ZipWriter. Only single disk archives
/// without zip64 or encryption are supported
class ZipReader
{
public:
    /// @brief Load the archive and parse its central directory, throws std::runtime_error if malformed
    ZipReader(const std::filesystem::path& path);

    const std::vector<ZipEntry>& GetEntries() const;

    /// @brief Decompress an entry and check its CRC
    /// @param index Index of the entry in the central directory
    /// @return The entry original content
    std::vector<unsigned char> Extract(const size_t index) const;

    /// @brief Extract every entry and check its CRC
    /// @return Names of the entries that failed, empty if the archive is valid
    std::vector<std::string> Verify() const;

private:
    void ReadCentralDirectory();

private:
    std::filesystem::path path;
    std::vector<unsigned char> data;
    std::vector<ZipEntry> entries;
};
