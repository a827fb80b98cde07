#pragma once

#include "zipmaker/Zip/ZipEntry.hpp"
#include "zipmaker/enums.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <vector>

struct EncodedData;

/// @brief Write a zip archive entry by entry. Entries are stored with
/// their native zip method (store, deflate, bzip2 or lzma). No zip64,
/// so archives are limited to 65535 entries and 4GB
class ZipWriter
{
public:
    /// @brief Create the archive file, throws if it can't be opened
    ZipWriter(const std::filesystem::path& outpath);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /// @brief Add an already encoded entry
    /// @param filename Name of the entry in the archive, made unique if already used
    /// @param data Encoded content
    /// @param dos_time Modification time in MS-DOS format
    /// @return The name actually used in the archive
    std::string AddEntry(const std::string& filename, const EncodedData& data, const uint32_t dos_time);

    /// @brief Stream a file into the archive without loading it in memory.
    /// Deflated entries that don't get smaller are written again as stored
    /// @param filename Name of the entry in the archive, made unique if already used
    /// @param path Path of the file to add
    /// @param method Either Store or Deflate
    /// @param level Deflate level, ignored for Store
    /// @param dos_time Modification time in MS-DOS format
    /// @return The entry as written in the archive, its method may be Store
    /// even if Deflate was asked
    ZipEntry AddFileEntry(const std::string& filename, const std::filesystem::path& path, const CompressionMethod method, const int level, const uint32_t dos_time);

    /// @brief Write the central directory and close the file
    void Close();

    /// @brief Close the file without finishing it and delete it
    void Discard();

    const std::vector<ZipEntry>& GetEntries() const;
    uint64_t GetBytesWritten() const;
    const std::filesystem::path& GetPath() const;

private:
    std::string MakeUniqueName(const std::string& filename);
    void CheckCanAddEntry(const std::string& filename) const;
    void StreamFile(ZipEntry& entry, const std::filesystem::path& input_path, const CompressionMethod method, const int level);
    /// @brief Drop everything after offset
    void Rewind(const uint64_t offset);
    void WriteLocalFileHeader(const ZipEntry& entry);
    void WriteCentralDirectory();

private:
    std::filesystem::path path;
    std::ofstream out_file;
    bool is_open;

    std::vector<ZipEntry> entries;
    std::set<std::string> used_names;
    uint64_t bytes_written;
};
