#include "zipmaker/Zip/ZipWriter.hpp"
#include "zipmaker/Compression.hpp"
#include "zipmaker/Encoder.hpp"

#include <iostream>
#include <stdexcept>
#include <tuple>

namespace
{
    template<typename T>
    void WriteLittleEndian(std::ofstream& out_file, const T value)
    {
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            out_file << static_cast<char>((value >> (8 * i)) & 0xFF);
        }
    }

    bool IsAscii(const std::string& s)
    {
        for (const char c : s)
        {
            if (static_cast<unsigned char>(c) > 0x7F)
            {
                return false;
            }
        }
        return true;
    }
}

uint16_t VersionNeededToExtract(const CompressionMethod method)
{
    switch (method)
    {
    case CompressionMethod::Store:
        return 10;
    case CompressionMethod::Deflate:
        return 20;
    case CompressionMethod::Bzip2:
        return 46;
    case CompressionMethod::Lzma:
        return 63;
    }
    return 20;
}

ZipWriter::ZipWriter(const std::filesystem::path& outpath)
{
    path = outpath;
    bytes_written = 0;
    out_file = std::ofstream(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out_file.is_open())
    {
        throw std::runtime_error("Error trying to create zip file at: " + path.string());
    }
    is_open = true;
}

ZipWriter::~ZipWriter()
{
    if (is_open)
    {
        try
        {
            Close();
        }
        catch (const std::exception& e)
        {
            std::cerr << "Error closing zip file " << path.string() << ": " << e.what() << std::endl;
        }
    }
}

std::string ZipWriter::AddEntry(const std::string& filename, const EncodedData& data, const uint32_t dos_time)
{
    CheckCanAddEntry(filename);
    if (data.payload.size() > ZipConstants::max_32bits_value || data.raw_size > ZipConstants::max_32bits_value)
    {
        throw std::runtime_error("Entry " + filename + " is too big for a zip archive without zip64");
    }

    ZipEntry entry;
    entry.name = MakeUniqueName(filename);
    entry.method = data.method;
    entry.flags = static_cast<uint16_t>((IsAscii(entry.name) ? 0 : ZipConstants::flag_utf8_name)
        | (data.method == CompressionMethod::Lzma ? ZipConstants::flag_lzma_end_marker : 0));
    entry.dos_time = dos_time;
    entry.crc = static_cast<uint32_t>(data.crc);
    entry.compressed_size = data.payload.size();
    entry.raw_size = data.raw_size;
    entry.header_offset = bytes_written;

    WriteLocalFileHeader(entry);
    out_file.write(reinterpret_cast<const char*>(data.payload.data()), data.payload.size());
    bytes_written += entry.compressed_size;

    if (!out_file)
    {
        throw std::runtime_error("Error writing entry " + entry.name + " to " + path.string());
    }

    entries.push_back(entry);
    return entry.name;
}

ZipEntry ZipWriter::AddFileEntry(const std::string& filename, const std::filesystem::path& input_path, const CompressionMethod method, const int level, const uint32_t dos_time)
{
    if (method != CompressionMethod::Store && method != CompressionMethod::Deflate)
    {
        throw std::runtime_error("Only store and deflate entries can be streamed");
    }
    CheckCanAddEntry(filename);

    ZipEntry entry;
    entry.name = MakeUniqueName(filename);
    entry.flags = static_cast<uint16_t>(IsAscii(entry.name) ? 0 : ZipConstants::flag_utf8_name);
    entry.dos_time = dos_time;
    entry.header_offset = bytes_written;

    StreamFile(entry, input_path, method, level);

    // Deflate made it bigger, write it again as stored data
    if (entry.method == CompressionMethod::Deflate && entry.compressed_size >= entry.raw_size)
    {
        Rewind(entry.header_offset);
        StreamFile(entry, input_path, CompressionMethod::Store, 0);
    }

    entries.push_back(entry);
    return entry;
}

void ZipWriter::Close()
{
    if (!is_open)
    {
        return;
    }
    is_open = false;
    WriteCentralDirectory();
    out_file.close();
    if (out_file.fail())
    {
        throw std::runtime_error("Error finishing zip file at: " + path.string());
    }
}

void ZipWriter::Discard()
{
    if (out_file.is_open())
    {
        out_file.close();
    }
    is_open = false;
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        std::cerr << "Error removing incomplete zip file " << path.string() << ": " << ec.message() << std::endl;
    }
}

const std::vector<ZipEntry>& ZipWriter::GetEntries() const
{
    return entries;
}

uint64_t ZipWriter::GetBytesWritten() const
{
    return bytes_written;
}

const std::filesystem::path& ZipWriter::GetPath() const
{
    return path;
}

void ZipWriter::StreamFile(ZipEntry& entry, const std::filesystem::path& input_path, const CompressionMethod method, const int level)
{
    std::ifstream in_file(input_path, std::ios::in | std::ios::binary);
    if (!in_file.is_open())
    {
        throw std::runtime_error("Error trying to open file: " + input_path.string());
    }

    entry.method = method;
    entry.crc = 0;
    entry.compressed_size = 0;
    entry.raw_size = 0;

    // CRC and sizes are temp values, will be set later
    WriteLocalFileHeader(entry);

    std::tuple<size_t, size_t, unsigned long> output = method == CompressionMethod::Deflate ?
        CompressRawDeflateFile(in_file, out_file, level) :
        StoreFile(in_file, out_file);
    in_file.close();

    entry.raw_size = std::get<0>(output);
    entry.compressed_size = std::get<1>(output);
    entry.crc = static_cast<uint32_t>(std::get<2>(output));
    bytes_written += entry.compressed_size;

    if (entry.raw_size > ZipConstants::max_32bits_value || entry.compressed_size > ZipConstants::max_32bits_value)
    {
        throw std::runtime_error("Entry " + entry.name + " is too big for a zip archive without zip64");
    }

    // Replace temp values now that we have the correct ones
    out_file.seekp(static_cast<std::streamoff>(entry.header_offset + 14));
    WriteLittleEndian<uint32_t>(out_file, entry.crc);
    WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.compressed_size));
    WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.raw_size));

    // Go back at the end of the file for the next entry
    out_file.seekp(0, std::ios_base::end);

    if (!out_file)
    {
        throw std::runtime_error("Error writing entry " + entry.name + " to " + path.string());
    }
}

void ZipWriter::Rewind(const uint64_t offset)
{
    out_file.close();

    std::error_code ec;
    std::filesystem::resize_file(path, offset, ec);
    if (ec)
    {
        throw std::runtime_error("Error truncating zip file " + path.string() + ": " + ec.message());
    }

    // in | out to keep the current content
    out_file.open(path, std::ios::in | std::ios::out | std::ios::binary);
    if (!out_file.is_open())
    {
        throw std::runtime_error("Error trying to reopen zip file at: " + path.string());
    }
    out_file.seekp(0, std::ios_base::end);
    bytes_written = offset;
}

std::string ZipWriter::MakeUniqueName(const std::string& filename)
{
    std::string name = filename;
    if (used_names.find(name) != used_names.end())
    {
        // file.txt --> file (2).txt, file (3).txt...
        const size_t dot = filename.find_last_of('.');
        const bool has_extension = dot != std::string::npos && dot != 0;
        const std::string stem = has_extension ? filename.substr(0, dot) : filename;
        const std::string extension = has_extension ? filename.substr(dot) : "";
        int index = 2;
        do
        {
            name = stem + " (" + std::to_string(index) + ")" + extension;
            index += 1;
        } while (used_names.find(name) != used_names.end());
    }
    used_names.insert(name);
    return name;
}

void ZipWriter::CheckCanAddEntry(const std::string& filename) const
{
    if (!is_open)
    {
        throw std::runtime_error("Trying to add an entry to a closed zip file");
    }
    if (entries.size() >= ZipConstants::max_entries)
    {
        throw std::runtime_error("Too many entries for a zip archive without zip64");
    }
    if (filename.empty())
    {
        throw std::runtime_error("Empty entry name");
    }
    // Leave room for a " (n)" suffix
    if (filename.size() > 0xFFFF - 16)
    {
        throw std::runtime_error("Entry name too long: " + filename);
    }
    if (bytes_written > ZipConstants::max_32bits_value)
    {
        throw std::runtime_error("Archive too big for a zip archive without zip64");
    }
}

void ZipWriter::WriteLocalFileHeader(const ZipEntry& entry)
{
    // Signature
    WriteLittleEndian<uint32_t>(out_file, ZipConstants::local_file_header_signature);
    // Version needed to extract (minimum)
    WriteLittleEndian<uint16_t>(out_file, VersionNeededToExtract(entry.method));
    // General purpose flag
    WriteLittleEndian<uint16_t>(out_file, entry.flags);
    // Compression method
    WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.method));
    // Last modification time
    WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.dos_time & 0xFFFF));
    // Last modification date
    WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.dos_time >> 16));
    // CRC-32 of raw data
    WriteLittleEndian<uint32_t>(out_file, entry.crc);
    // Compressed size
    WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.compressed_size));
    // Uncompressed size
    WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.raw_size));
    // File name length
    WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.name.size()));
    // Extra field length
    WriteLittleEndian<uint16_t>(out_file, 0);
    // File name
    out_file << entry.name;

    bytes_written += ZipConstants::local_file_header_size + entry.name.size();
}

void ZipWriter::WriteCentralDirectory()
{
    const uint64_t central_directory_offset = bytes_written;
    uint64_t central_directory_size = 0;

    for (const ZipEntry& entry : entries)
    {
        // Signature
        WriteLittleEndian<uint32_t>(out_file, ZipConstants::central_directory_signature);
        // Version made by
        WriteLittleEndian<uint16_t>(out_file, ZipConstants::version_made_by);
        // Version needed to extract (minimum)
        WriteLittleEndian<uint16_t>(out_file, VersionNeededToExtract(entry.method));
        // General purpose flag
        WriteLittleEndian<uint16_t>(out_file, entry.flags);
        // Compression method
        WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.method));
        // Last modification time
        WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.dos_time & 0xFFFF));
        // Last modification date
        WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.dos_time >> 16));
        // CRC-32 of raw data
        WriteLittleEndian<uint32_t>(out_file, entry.crc);
        // Compressed size
        WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.compressed_size));
        // Uncompressed size
        WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.raw_size));
        // File name length
        WriteLittleEndian<uint16_t>(out_file, static_cast<uint16_t>(entry.name.size()));
        // Extra field length
        WriteLittleEndian<uint16_t>(out_file, 0);
        // File comment length
        WriteLittleEndian<uint16_t>(out_file, 0);
        // Disk number where file starts
        WriteLittleEndian<uint16_t>(out_file, 0);
        // Internal file attributes
        WriteLittleEndian<uint16_t>(out_file, 0);
        // External file attributes (archive bit)
        WriteLittleEndian<uint32_t>(out_file, 0x20);
        // Relative offset of local file header
        WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(entry.header_offset));
        // File name
        out_file << entry.name;

        central_directory_size += ZipConstants::central_directory_header_size + entry.name.size();
    }

    if (central_directory_offset > ZipConstants::max_32bits_value ||
        central_directory_offset + central_directory_size > ZipConstants::max_32bits_value)
    {
        throw std::runtime_error("Archive too big for a zip archive without zip64");
    }

    const uint16_t number_of_records = static_cast<uint16_t>(entries.size());

    // End of central directory record
    // Signature
    WriteLittleEndian<uint32_t>(out_file, ZipConstants::end_of_central_directory_signature);
    // Number of this disk
    WriteLittleEndian<uint16_t>(out_file, 0);
    // Disk where central directory starts
    WriteLittleEndian<uint16_t>(out_file, 0);
    // Number of central directory records on this disk
    WriteLittleEndian<uint16_t>(out_file, number_of_records);
    // Total number of central directory records
    WriteLittleEndian<uint16_t>(out_file, number_of_records);
    // Size of central directory
    WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(central_directory_size));
    // Offset of start of central directory
    WriteLittleEndian<uint32_t>(out_file, static_cast<uint32_t>(central_directory_offset));
    // Comment length
    WriteLittleEndian<uint16_t>(out_file, 0);

    bytes_written += central_directory_size + ZipConstants::end_of_central_directory_size;
}
