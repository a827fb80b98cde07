#include "zipmaker/Zip/ZipReader.hpp"
#include "zipmaker/Compression.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace
{
    template<typename T>
    T ReadLittleEndian(const std::vector<unsigned char>& data, const size_t offset)
    {
        if (offset + sizeof(T) > data.size())
        {
            throw std::runtime_error("Unexpected end of zip data");
        }
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i)
        {
            value |= static_cast<T>(static_cast<T>(data[offset + i]) << (8 * i));
        }
        return value;
    }
}

ZipReader::ZipReader(const std::filesystem::path& path_)
{
    path = path_;

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Error trying to open zip file at: " + path.string());
    }
    file.unsetf(std::ios::skipws);
    data = std::vector<unsigned char>((std::istream_iterator<char>(file)), std::istream_iterator<char>());
    file.close();

    ReadCentralDirectory();
}

const std::vector<ZipEntry>& ZipReader::GetEntries() const
{
    return entries;
}

std::vector<unsigned char> ZipReader::Extract(const size_t index) const
{
    if (index >= entries.size())
    {
        throw std::runtime_error("Invalid zip entry index: " + std::to_string(index));
    }
    const ZipEntry& entry = entries[index];

    const size_t header_offset = static_cast<size_t>(entry.header_offset);
    if (ReadLittleEndian<uint32_t>(data, header_offset) != ZipConstants::local_file_header_signature)
    {
        throw std::runtime_error("Invalid local header for entry " + entry.name);
    }
    const uint16_t name_length = ReadLittleEndian<uint16_t>(data, header_offset + 26);
    const uint16_t extra_length = ReadLittleEndian<uint16_t>(data, header_offset + 28);
    const size_t payload_offset = header_offset + ZipConstants::local_file_header_size + name_length + extra_length;
    if (payload_offset + entry.compressed_size > data.size())
    {
        throw std::runtime_error("Truncated data for entry " + entry.name);
    }

    const unsigned char* payload = data.data() + payload_offset;
    const size_t payload_size = static_cast<size_t>(entry.compressed_size);
    const size_t raw_size = static_cast<size_t>(entry.raw_size);

    std::vector<unsigned char> output;
    switch (entry.method)
    {
    case CompressionMethod::Store:
        output = std::vector<unsigned char>(payload, payload + payload_size);
        break;
    case CompressionMethod::Deflate:
        output = InflateRaw(payload, payload_size, raw_size);
        break;
    case CompressionMethod::Bzip2:
        output = Bzip2Decompress(payload, payload_size, raw_size);
        break;
    case CompressionMethod::Lzma:
        output = LzmaDecompress(payload, payload_size, raw_size);
        break;
    default:
        throw std::runtime_error("Unsupported compression method for entry " + entry.name);
    }

    if (output.size() != raw_size)
    {
        throw std::runtime_error("Size mismatch for entry " + entry.name);
    }
    if (Crc32(output) != entry.crc)
    {
        throw std::runtime_error("CRC mismatch for entry " + entry.name);
    }

    return output;
}

std::vector<std::string> ZipReader::Verify() const
{
    std::vector<std::string> failed;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        try
        {
            Extract(i);
        }
        catch (const std::runtime_error&)
        {
            failed.push_back(entries[i].name);
        }
    }
    return failed;
}

void ZipReader::ReadCentralDirectory()
{
    if (data.size() < ZipConstants::end_of_central_directory_size)
    {
        throw std::runtime_error("File too small to be a zip archive: " + path.string());
    }

    // End of central directory record is at the end, followed by a comment of at most 65535 bytes
    size_t eocd_offset = data.size() - ZipConstants::end_of_central_directory_size;
    const size_t search_limit = eocd_offset > 0xFFFF ? eocd_offset - 0xFFFF : 0;
    while (ReadLittleEndian<uint32_t>(data, eocd_offset) != ZipConstants::end_of_central_directory_signature)
    {
        if (eocd_offset == search_limit)
        {
            throw std::runtime_error("End of central directory not found in " + path.string());
        }
        eocd_offset -= 1;
    }

    const uint16_t number_of_records = ReadLittleEndian<uint16_t>(data, eocd_offset + 10);
    const uint32_t central_directory_size = ReadLittleEndian<uint32_t>(data, eocd_offset + 12);
    const uint32_t central_directory_offset = ReadLittleEndian<uint32_t>(data, eocd_offset + 16);
    if (static_cast<size_t>(central_directory_offset) + central_directory_size > eocd_offset)
    {
        throw std::runtime_error("Invalid central directory in " + path.string());
    }

    entries.clear();
    entries.reserve(number_of_records);
    size_t offset = central_directory_offset;
    for (uint16_t i = 0; i < number_of_records; ++i)
    {
        if (ReadLittleEndian<uint32_t>(data, offset) != ZipConstants::central_directory_signature)
        {
            throw std::runtime_error("Invalid central directory record in " + path.string());
        }
        ZipEntry entry;
        entry.flags = ReadLittleEndian<uint16_t>(data, offset + 8);
        const uint16_t method = ReadLittleEndian<uint16_t>(data, offset + 10);
        if (method != static_cast<uint16_t>(CompressionMethod::Store) &&
            method != static_cast<uint16_t>(CompressionMethod::Deflate) &&
            method != static_cast<uint16_t>(CompressionMethod::Bzip2) &&
            method != static_cast<uint16_t>(CompressionMethod::Lzma))
        {
            throw std::runtime_error("Unsupported compression method " + std::to_string(method) + " in " + path.string());
        }
        entry.method = static_cast<CompressionMethod>(method);
        entry.dos_time = ReadLittleEndian<uint16_t>(data, offset + 12) | (static_cast<uint32_t>(ReadLittleEndian<uint16_t>(data, offset + 14)) << 16);
        entry.crc = ReadLittleEndian<uint32_t>(data, offset + 16);
        entry.compressed_size = ReadLittleEndian<uint32_t>(data, offset + 20);
        entry.raw_size = ReadLittleEndian<uint32_t>(data, offset + 24);
        const uint16_t name_length = ReadLittleEndian<uint16_t>(data, offset + 28);
        const uint16_t extra_length = ReadLittleEndian<uint16_t>(data, offset + 30);
        const uint16_t comment_length = ReadLittleEndian<uint16_t>(data, offset + 32);
        entry.header_offset = ReadLittleEndian<uint32_t>(data, offset + 42);

        const size_t name_offset = offset + ZipConstants::central_directory_header_size;
        if (name_offset + name_length > data.size())
        {
            throw std::runtime_error("Unexpected end of zip data");
        }
        entry.name = std::string(data.begin() + name_offset, data.begin() + name_offset + name_length);

        entries.push_back(entry);
        offset = name_offset + name_length + extra_length + comment_length;
    }
}
