#pragma once

#include "zipmaker/enums.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace ZipConstants
{
    constexpr uint32_t local_file_header_signature = 0x04034b50;
    constexpr uint32_t central_directory_signature = 0x02014b50;
    constexpr uint32_t end_of_central_directory_signature = 0x06054b50;

    constexpr size_t local_file_header_size = 30;
    constexpr size_t central_directory_header_size = 46;
    constexpr size_t end_of_central_directory_size = 22;

    constexpr uint16_t version_made_by = 63;

    constexpr uint16_t flag_lzma_end_marker = 1 << 1;
    constexpr uint16_t flag_utf8_name = 1 << 11;

    constexpr uint64_t max_32bits_value = 0xFFFFFFFF;
    constexpr size_t max_entries = 0xFFFF;
}

/// @brief Everything the central directory needs to know about an entry
struct ZipEntry
{
    std::string name;
    CompressionMethod method = CompressionMethod::Store;
    uint16_t flags = 0;
    uint32_t dos_time = 0;
    uint32_t crc = 0;
    uint64_t compressed_size = 0;
    uint64_t raw_size = 0;
    uint64_t header_offset = 0;
};

/// @brief Minimum zip specification version required to extract an entry compressed with this method
uint16_t VersionNeededToExtract(const CompressionMethod method);
