#pragma once

#include <cstddef>
#include <fstream>
#include <tuple>
#include <utility>
#include <vector>

unsigned long Crc32(const std::vector<unsigned char>& data);

/// @brief Deflate data without zlib header, as stored in zip entries
/// @param data Raw bytes
/// @param level zlib compression level (0-9)
/// @return Raw deflate stream
std::vector<unsigned char> DeflateRaw(const std::vector<unsigned char>& data, const int level);

/// @brief Try deflate levels 1, 6 and 9 and keep the smallest output
/// @param data Raw bytes
/// @return Pair of <deflate stream, level used>
std::pair<std::vector<unsigned char>, int> DeflateBest(const std::vector<unsigned char>& data);

std::vector<unsigned char> InflateRaw(const unsigned char* compressed, const size_t size, const size_t expected_size);

std::vector<unsigned char> Bzip2Compress(const std::vector<unsigned char>& data);
std::vector<unsigned char> Bzip2Decompress(const unsigned char* compressed, const size_t size, const size_t expected_size);

/// @brief Compress data in the zip LZMA layout (method 14)
/// @param data Raw bytes
/// @return Version (2 bytes) + properties size (2 bytes) + LZMA1 properties + raw LZMA1 stream with end marker
std::vector<unsigned char> LzmaCompress(const std::vector<unsigned char>& data);
std::vector<unsigned char> LzmaDecompress(const unsigned char* compressed, const size_t size, const size_t expected_size);

/// @brief Compress an input file directly to an output, without loading it in memory
/// @param src_file Source file to compress
/// @param dst_file Destination file to write to
/// @param level zlib compression level
/// @return Tuple of <size of uncompressed data, size of compressed data, CRC32 of input data>
std::tuple<size_t, size_t, unsigned long> CompressRawDeflateFile(std::ifstream& src_file, std::ofstream& dst_file, const int level);

/// @brief Copy an input file to an output, computing its CRC32 on the way
/// @return Tuple of <size of data, size of data, CRC32 of input data>
std::tuple<size_t, size_t, unsigned long> StoreFile(std::ifstream& src_file, std::ofstream& dst_file);
