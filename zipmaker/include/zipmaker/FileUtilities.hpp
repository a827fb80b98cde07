#pragma once

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

/// @brief Get the last modification time of a file
/// @param path File path
/// @return Modification timestamp, -1 if the file can't be accessed
const std::time_t GetModifiedTimestamp(const std::string& path);

/// @brief Load a whole file in memory, throws std::runtime_error on failure
std::vector<unsigned char> ReadFileContent(const std::filesystem::path& path);

/// @brief Load at most size bytes from the beginning of a file, throws std::runtime_error on failure
std::vector<unsigned char> ReadFileSample(const std::filesystem::path& path, const size_t size);
