#pragma once

#include "zipmaker/enums.hpp"

#include <cstddef>
#include <string>
#include <vector>

struct ClassifierSettings
{
    size_t sample_size = 4096;
    size_t small_file_threshold = 1024;
    double high_entropy_threshold = 7.5;
    double medium_entropy_threshold = 6.5;
};

struct Classification
{
    CompressionMethod method;
    /// @brief Entropy of the sample in bits per byte, -1 if not computed
    double entropy;
    std::string reason;
};

/// @brief Shannon entropy of a byte sequence
/// @param data Pointer to the first byte
/// @param size Number of bytes
/// @return Entropy in bits per byte, between 0 and 8. 0 for an empty input
double ShannonEntropy(const unsigned char* data, const size_t size);

/// @brief Check if data starts with the signature of a compressed file format (zip, gzip, png...)
bool IsAlreadyCompressed(const unsigned char* data, const size_t size);

/// @brief Choose the compression method for a whole file content
/// @param data File content
/// @param settings Sample size and thresholds
/// @return The chosen method, with the measured entropy and a human readable reason
Classification Classify(const std::vector<unsigned char>& data, const ClassifierSettings& settings);
