#pragma once

#include "zipmaker/Classifier.hpp"
#include "zipmaker/enums.hpp"

#include <string>
#include <vector>

struct EncoderSettings
{
    ClassifierSettings classifier;
    /// @brief If true, whitespace in UTF-8 text files is collapsed before compression. Lossy!
    bool normalize_text = false;
};

struct EncodedData
{
    /// @brief Bytes to write in the zip entry
    std::vector<unsigned char> payload;
    CompressionMethod method;
    /// @brief Deflate level, 0 if not applicable
    int level;
    /// @brief Short description of the encoding (deflate-9, bzip2...)
    std::string label;
    /// @brief Why this method was used
    std::string reason;
    /// @brief CRC32 of the data that will be restored when extracting
    unsigned long crc;
    /// @brief Size of the data that will be restored when extracting
    size_t raw_size;
};

/// @brief Collapse whitespace runs of valid UTF-8 text, lowercase it if it's only alphanumeric
/// @param data Input bytes
/// @return Normalized text, or data unchanged if it's not valid UTF-8
std::vector<unsigned char> NormalizeText(const std::vector<unsigned char>& data);

/// @brief Encode a file content for storage in a zip entry. Never throws on codec
/// failure, falls back to store instead
/// @param data File content
/// @param choice Requested method, Auto to let the classifier decide
/// @param settings Encoder settings
/// @return Encoded data ready to be written
EncodedData EncodeEntry(std::vector<unsigned char> data, const CompressionChoice choice, const EncoderSettings& settings);
