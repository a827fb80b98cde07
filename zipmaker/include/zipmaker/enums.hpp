#pragma once

#include <string>
#include <string_view>

/// @brief Encodings an archive entry can be stored with. Values are the ZIP method ids
enum class CompressionMethod
{
    Store = 0,
    Deflate = 8,
    Bzip2 = 12,
    Lzma = 14
};

/// @brief What the user asked for, Auto lets the classifier decide
enum class CompressionChoice
{
    Auto,
    Deflate,
    Bzip2,
    Lzma,
    Store
};

std::string_view MethodToString(const CompressionMethod method);
std::string_view ChoiceToString(const CompressionChoice choice);
/// @brief Parse a user provided method name, throws std::runtime_error if unknown
CompressionChoice ChoiceFromString(const std::string& name);
