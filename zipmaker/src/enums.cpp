#include "zipmaker/enums.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

std::string_view MethodToString(const CompressionMethod method)
{
    switch (method)
    {
    case CompressionMethod::Store:
        return "store";
    case CompressionMethod::Deflate:
        return "deflate";
    case CompressionMethod::Bzip2:
        return "bzip2";
    case CompressionMethod::Lzma:
        return "lzma";
    }
    return "unknown";
}

std::string_view ChoiceToString(const CompressionChoice choice)
{
    switch (choice)
    {
    case CompressionChoice::Auto:
        return "auto";
    case CompressionChoice::Deflate:
        return "deflate";
    case CompressionChoice::Bzip2:
        return "bzip2";
    case CompressionChoice::Lzma:
        return "lzma";
    case CompressionChoice::Store:
        return "store";
    }
    return "unknown";
}

CompressionChoice ChoiceFromString(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto")
    {
        return CompressionChoice::Auto;
    }
    // zlib was the historical name of the deflate choice
    if (lower == "deflate" || lower == "zlib")
    {
        return CompressionChoice::Deflate;
    }
    if (lower == "bzip2")
    {
        return CompressionChoice::Bzip2;
    }
    if (lower == "lzma")
    {
        return CompressionChoice::Lzma;
    }
    if (lower == "store")
    {
        return CompressionChoice::Store;
    }
    throw std::runtime_error("Unknown compression method: " + name);
}
