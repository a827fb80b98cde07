#include "zipmaker/Classifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace
{
    // Magic numbers of formats that won't shrink any further
    const std::array<std::string_view, 9> compressed_signatures = {
        std::string_view("PK\x03\x04", 4),              // zip
        std::string_view("\x1f\x8b", 2),                // gzip
        std::string_view("BZh", 3),                     // bzip2
        std::string_view("\xFD" "7zXZ", 5),             // xz
        std::string_view("\x89PNG", 4),                 // png
        std::string_view("\xFF\xD8\xFF", 3),            // jpeg
        std::string_view("7z\xBC\xAF\x27\x1C", 6),      // 7z
        std::string_view("\x28\xB5\x2F\xFD", 4),        // zstd
        std::string_view("Rar!\x1A\x07", 6),            // rar
    };

    std::string FormatEntropy(const double entropy)
    {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(2) << entropy;
        return ss.str();
    }
}

double ShannonEntropy(const unsigned char* data, const size_t size)
{
    if (size == 0)
    {
        return 0.0;
    }

    std::array<size_t, 256> counts = {};
    for (size_t i = 0; i < size; ++i)
    {
        counts[data[i]] += 1;
    }

    double entropy = 0.0;
    const double total = static_cast<double>(size);
    for (const size_t count : counts)
    {
        if (count == 0)
        {
            continue;
        }
        const double probability = count / total;
        entropy -= probability * std::log2(probability);
    }

    // Rounding can give a tiny negative value for single symbol inputs
    return std::max(0.0, entropy);
}

bool IsAlreadyCompressed(const unsigned char* data, const size_t size)
{
    for (const std::string_view& signature : compressed_signatures)
    {
        if (size >= signature.size() && std::memcmp(data, signature.data(), signature.size()) == 0)
        {
            return true;
        }
    }
    return false;
}

Classification Classify(const std::vector<unsigned char>& data, const ClassifierSettings& settings)
{
    const size_t sample_size = std::min(data.size(), settings.sample_size);

    if (IsAlreadyCompressed(data.data(), sample_size))
    {
        return Classification{ CompressionMethod::Store, -1.0, "already compressed format" };
    }

    if (data.size() < settings.small_file_threshold)
    {
        return Classification{ CompressionMethod::Deflate, -1.0, "small file" };
    }

    const double entropy = ShannonEntropy(data.data(), sample_size);
    if (entropy > settings.high_entropy_threshold)
    {
        return Classification{ CompressionMethod::Lzma, entropy, "high entropy (" + FormatEntropy(entropy) + " bits/byte)" };
    }
    if (entropy > settings.medium_entropy_threshold)
    {
        return Classification{ CompressionMethod::Bzip2, entropy, "medium entropy (" + FormatEntropy(entropy) + " bits/byte)" };
    }
    return Classification{ CompressionMethod::Deflate, entropy, "low entropy (" + FormatEntropy(entropy) + " bits/byte)" };
}
