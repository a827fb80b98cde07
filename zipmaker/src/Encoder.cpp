#include "zipmaker/Encoder.hpp"
#include "zipmaker/Compression.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace
{
    bool IsValidUtf8(const std::vector<unsigned char>& data)
    {
        size_t i = 0;
        while (i < data.size())
        {
            const unsigned char c = data[i];
            size_t continuation = 0;
            unsigned int code_point = 0;
            if (c < 0x80)
            {
                i += 1;
                continue;
            }
            else if ((c & 0xE0) == 0xC0)
            {
                continuation = 1;
                code_point = c & 0x1F;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                continuation = 2;
                code_point = c & 0x0F;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                continuation = 3;
                code_point = c & 0x07;
            }
            else
            {
                return false;
            }

            if (i + continuation >= data.size())
            {
                return false;
            }
            for (size_t j = 1; j <= continuation; ++j)
            {
                if ((data[i + j] & 0xC0) != 0x80)
                {
                    return false;
                }
                code_point = (code_point << 6) | (data[i + j] & 0x3F);
            }

            // Overlong encodings, surrogates and out of range values
            if ((continuation == 1 && code_point < 0x80) ||
                (continuation == 2 && code_point < 0x800) ||
                (continuation == 3 && code_point < 0x10000) ||
                (code_point >= 0xD800 && code_point <= 0xDFFF) ||
                code_point > 0x10FFFF)
            {
                return false;
            }
            i += continuation + 1;
        }
        return true;
    }

    bool IsWhitespace(const unsigned char c)
    {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    EncodedData Stored(std::vector<unsigned char>&& data, const std::string& reason)
    {
        EncodedData output;
        output.crc = Crc32(data);
        output.raw_size = data.size();
        output.payload = std::move(data);
        output.method = CompressionMethod::Store;
        output.level = 0;
        output.label = "store";
        output.reason = reason;
        return output;
    }

    CompressionMethod ChoiceToMethod(const CompressionChoice choice)
    {
        switch (choice)
        {
        case CompressionChoice::Deflate:
            return CompressionMethod::Deflate;
        case CompressionChoice::Bzip2:
            return CompressionMethod::Bzip2;
        case CompressionChoice::Lzma:
            return CompressionMethod::Lzma;
        case CompressionChoice::Store:
            return CompressionMethod::Store;
        case CompressionChoice::Auto:
            break;
        }
        throw std::runtime_error("Auto is not a compression method");
    }
}

std::vector<unsigned char> NormalizeText(const std::vector<unsigned char>& data)
{
    if (!IsValidUtf8(data))
    {
        return data;
    }

    std::vector<unsigned char> output;
    output.reserve(data.size());
    bool pending_space = false;
    for (const unsigned char c : data)
    {
        if (IsWhitespace(c))
        {
            pending_space = !output.empty();
            continue;
        }
        if (pending_space)
        {
            output.push_back(' ');
            pending_space = false;
        }
        output.push_back(c);
    }

    const bool alphanumeric = !output.empty() &&
        std::all_of(output.begin(), output.end(), [](const unsigned char c) { return std::isalnum(c) != 0; });
    if (alphanumeric)
    {
        std::transform(output.begin(), output.end(), output.begin(), [](const unsigned char c) { return static_cast<unsigned char>(std::tolower(c)); });
    }

    return output;
}

EncodedData EncodeEntry(std::vector<unsigned char> data, const CompressionChoice choice, const EncoderSettings& settings)
{
    std::string reason;
    CompressionMethod method;
    if (choice == CompressionChoice::Auto)
    {
        const Classification classification = Classify(data, settings.classifier);
        method = classification.method;
        reason = classification.reason;
    }
    else
    {
        method = ChoiceToMethod(choice);
        reason = "user choice";
    }

    if (method == CompressionMethod::Store)
    {
        return Stored(std::move(data), reason);
    }

    const size_t sample_size = std::min(data.size(), settings.classifier.sample_size);
    if (settings.normalize_text && !IsAlreadyCompressed(data.data(), sample_size))
    {
        data = NormalizeText(data);
    }

    EncodedData output;
    try
    {
        switch (method)
        {
        case CompressionMethod::Deflate:
        {
            std::pair<std::vector<unsigned char>, int> best = DeflateBest(data);
            output.payload = std::move(best.first);
            output.level = best.second;
            output.label = "deflate-" + std::to_string(best.second);
            break;
        }
        case CompressionMethod::Bzip2:
            output.payload = Bzip2Compress(data);
            output.level = 9;
            output.label = "bzip2";
            break;
        case CompressionMethod::Lzma:
            output.payload = LzmaCompress(data);
            output.level = 9;
            output.label = "lzma";
            break;
        case CompressionMethod::Store:
            break;
        }
    }
    catch (const std::runtime_error& e)
    {
        return Stored(std::move(data), std::string(MethodToString(method)) + " failed (" + e.what() + ")");
    }

    // Return original data if compression didn't help
    if (output.payload.size() >= data.size())
    {
        return Stored(std::move(data), std::string(MethodToString(method)) + " did not reduce size");
    }

    output.method = method;
    output.reason = reason;
    output.crc = Crc32(data);
    output.raw_size = data.size();
    return output;
}
