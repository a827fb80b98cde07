#include "zipmaker/Compression.hpp"

#include <zlib.h>
#include <bzlib.h>
#include <lzma.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace
{
    constexpr size_t STREAM_BUFFER_SIZE = 64 * 1024;
    // lc/lp/pb byte followed by the 32 bits dictionary size
    constexpr size_t LZMA1_PROPS_SIZE = 5;
    // Size of the version + properties size + LZMA1 properties prefix of method 14 entries
    constexpr size_t ZIP_LZMA_HEADER_SIZE = 4 + LZMA1_PROPS_SIZE;

    void CheckUIntRange(const size_t size)
    {
        if (size > std::numeric_limits<unsigned int>::max())
        {
            throw std::runtime_error("Data too big to be compressed in a single zip entry");
        }
    }

    std::string LzmaErrorToString(const lzma_ret ret)
    {
        switch (ret)
        {
        case LZMA_MEM_ERROR:
            return "memory allocation failed";
        case LZMA_OPTIONS_ERROR:
            return "unsupported options";
        case LZMA_DATA_ERROR:
            return "corrupted data";
        case LZMA_BUF_ERROR:
            return "truncated data";
        case LZMA_PROG_ERROR:
            return "invalid arguments";
        default:
            return "error code " + std::to_string(static_cast<int>(ret));
        }
    }
}

unsigned long Crc32(const std::vector<unsigned char>& data)
{
    CheckUIntRange(data.size());
    uLong crc = crc32(0L, Z_NULL, 0);
    return crc32(crc, data.data(), static_cast<uInt>(data.size()));
}

std::vector<unsigned char> DeflateRaw(const std::vector<unsigned char>& data, const int level)
{
    CheckUIntRange(data.size());

    z_stream strm;
    memset(&strm, 0, sizeof(strm));
    int res = deflateInit2(&strm, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY);
    if (res != Z_OK)
    {
        throw std::runtime_error("deflateInit failed: " + std::string(strm.msg != nullptr ? strm.msg : "unknown error"));
    }

    std::vector<unsigned char> compressed_data(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<unsigned char*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed_data.data();
    strm.avail_out = static_cast<uInt>(compressed_data.size());

    res = deflate(&strm, Z_FINISH);
    if (res != Z_STREAM_END)
    {
        deflateEnd(&strm);
        throw std::runtime_error("Deflate compression failed: " + std::string(strm.msg != nullptr ? strm.msg : "output buffer too small"));
    }

    // Shrink to keep only real data
    compressed_data.resize(strm.total_out);
    deflateEnd(&strm);
    return compressed_data;
}

std::pair<std::vector<unsigned char>, int> DeflateBest(const std::vector<unsigned char>& data)
{
    std::vector<unsigned char> best;
    int best_level = -1;
    for (const int level : { 1, 6, 9 })
    {
        std::vector<unsigned char> compressed = DeflateRaw(data, level);
        if (best_level == -1 || compressed.size() < best.size())
        {
            best = std::move(compressed);
            best_level = level;
        }
    }
    return { best, best_level };
}

std::vector<unsigned char> InflateRaw(const unsigned char* compressed, const size_t size, const size_t expected_size)
{
    CheckUIntRange(size);

    std::vector<unsigned char> decompressed_data;
    decompressed_data.reserve(expected_size);

    std::vector<unsigned char> buffer(STREAM_BUFFER_SIZE);

    z_stream strm;
    memset(&strm, 0, sizeof(strm));
    strm.next_in = const_cast<unsigned char*>(compressed);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = buffer.data();
    strm.avail_out = static_cast<uInt>(buffer.size());

    int res = inflateInit2(&strm, -15);
    if (res != Z_OK)
    {
        throw std::runtime_error("inflateInit failed: " + std::string(strm.msg != nullptr ? strm.msg : "unknown error"));
    }

    for (;;)
    {
        res = inflate(&strm, Z_NO_FLUSH);
        switch (res)
        {
        case Z_OK:
            if (strm.avail_in == 0 && strm.avail_out != 0)
            {
                inflateEnd(&strm);
                throw std::runtime_error("Inflate decompression failed: truncated stream");
            }
            decompressed_data.insert(decompressed_data.end(), buffer.begin(), buffer.end() - strm.avail_out);
            strm.next_out = buffer.data();
            strm.avail_out = static_cast<uInt>(buffer.size());
            break;
        case Z_STREAM_END:
            decompressed_data.insert(decompressed_data.end(), buffer.begin(), buffer.end() - strm.avail_out);
            inflateEnd(&strm);
            return decompressed_data;
        default:
        {
            const std::string msg = strm.msg != nullptr ? strm.msg : "error code " + std::to_string(res);
            inflateEnd(&strm);
            throw std::runtime_error("Inflate decompression failed: " + msg);
        }
        }
    }
}

std::vector<unsigned char> Bzip2Compress(const std::vector<unsigned char>& data)
{
    CheckUIntRange(data.size());

    // Worst case expansion documented by libbzip2
    unsigned int compressed_size = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
    std::vector<unsigned char> compressed_data(compressed_size);

    const int res = BZ2_bzBuffToBuffCompress(
        reinterpret_cast<char*>(compressed_data.data()), &compressed_size,
        const_cast<char*>(reinterpret_cast<const char*>(data.data())), static_cast<unsigned int>(data.size()),
        9, 0, 0);
    if (res != BZ_OK)
    {
        throw std::runtime_error("Bzip2 compression failed: error code " + std::to_string(res));
    }

    compressed_data.resize(compressed_size);
    return compressed_data;
}

std::vector<unsigned char> Bzip2Decompress(const unsigned char* compressed, const size_t size, const size_t expected_size)
{
    CheckUIntRange(size);
    CheckUIntRange(expected_size);

    // One extra byte so a stream longer than announced is detected instead of silently truncated
    unsigned int decompressed_size = static_cast<unsigned int>(expected_size + 1);
    std::vector<unsigned char> decompressed_data(decompressed_size);

    const int res = BZ2_bzBuffToBuffDecompress(
        reinterpret_cast<char*>(decompressed_data.data()), &decompressed_size,
        const_cast<char*>(reinterpret_cast<const char*>(compressed)), static_cast<unsigned int>(size),
        0, 0);
    if (res != BZ_OK)
    {
        throw std::runtime_error("Bzip2 decompression failed: error code " + std::to_string(res));
    }

    decompressed_data.resize(decompressed_size);
    return decompressed_data;
}

std::vector<unsigned char> LzmaCompress(const std::vector<unsigned char>& data)
{
    lzma_options_lzma options;
    if (lzma_lzma_preset(&options, 9))
    {
        throw std::runtime_error("Lzma compression failed: unsupported preset");
    }
    // A dictionary bigger than the input only costs memory
    const size_t wanted_dict_size = std::max<size_t>(data.size(), LZMA_DICT_SIZE_MIN);
    if (wanted_dict_size < options.dict_size)
    {
        options.dict_size = static_cast<uint32_t>(wanted_dict_size);
    }

    lzma_filter filters[2] = {
        { LZMA_FILTER_LZMA1, &options },
        { LZMA_VLI_UNKNOWN, nullptr }
    };

    std::vector<unsigned char> compressed_data(ZIP_LZMA_HEADER_SIZE);
    // LZMA SDK version, informative only
    compressed_data[0] = static_cast<unsigned char>(LZMA_VERSION_MAJOR);
    compressed_data[1] = static_cast<unsigned char>(LZMA_VERSION_MINOR);
    // Properties size, little endian
    compressed_data[2] = static_cast<unsigned char>(LZMA1_PROPS_SIZE);
    compressed_data[3] = 0x00;
    lzma_ret ret = lzma_properties_encode(&filters[0], compressed_data.data() + 4);
    if (ret != LZMA_OK)
    {
        throw std::runtime_error("Lzma properties encoding failed: " + LzmaErrorToString(ret));
    }

    lzma_stream strm = LZMA_STREAM_INIT;
    ret = lzma_raw_encoder(&strm, filters);
    if (ret != LZMA_OK)
    {
        throw std::runtime_error("Lzma encoder init failed: " + LzmaErrorToString(ret));
    }

    std::vector<unsigned char> buffer(STREAM_BUFFER_SIZE);
    strm.next_in = data.data();
    strm.avail_in = data.size();

    do
    {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END)
        {
            lzma_end(&strm);
            throw std::runtime_error("Lzma compression failed: " + LzmaErrorToString(ret));
        }
        compressed_data.insert(compressed_data.end(), buffer.begin(), buffer.end() - strm.avail_out);
    } while (ret != LZMA_STREAM_END);

    lzma_end(&strm);
    return compressed_data;
}

std::vector<unsigned char> LzmaDecompress(const unsigned char* compressed, const size_t size, const size_t expected_size)
{
    if (size < ZIP_LZMA_HEADER_SIZE)
    {
        throw std::runtime_error("Lzma decompression failed: missing header");
    }
    const size_t props_size = compressed[2] | (compressed[3] << 8);
    if (props_size != LZMA1_PROPS_SIZE)
    {
        throw std::runtime_error("Lzma decompression failed: unexpected properties size " + std::to_string(props_size));
    }

    lzma_filter filters[2] = {
        { LZMA_FILTER_LZMA1, nullptr },
        { LZMA_VLI_UNKNOWN, nullptr }
    };
    lzma_ret ret = lzma_properties_decode(&filters[0], nullptr, compressed + 4, LZMA1_PROPS_SIZE);
    if (ret != LZMA_OK)
    {
        throw std::runtime_error("Lzma properties decoding failed: " + LzmaErrorToString(ret));
    }

    lzma_stream strm = LZMA_STREAM_INIT;
    ret = lzma_raw_decoder(&strm, filters);
    // Options were allocated by lzma_properties_decode with the default allocator
    free(filters[0].options);
    if (ret != LZMA_OK)
    {
        throw std::runtime_error("Lzma decoder init failed: " + LzmaErrorToString(ret));
    }

    std::vector<unsigned char> decompressed_data;
    decompressed_data.reserve(expected_size);
    std::vector<unsigned char> buffer(STREAM_BUFFER_SIZE);
    strm.next_in = compressed + ZIP_LZMA_HEADER_SIZE;
    strm.avail_in = size - ZIP_LZMA_HEADER_SIZE;

    do
    {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END)
        {
            lzma_end(&strm);
            throw std::runtime_error("Lzma decompression failed: " + LzmaErrorToString(ret));
        }
        decompressed_data.insert(decompressed_data.end(), buffer.begin(), buffer.end() - strm.avail_out);
    } while (ret != LZMA_STREAM_END);

    lzma_end(&strm);
    return decompressed_data;
}

std::tuple<size_t, size_t, unsigned long> CompressRawDeflateFile(std::ifstream& src_file, std::ofstream& dst_file, const int level)
{
    z_stream strm;
    memset(&strm, 0, sizeof(strm));
    int res = deflateInit2(&strm, level, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY);
    if (res != Z_OK)
    {
        throw std::runtime_error("deflateInit failed: " + std::string(strm.msg != nullptr ? strm.msg : "unknown error"));
    }

    std::vector<char> src_buffer(STREAM_BUFFER_SIZE);
    std::vector<char> dst_buffer(STREAM_BUFFER_SIZE);

    size_t src_size = 0;
    size_t dst_size = 0;
    uLong crc = crc32(0L, Z_NULL, 0);

    do
    {
        src_file.read(src_buffer.data(), src_buffer.size());
        const uInt read_count = static_cast<uInt>(src_file.gcount());
        if (src_file.bad())
        {
            deflateEnd(&strm);
            throw std::runtime_error("Error reading file while compressing");
        }
        strm.avail_in = read_count;
        strm.next_in = reinterpret_cast<unsigned char*>(src_buffer.data());
        src_size += read_count;

        crc = crc32(crc, reinterpret_cast<const unsigned char*>(src_buffer.data()), read_count);

        do
        {
            strm.avail_out = static_cast<uInt>(dst_buffer.size());
            strm.next_out = reinterpret_cast<unsigned char*>(dst_buffer.data());
            deflate(&strm, src_file.eof() ? Z_FINISH : Z_NO_FLUSH);
            const std::streamsize out_count = dst_buffer.size() - strm.avail_out;
            dst_file.write(dst_buffer.data(), out_count);
            dst_size += out_count;
        } while (strm.avail_out == 0);
    } while (!src_file.eof());

    deflateEnd(&strm);

    if (!dst_file)
    {
        throw std::runtime_error("Error writing compressed data");
    }

    return { src_size, dst_size, crc };
}

std::tuple<size_t, size_t, unsigned long> StoreFile(std::ifstream& src_file, std::ofstream& dst_file)
{
    std::vector<char> buffer(STREAM_BUFFER_SIZE);
    size_t size = 0;
    uLong crc = crc32(0L, Z_NULL, 0);

    do
    {
        src_file.read(buffer.data(), buffer.size());
        const uInt read_count = static_cast<uInt>(src_file.gcount());
        if (src_file.bad())
        {
            throw std::runtime_error("Error reading file while storing");
        }
        crc = crc32(crc, reinterpret_cast<const unsigned char*>(buffer.data()), read_count);
        dst_file.write(buffer.data(), read_count);
        size += read_count;
    } while (!src_file.eof());

    if (!dst_file)
    {
        throw std::runtime_error("Error writing stored data");
    }

    return { size, size, crc };
}
