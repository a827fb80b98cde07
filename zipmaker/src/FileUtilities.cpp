#include "zipmaker/FileUtilities.hpp"

#include <fstream>
#include <stdexcept>
#include <sys/types.h>
#include <sys/stat.h>

#ifndef WIN32
#include <unistd.h>
#else
#define stat _stat
#endif

const std::time_t GetModifiedTimestamp(const std::string& path)
{
    struct stat result;
    if (stat(path.c_str(), &result) == 0)
    {
        return result.st_mtime;
    }
    return -1;
}

std::vector<unsigned char> ReadFileContent(const std::filesystem::path& path)
{
    std::ifstream file(path, std::ios::in | std::ios::binary | std::ios::ate);
    if (!file.is_open())
    {
        throw std::runtime_error("Error trying to open file: " + path.string());
    }

    const std::streamsize size = file.tellg();
    if (size < 0)
    {
        throw std::runtime_error("Error trying to get size of file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<unsigned char> data(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size))
    {
        throw std::runtime_error("Error trying to read file: " + path.string());
    }
    file.close();

    return data;
}

std::vector<unsigned char> ReadFileSample(const std::filesystem::path& path, const size_t size)
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Error trying to open file: " + path.string());
    }

    std::vector<unsigned char> data(size);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (file.bad())
    {
        throw std::runtime_error("Error trying to read file: " + path.string());
    }
    data.resize(static_cast<size_t>(file.gcount()));

    return data;
}
