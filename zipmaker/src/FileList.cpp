#include "zipmaker/FileList.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

std::string FormatSize(const uint64_t size)
{
    static const std::array<const char*, 4> units = { "B", "KB", "MB", "GB" };

    double value = static_cast<double>(size);
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1);
    for (const char* unit : units)
    {
        if (value < 1024.0)
        {
            ss << value << ' ' << unit;
            return ss.str();
        }
        value /= 1024.0;
    }
    ss << value << " TB";
    return ss.str();
}

bool FileList::Add(const std::filesystem::path& path, std::string& error)
{
    std::error_code ec;
    std::filesystem::path absolute_path = std::filesystem::absolute(path, ec);
    if (ec)
    {
        error = "Can't resolve " + path.string() + ": " + ec.message();
        return false;
    }
    absolute_path = absolute_path.lexically_normal();

    if (!std::filesystem::is_regular_file(absolute_path, ec))
    {
        error = absolute_path.string() + " is not a regular file";
        return false;
    }

    const auto it = std::find_if(items.begin(), items.end(), [&](const FileListItem& item) { return item.path == absolute_path; });
    if (it != items.end())
    {
        error = absolute_path.string() + " is already in the list";
        return false;
    }

    const uint64_t size = std::filesystem::file_size(absolute_path, ec);
    if (ec)
    {
        error = "Can't get size of " + absolute_path.string() + ": " + ec.message();
        return false;
    }

    items.push_back(FileListItem{ absolute_path, size });
    return true;
}

bool FileList::Add(const std::filesystem::path& path)
{
    std::string error;
    return Add(path, error);
}

void FileList::Remove(const size_t index)
{
    if (index < items.size())
    {
        items.erase(items.begin() + index);
    }
}

void FileList::Clear()
{
    items.clear();
}

bool FileList::Empty() const
{
    return items.empty();
}

size_t FileList::Size() const
{
    return items.size();
}

uint64_t FileList::TotalSize() const
{
    uint64_t total = 0;
    for (const FileListItem& item : items)
    {
        total += item.size;
    }
    return total;
}

const std::vector<FileListItem>& FileList::Items() const
{
    return items;
}
