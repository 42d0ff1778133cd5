#include <sys/stat.h>
#include <string>

#include "util/file.hpp"

// Checks if a file exists at the given path
bool fileExists(const std::string &path)
{
    struct stat buf;
    return (stat(path.c_str(), &buf) == 0);
}

// Size of a regular file on disk, or nothing if it can't be stat'ed
std::optional<uint64_t> fileSize(const std::string &path)
{
    struct stat buf{};
    if (stat(path.c_str(), &buf) != 0 || !S_ISREG(buf.st_mode))
    {
        return std::nullopt;
    }

    return static_cast<uint64_t>(buf.st_size);
}

bool hasSuffix(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// <name>.part holds the bytes received so far
std::string partPath(const std::string &finalPath)
{
    return finalPath + PART_SUFFIX;
}

// <name>.part.json holds the serialized DownloadInfo while the transfer is unfinished
std::string partMetaPath(const std::string &finalPath)
{
    return finalPath + PART_META_SUFFIX;
}

// <name>.json holds the LocalFile record once the file is complete
std::string localMetaPath(const std::string &finalPath)
{
    return finalPath + LOCAL_META_SUFFIX;
}

bool hasLocalRecord(const std::string &path)
{
    return fileExists(localMetaPath(path));
}
