#include "core/DownloadInfo.hpp"

const char *toString(DownloadState state)
{
    switch (state)
    {
    case DownloadState::Downloading:
        return "Downloading";
    case DownloadState::Paused:
        return "Paused";
    case DownloadState::Error:
        return "Error";
    case DownloadState::Expired:
        return "Expired";
    case DownloadState::Done:
        return "Done";
    }
    return "Error";
}

std::optional<DownloadState> downloadStateFromString(const std::string &name)
{
    if (name == "Downloading")
    {
        return DownloadState::Downloading;
    }
    if (name == "Paused")
    {
        return DownloadState::Paused;
    }
    if (name == "Error")
    {
        return DownloadState::Error;
    }
    if (name == "Expired")
    {
        return DownloadState::Expired;
    }
    if (name == "Done")
    {
        return DownloadState::Done;
    }
    return std::nullopt;
}

LocalFile LocalFile::fromFileInfo(const FileInfo &fileInfo, const std::string &path)
{
    LocalFile lf;
    lf.fileId = fileInfo.fileId;
    lf.game = fileInfo.game;
    lf.modId = fileInfo.modId;
    lf.fileName = fileInfo.fileName;
    lf.version = fileInfo.version;
    lf.path = path;
    return lf;
}
