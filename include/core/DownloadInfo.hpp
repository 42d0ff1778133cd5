#ifndef DOWNLOADINFO_HPP
#define DOWNLOADINFO_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

enum class DownloadState
{
    Downloading,
    Paused,
    Error,
    Expired,
    Done
};

const char *toString(DownloadState state);
std::optional<DownloadState> downloadStateFromString(const std::string &name);

// Immutable description of a remote file, keyed by fileId
struct FileInfo
{
    uint64_t fileId{0};
    std::string name;     // Display name
    std::string fileName; // Name on disk
    uint32_t modId{0};
    std::string game;
    std::optional<std::string> version;
};

// Progress shared between a task's driver and its writer.
// bytesRead is only ever incremented while a transfer runs; a fresh (200)
// response replaces the whole object instead of rewinding the counter.
struct DownloadProgress
{
    std::shared_ptr<std::atomic<uint64_t>> bytesRead = std::make_shared<std::atomic<uint64_t>>(0);
    std::optional<uint64_t> size;

    DownloadProgress() = default;
    DownloadProgress(uint64_t read, std::optional<uint64_t> total)
        : bytesRead(std::make_shared<std::atomic<uint64_t>>(read)), size(total) {}
};

// Persisted unit of a transfer, written to <fileName>.part.json
struct DownloadInfo
{
    FileInfo fileInfo;
    std::string url;
    DownloadState state{DownloadState::Downloading};
    DownloadProgress progress;
};

// Record of a completed file, written to <fileName>.json
struct LocalFile
{
    uint64_t fileId{0};
    std::string game;
    uint32_t modId{0};
    std::string fileName;
    std::optional<std::string> version;
    std::string path;

    static LocalFile fromFileInfo(const FileInfo &fileInfo, const std::string &path);
};

#endif
