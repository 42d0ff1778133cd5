#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "cache/MetadataStore.hpp"
#include "core/DownloadManager.hpp"
#include "core/Errors.hpp"
#include "util/file.hpp"
#include "util/nxm.hpp"

namespace fs = std::filesystem;

namespace
{
    // A path component taken from remote metadata must stay inside its directory
    bool isSafeComponent(const std::string &name)
    {
        return !name.empty() && name != "." && name != ".." &&
               name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
    }

    bool isReplaceable(DownloadState state)
    {
        return state == DownloadState::Done || state == DownloadState::Expired;
    }

    // Sidecars under <downloadDir>/<game>/, sorted so restarts keep a stable order
    std::vector<std::string> findPartRecords(const std::string &downloadDir)
    {
        std::vector<std::string> records;
        std::error_code ec;

        if (!fs::is_directory(downloadDir, ec))
        {
            return records;
        }

        try
        {
            for (const auto &gameDir : fs::directory_iterator(downloadDir, ec))
            {
                if (!gameDir.is_directory(ec))
                {
                    continue;
                }

                for (const auto &entry : fs::directory_iterator(gameDir.path(), ec))
                {
                    // A downloaded "x.part.json" has its own record and is not a sidecar
                    const std::string path = entry.path().string();
                    if (entry.is_regular_file(ec) && hasSuffix(path, PART_META_SUFFIX) && !hasLocalRecord(path))
                    {
                        records.push_back(path);
                    }
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            spdlog::warn("Error while scanning {}: {}", downloadDir, e.what());
        }

        if (ec)
        {
            spdlog::warn("Error while scanning {}: {}", downloadDir, ec.message());
        }

        std::sort(records.begin(), records.end());
        return records;
    }
}

DownloadManager::DownloadManager(const Config &config,
                                 std::shared_ptr<http::Client> client,
                                 std::shared_ptr<LinkResolver> resolver,
                                 std::shared_ptr<LocalFileIndex> index,
                                 MessageLog &msgs,
                                 ChangeHandler onChange)
    : _config(config),
      _client(std::move(client)),
      _resolver(std::move(resolver)),
      _index(std::move(index)),
      _msgs(msgs),
      _onChange(std::move(onChange)),
      _pool(config.maxConcurrentDownloads)
{
}

// Stops all transfers and joins the workers before any task goes away
DownloadManager::~DownloadManager()
{
    stop();
}

//---------------------------------------------------------------------------------
// Queueing
//---------------------------------------------------------------------------------

StartResult DownloadManager::queue(const std::string &link)
{
    const nxm::Link parsed = nxm::parse(link);

    // Spare the API round trip for a file that is already in flight
    {
        std::shared_lock<std::shared_mutex> lock(_tasksMutex);
        for (const auto &task : _tasks)
        {
            if (task->getFileInfo().fileId == parsed.fileId && !isReplaceable(task->getState()))
            {
                throw DuplicateError(task->getFileInfo().fileName + " is already being downloaded.");
            }
        }
    }

    const ResolvedLink resolved = _resolver->resolve(link);
    return queue(resolved.fileInfo, resolved.url);
}

StartResult DownloadManager::queue(const FileInfo &fileInfo, const std::string &url)
{
    if (!isSafeComponent(fileInfo.fileName) || !isSafeComponent(fileInfo.game))
    {
        throw FilesystemError("Refusing to download to unsafe path " + fileInfo.game + "/" + fileInfo.fileName + ".");
    }

    DownloadInfo info;
    info.fileInfo = fileInfo;
    info.url = url;
    info.state = DownloadState::Downloading;

    std::shared_ptr<DownloadTask> task = makeTask(std::move(info), _config.pathFor(fileInfo));

    {
        std::unique_lock<std::shared_mutex> lock(_tasksMutex);

        auto existing = std::find_if(_tasks.begin(), _tasks.end(), [&](const std::shared_ptr<DownloadTask> &t)
                                     { return t->getFileInfo().fileId == fileInfo.fileId; });

        if (existing != _tasks.end())
        {
            if (!isReplaceable((*existing)->getState()))
            {
                throw DuplicateError(fileInfo.fileName + " is already being downloaded.");
            }
            *existing = task;
        }
        else
        {
            _tasks.push_back(task);
        }
    }

    spdlog::info("Queued {} (file {}, mod {}, {})", fileInfo.fileName, fileInfo.fileId, fileInfo.modId, fileInfo.game);

    const StartResult result = task->tryStart();
    notifyChange();
    return result;
}

size_t DownloadManager::resumeOnStartup()
{
    size_t added = 0;
    std::vector<std::shared_ptr<DownloadTask>> toStart;

    for (const std::string &recordPath : findPartRecords(_config.downloadDir))
    {
        DownloadInfo info;
        try
        {
            // "x.part.json" is also the completed record of a file named "x.part"
            if (MetadataStore::recordKind(recordPath) != RecordKind::Transfer)
            {
                spdlog::debug("Skipping {}: not a transfer record", recordPath);
                continue;
            }
            info = MetadataStore::loadDownloadInfo(recordPath);
        }
        catch (const MetadataError &e)
        {
            _msgs.push("Unable to restore download from " + recordPath + ": " + e.what());
            continue;
        }

        const std::string destination = recordPath.substr(0, recordPath.size() - std::string(PART_META_SUFFIX).size());

        // Finished before the record could be removed
        if (fileExists(destination) && _index->contains(info.fileInfo.fileId))
        {
            try
            {
                MetadataStore::remove(recordPath);
            }
            catch (const MetadataError &e)
            {
                _msgs.push(e.what());
            }
            continue;
        }

        const bool restart = info.state == DownloadState::Downloading || fileExists(destination);
        const uint64_t fileId = info.fileInfo.fileId;
        std::shared_ptr<DownloadTask> task = makeTask(std::move(info), destination);

        {
            std::unique_lock<std::shared_mutex> lock(_tasksMutex);

            const bool known = std::any_of(_tasks.begin(), _tasks.end(), [&](const std::shared_ptr<DownloadTask> &t)
                                           { return t->getFileInfo().fileId == fileId; });
            if (known)
            {
                continue;
            }

            _tasks.push_back(task);
        }

        ++added;
        if (restart)
        {
            toStart.push_back(task);
        }
    }

    for (const auto &task : toStart)
    {
        task->tryStart();
    }

    if (added > 0)
    {
        spdlog::info("Restored {} download(s), {} restarted", added, toStart.size());
        notifyChange();
    }
    return added;
}

//---------------------------------------------------------------------------------
// Index-based control
//---------------------------------------------------------------------------------

void DownloadManager::togglePauseFor(size_t index)
{
    std::shared_ptr<DownloadTask> task;
    {
        std::shared_lock<std::shared_mutex> lock(_tasksMutex);
        if (index >= _tasks.size())
        {
            return;
        }
        task = _tasks[index];
    }

    task->togglePause();
    notifyChange();
}

void DownloadManager::deleteDownload(size_t index)
{
    std::shared_ptr<DownloadTask> task;
    {
        std::unique_lock<std::shared_mutex> lock(_tasksMutex);
        if (index >= _tasks.size())
        {
            return;
        }
        task = _tasks[index];
        _tasks.erase(_tasks.begin() + static_cast<std::ptrdiff_t>(index));
    }

    // Waits for the task's job, so never under the collection lock
    task->discard();

    spdlog::info("Deleted download of {}", task->getFileInfo().fileName);
    notifyChange();
}

void DownloadManager::updateMetadata(const FileInfo &fileInfo)
{
    const std::string path = _config.pathFor(fileInfo);
    const LocalFile localFile = LocalFile::fromFileInfo(fileInfo, path);

    try
    {
        MetadataStore::saveLocalFile(localFile, localMetaPath(path));
    }
    catch (const MetadataError &e)
    {
        _msgs.push("Unable to save metadata for " + fileInfo.fileName + ": " + e.what());
    }

    _index->insert(localFile);
    notifyChange();
}

//---------------------------------------------------------------------------------
// Views
//---------------------------------------------------------------------------------

std::vector<DownloadSnapshot> DownloadManager::snapshot() const
{
    std::shared_lock<std::shared_mutex> lock(_tasksMutex);

    std::vector<DownloadSnapshot> snaps;
    snaps.reserve(_tasks.size());
    for (const auto &task : _tasks)
    {
        snaps.push_back(task->snapshot());
    }
    return snaps;
}

size_t DownloadManager::size() const
{
    std::shared_lock<std::shared_mutex> lock(_tasksMutex);
    return _tasks.size();
}

bool DownloadManager::waitUntilIdle(std::chrono::milliseconds timeout) const
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    for (const auto &task : tasks())
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (!task->waitUntilIdle(std::max(remaining, std::chrono::milliseconds(0))))
        {
            return false;
        }
    }
    return true;
}

void DownloadManager::stop()
{
    for (const auto &task : tasks())
    {
        task->stop();
    }

    _pool.shutdown();
}

//---------------------------------------------------------------------------------
// Helpers
//---------------------------------------------------------------------------------

std::shared_ptr<DownloadTask> DownloadManager::makeTask(DownloadInfo info, std::string destination)
{
    return std::make_shared<DownloadTask>(
        std::move(info),
        std::move(destination),
        _pool,
        *_client,
        *_index,
        _msgs,
        [this](const FileInfo &fileInfo)
        { updateMetadata(fileInfo); },
        [this]()
        { notifyChange(); });
}

std::vector<std::shared_ptr<DownloadTask>> DownloadManager::tasks() const
{
    std::shared_lock<std::shared_mutex> lock(_tasksMutex);
    return _tasks;
}

void DownloadManager::notifyChange() const
{
    if (_onChange)
    {
        _onChange();
    }
}
