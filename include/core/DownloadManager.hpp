#ifndef DOWNLOADMANAGER_HPP
#define DOWNLOADMANAGER_HPP

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "aux/MessageLog.hpp"
#include "aux/ThreadPool.hpp"
#include "cache/LocalFileIndex.hpp"
#include "core/Config.hpp"
#include "core/DownloadTask.hpp"
#include "core/LinkResolver.hpp"
#include "util/http.hpp"

// Registry of every transfer known to this process, in presentation order.
// Index-based operations address that order; all of them are safe to call
// from any thread.
class DownloadManager
{
public:
    DownloadManager(const Config &config,
                    std::shared_ptr<http::Client> client,
                    std::shared_ptr<LinkResolver> resolver,
                    std::shared_ptr<LocalFileIndex> index,
                    MessageLog &msgs,
                    ChangeHandler onChange);
    ~DownloadManager();

    DownloadManager(const DownloadManager &) = delete;
    DownloadManager &operator=(const DownloadManager &) = delete;

    // Resolves the link and queues the file it names. Throws LinkParseError,
    // DuplicateError, ExpiredError, NetworkError or ProtocolError.
    StartResult queue(const std::string &link);

    // Queues a file whose metadata and URL are already known. Throws
    // DuplicateError or FilesystemError.
    StartResult queue(const FileInfo &fileInfo, const std::string &url);

    // Rebuilds tasks from the .part.json records in the download tree and
    // restarts the ones that were downloading. Returns how many were added.
    size_t resumeOnStartup();

    void togglePauseFor(size_t index);
    void deleteDownload(size_t index);

    // Writes the completed-file record and adds it to the index
    void updateMetadata(const FileInfo &fileInfo);

    std::vector<DownloadSnapshot> snapshot() const;
    size_t size() const;

    // True once no task has a transfer job queued or running
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    // Abandons every running transfer (recorded states are kept) and drains
    // the worker pool. Idempotent.
    void stop();

    const LocalFileIndex &getIndex() const { return *_index; }

private:
    std::shared_ptr<DownloadTask> makeTask(DownloadInfo info, std::string destination);
    std::vector<std::shared_ptr<DownloadTask>> tasks() const;
    void notifyChange() const;

    const Config _config;
    std::shared_ptr<http::Client> _client;
    std::shared_ptr<LinkResolver> _resolver;
    std::shared_ptr<LocalFileIndex> _index;
    MessageLog &_msgs;
    ChangeHandler _onChange;

    mutable std::shared_mutex _tasksMutex;
    std::vector<std::shared_ptr<DownloadTask>> _tasks;

    ThreadPool _pool;
};

#endif
