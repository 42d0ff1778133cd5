#ifndef DOWNLOADTASK_HPP
#define DOWNLOADTASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "aux/MessageLog.hpp"
#include "aux/ThreadPool.hpp"
#include "cache/LocalFileIndex.hpp"
#include "core/DownloadInfo.hpp"
#include "util/http.hpp"

// Called once a file is on disk under its final name (or found there)
using CompletionHandler = std::function<void(const FileInfo &)>;
// Called whenever something a viewer might display has changed
using ChangeHandler = std::function<void()>;

// Why the last attempt ended in Error or Expired
enum class FailureKind
{
    None,
    Network,
    Protocol,
    Filesystem,
    Expired
};

enum class StartResult
{
    Started,
    AlreadyDownloaded,
    Failed
};

// Read-only copy of a task for presentation
struct DownloadSnapshot
{
    FileInfo fileInfo;
    DownloadState state{DownloadState::Downloading};
    uint64_t bytesRead{0};
    std::optional<uint64_t> size;
    FailureKind failure{FailureKind::None};
    std::string failureMessage;
};

// One resumable download of a single file.
//
// The network/disk loop of an attempt runs as a job on the shared pool. An
// attempt owns a cancel token; pausing, stopping or discarding the task sets
// it and the job gives up at its next chunk, after flushing everything it
// accepted. Only a job whose token is still clear may move the task out of
// Downloading, so a late failure can never overwrite a pause.
class DownloadTask : public std::enable_shared_from_this<DownloadTask>
{
public:
    DownloadTask(DownloadInfo info,
                 std::string destination,
                 ThreadPool &pool,
                 http::Client &client,
                 LocalFileIndex &index,
                 MessageLog &msgs,
                 CompletionHandler onComplete,
                 ChangeHandler onChange);

    DownloadTask(const DownloadTask &) = delete;
    DownloadTask &operator=(const DownloadTask &) = delete;

    // Checks the destination and, if the file isn't there yet, submits a
    // transfer job. Never touches the network itself.
    StartResult tryStart();

    // Downloading -> Paused, Paused/Error -> Downloading. Expired only
    // repeats the expiry message; Done is left alone.
    void togglePause();

    // Process shutdown: abandon the running attempt but keep the recorded
    // state, so a Downloading task restarts next time.
    void stop();

    // Cancels the task, waits for its job to let go of the files and removes
    // the .part and .part.json artifacts. The task is inert afterwards.
    void discard();

    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    DownloadState getState() const;
    DownloadSnapshot snapshot() const;
    const FileInfo &getFileInfo() const { return _fileInfo; }

private:
    class TransferHandler;

    void runJob(const std::shared_ptr<std::atomic<bool>> &cancelToken);
    void runTransfer(const std::shared_ptr<std::atomic<bool>> &cancelToken);
    void completeTransfer(const std::shared_ptr<std::atomic<bool>> &cancelToken);
    void jobFinished();

    // Error outside of any attempt (e.g. the directory can't be created)
    void failStart(FailureKind kind, const std::string &message);

    // Leaves Downloading on behalf of the attempt owning cancelToken; false
    // if that attempt has been cancelled in the meantime
    bool finishAttempt(const std::shared_ptr<std::atomic<bool>> &cancelToken,
                       DownloadState newState,
                       FailureKind kind,
                       const std::string &message);

    void setProgress(DownloadProgress progress);
    void persist();
    void removeSidecar();
    void notifyChange() const;

    const FileInfo _fileInfo;
    const std::string _destination;

    ThreadPool &_pool;
    http::Client &_client;
    LocalFileIndex &_index;
    MessageLog &_msgs;
    CompletionHandler _onComplete;
    ChangeHandler _onChange;

    mutable std::mutex _stateMutex;
    DownloadInfo _info;
    FailureKind _failure{FailureKind::None};
    std::string _failureMessage;
    std::shared_ptr<std::atomic<bool>> _cancelToken;
    bool _finalizing{false};
    bool _discarded{false};

    std::mutex _runMutex;     // Held by a job for the whole attempt
    std::mutex _persistMutex; // Orders writes of the .part.json record

    mutable std::mutex _jobsMutex;
    mutable std::condition_variable _idleCondition;
    size_t _jobs{0};
};

#endif
