#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "aux/FileWriter.hpp"
#include "cache/MetadataStore.hpp"
#include "core/DownloadTask.hpp"
#include "core/Errors.hpp"
#include "util/file.hpp"

// Bridges one HTTP response into the task's .part file and progress counter
class DownloadTask::TransferHandler : public http::ResponseHandler
{
public:
    TransferHandler(DownloadTask &task,
                    std::shared_ptr<std::atomic<bool>> cancelToken,
                    std::string partPath,
                    std::optional<uint64_t> resumeOffset)
        : _task(task),
          _cancelToken(std::move(cancelToken)),
          _partPath(std::move(partPath)),
          _resumeOffset(resumeOffset)
    {
    }

    bool onResponse(long status, std::optional<uint64_t> contentLength) override
    {
        _status = status;
        _responded = true;

        bool append = false;
        if (status == 200)
        {
            // Full body: any stale bytes in .part are thrown away
            _progress = DownloadProgress(0, contentLength);
        }
        else if (status == 206 && _resumeOffset)
        {
            std::optional<uint64_t> size = _task.snapshot().size;
            if (contentLength)
            {
                size = *_resumeOffset + *contentLength;
            }
            _progress = DownloadProgress(*_resumeOffset, size);
            append = true;
        }
        else if (status == 206)
        {
            _progress = DownloadProgress(0, contentLength);
        }
        else if (status == 410)
        {
            _expired = true;
            return false;
        }
        else
        {
            _unexpectedStatus = true;
            return false;
        }

        _task.setProgress(_progress);
        _task.persist();

        _writer = std::make_unique<FileWriter>(_partPath, append);
        if (!_writer->isOpen())
        {
            _openError = _writer->error();
            _writer.reset();
            return false;
        }

        _task.notifyChange();
        return !_cancelToken->load();
    }

    bool onData(const char *data, size_t size) override
    {
        if (_cancelToken->load() || !_writer)
        {
            return false;
        }

        const uint64_t received = _progress.bytesRead->load();
        if (_progress.size && received + size > *_progress.size)
        {
            _overrun = true;
            return false;
        }

        if (!_writer->write(data, size))
        {
            _writeError = _writer->error();
            return false;
        }

        _progress.bytesRead->fetch_add(size);
        _task.notifyChange();
        return true;
    }

    bool isCancelled() const override
    {
        return _cancelToken->load();
    }

    // Flushes whatever was accepted so far; the .part size is then exactly
    // the resumable offset
    void finish()
    {
        if (!_writer)
        {
            return;
        }

        if (!_writer->flush() && _writeError.empty())
        {
            _writeError = _writer->error();
        }
        _writer->close();
        _writer.reset();
    }

    long status() const { return _status; }
    bool responded() const { return _responded; }
    bool expired() const { return _expired; }
    bool unexpectedStatus() const { return _unexpectedStatus; }
    bool overrun() const { return _overrun; }
    const std::string &openError() const { return _openError; }
    const std::string &writeError() const { return _writeError; }

private:
    DownloadTask &_task;
    std::shared_ptr<std::atomic<bool>> _cancelToken;
    std::string _partPath;
    std::optional<uint64_t> _resumeOffset;

    DownloadProgress _progress;
    std::unique_ptr<FileWriter> _writer;

    long _status = 0;
    bool _responded = false;
    bool _expired = false;
    bool _unexpectedStatus = false;
    bool _overrun = false;
    std::string _openError;
    std::string _writeError;
};

DownloadTask::DownloadTask(DownloadInfo info,
                           std::string destination,
                           ThreadPool &pool,
                           http::Client &client,
                           LocalFileIndex &index,
                           MessageLog &msgs,
                           CompletionHandler onComplete,
                           ChangeHandler onChange)
    : _fileInfo(info.fileInfo),
      _destination(std::move(destination)),
      _pool(pool),
      _client(client),
      _index(index),
      _msgs(msgs),
      _onComplete(std::move(onComplete)),
      _onChange(std::move(onChange)),
      _info(std::move(info))
{
}

//---------------------------------------------------------------------------------
// State control
//---------------------------------------------------------------------------------

StartResult DownloadTask::tryStart()
{
    const std::string &name = _fileInfo.fileName;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_discarded)
        {
            return StartResult::Failed;
        }
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(_destination).parent_path(), ec);
    if (ec)
    {
        failStart(FailureKind::Filesystem, "Error when creating download directory for " + name + ": " + ec.message());
        return StartResult::Failed;
    }

    if (fileExists(_destination))
    {
        if (!_index.contains(_fileInfo.fileId))
        {
            _msgs.push(name + " already exists but was missing its metadata.");
            _onComplete(_fileInfo);
        }
        else
        {
            _msgs.push(name + " already exists and won't be downloaded.");
        }

        {
            std::lock_guard<std::mutex> lock(_stateMutex);
            _info.state = DownloadState::Done;
            _failure = FailureKind::None;
            _failureMessage.clear();
        }
        removeSidecar();
        notifyChange();
        return StartResult::AlreadyDownloaded;
    }

    auto token = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_cancelToken)
        {
            _cancelToken->store(true);
        }
        _cancelToken = token;
        _info.state = DownloadState::Downloading;
        _failure = FailureKind::None;
        _failureMessage.clear();
    }
    persist();

    {
        std::lock_guard<std::mutex> lock(_jobsMutex);
        ++_jobs;
    }

    auto self = shared_from_this();
    if (!_pool.enqueue([self, token]()
                       { self->runJob(token); }))
    {
        // Shutting down; the record still says Downloading so it restarts next time
        jobFinished();
        return StartResult::Failed;
    }

    notifyChange();
    return StartResult::Started;
}

void DownloadTask::togglePause()
{
    DownloadState state;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_discarded)
        {
            return;
        }

        state = _info.state;
        if (state == DownloadState::Downloading)
        {
            // Too late to pause, the file is being moved into place
            if (_finalizing)
            {
                return;
            }

            _info.state = DownloadState::Paused;
            if (_cancelToken)
            {
                _cancelToken->store(true);
            }
        }
    }

    switch (state)
    {
    case DownloadState::Downloading:
        persist();
        notifyChange();
        break;
    case DownloadState::Paused:
    case DownloadState::Error:
        tryStart();
        break;
    case DownloadState::Expired:
        // A fresh link has to come from the site; nothing to retry here
        _msgs.push("Download link for " + _fileInfo.fileName + " expired, please download again.");
        break;
    case DownloadState::Done:
        break;
    }
}

void DownloadTask::stop()
{
    std::lock_guard<std::mutex> lock(_stateMutex);
    if (_cancelToken)
    {
        _cancelToken->store(true);
    }
}

void DownloadTask::discard()
{
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _discarded = true;
        if (_cancelToken)
        {
            _cancelToken->store(true);
        }
    }

    // Wait for a running attempt to flush and close the .part file, and for
    // any in-flight record write, before removing their artifacts
    {
        std::lock_guard<std::mutex> runLock(_runMutex);
    }
    {
        std::lock_guard<std::mutex> persistLock(_persistMutex);
    }

    const std::string part = partPath(_destination);
    if (std::remove(part.c_str()) != 0 && errno != ENOENT)
    {
        _msgs.push("Unable to remove " + part + ": " + std::strerror(errno));
    }

    try
    {
        MetadataStore::remove(partMetaPath(_destination));
    }
    catch (const MetadataError &e)
    {
        _msgs.push(e.what());
    }

    notifyChange();
}

bool DownloadTask::waitUntilIdle(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(_jobsMutex);
    return _idleCondition.wait_for(lock, timeout, [this]
                                   { return _jobs == 0; });
}

DownloadState DownloadTask::getState() const
{
    std::lock_guard<std::mutex> lock(_stateMutex);
    return _info.state;
}

DownloadSnapshot DownloadTask::snapshot() const
{
    std::lock_guard<std::mutex> lock(_stateMutex);

    DownloadSnapshot snap;
    snap.fileInfo = _fileInfo;
    snap.state = _info.state;
    snap.bytesRead = _info.progress.bytesRead->load();
    snap.size = _info.progress.size;
    snap.failure = _failure;
    snap.failureMessage = _failureMessage;
    return snap;
}

//---------------------------------------------------------------------------------
// Transfer job
//---------------------------------------------------------------------------------

void DownloadTask::runJob(const std::shared_ptr<std::atomic<bool>> &cancelToken)
{
    try
    {
        runTransfer(cancelToken);
    }
    catch (const std::exception &e)
    {
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Network,
                      "Download of " + _fileInfo.fileName + " failed unexpectedly: " + e.what());
    }
    jobFinished();
}

void DownloadTask::runTransfer(const std::shared_ptr<std::atomic<bool>> &cancelToken)
{
    // An older attempt of this task may still be unwinding; wait for it
    std::lock_guard<std::mutex> runLock(_runMutex);

    http::Request request;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_discarded || cancelToken->load() || _info.state != DownloadState::Downloading)
        {
            return;
        }
        request.url = _info.url;
    }

    const std::string &name = _fileInfo.fileName;
    const std::string part = partPath(_destination);

    // Bytes flushed by an earlier attempt are where this one picks up
    const std::optional<uint64_t> resumeOffset = fileSize(part);
    request.rangeStart = resumeOffset;

    // Everything arrived before an earlier run got to the rename; a range
    // request past the end would only earn a 416
    const std::optional<uint64_t> knownSize = snapshot().size;
    if (resumeOffset && knownSize && *resumeOffset == *knownSize)
    {
        spdlog::info("{} already fully received, finishing without a request", name);
        setProgress(DownloadProgress(*knownSize, knownSize));
        completeTransfer(cancelToken);
        return;
    }

    spdlog::info("Downloading {} (resume offset {})", name, resumeOffset.value_or(0));

    TransferHandler handler(*this, cancelToken, part, resumeOffset);
    const http::Result result = _client.perform(request, handler);
    handler.finish();

    if (handler.expired())
    {
        finishAttempt(cancelToken, DownloadState::Expired, FailureKind::Expired,
                      "Download link for " + name + " expired, please download again.");
        return;
    }
    if (handler.unexpectedStatus())
    {
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Protocol,
                      "Download " + name + " got unexpected HTTP response: " + std::to_string(handler.status()) + ".");
        return;
    }
    if (!handler.openError().empty())
    {
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Filesystem,
                      "Unable to open " + name + " for writing: " + handler.openError());
        return;
    }
    if (!handler.writeError().empty())
    {
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Filesystem,
                      "IO error when writing " + name + " to disk: " + handler.writeError());
        return;
    }
    if (handler.overrun())
    {
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Protocol,
                      "Server sent more data for " + name + " than it announced.");
        return;
    }

    switch (result.outcome)
    {
    case http::Outcome::Failed:
        if (handler.responded())
        {
            finishAttempt(cancelToken, DownloadState::Error, FailureKind::Network,
                          "Error during download of " + name + ": " + result.error);
        }
        else
        {
            finishAttempt(cancelToken, DownloadState::Error, FailureKind::Network,
                          "Unable to contact the server to download " + name + ": " + result.error);
        }
        return;
    case http::Outcome::Aborted:
        // Paused, stopped or discarded; whoever cancelled owns the state
        if (!cancelToken->load())
        {
            finishAttempt(cancelToken, DownloadState::Error, FailureKind::Network,
                          "Download of " + name + " was interrupted.");
        }
        return;
    case http::Outcome::Completed:
        completeTransfer(cancelToken);
        return;
    }
}

// Moves a fully received .part into place and records the finished file
void DownloadTask::completeTransfer(const std::shared_ptr<std::atomic<bool>> &cancelToken)
{
    const std::string &name = _fileInfo.fileName;

    const DownloadSnapshot snap = snapshot();
    if (snap.size && snap.bytesRead != *snap.size)
    {
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Network,
                      "Download of " + name + " ended early (" + std::to_string(snap.bytesRead) + " of " +
                          std::to_string(*snap.size) + " bytes).");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_discarded || cancelToken->load() || _info.state != DownloadState::Downloading)
        {
            return;
        }
        _finalizing = true;
    }

    const std::string part = partPath(_destination);
    if (std::rename(part.c_str(), _destination.c_str()) != 0)
    {
        const std::string reason = std::strerror(errno);
        {
            std::lock_guard<std::mutex> lock(_stateMutex);
            _finalizing = false;
        }
        finishAttempt(cancelToken, DownloadState::Error, FailureKind::Filesystem,
                      "Download of " + name + " complete, but unable to remove .part extension: " + reason);
        return;
    }

    removeSidecar();

    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _info.state = DownloadState::Done;
        _failure = FailureKind::None;
        _failureMessage.clear();
        _finalizing = false;
    }

    spdlog::info("Download of {} complete ({} bytes)", name, snap.bytesRead);
    _onComplete(_fileInfo);
    notifyChange();
}

bool DownloadTask::finishAttempt(const std::shared_ptr<std::atomic<bool>> &cancelToken,
                                 DownloadState newState,
                                 FailureKind kind,
                                 const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_discarded || cancelToken->load() || _info.state != DownloadState::Downloading)
        {
            return false;
        }

        _info.state = newState;
        _failure = kind;
        _failureMessage = message;
    }

    persist();
    _msgs.push(message);
    notifyChange();
    return true;
}

void DownloadTask::failStart(FailureKind kind, const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        _info.state = DownloadState::Error;
        _failure = kind;
        _failureMessage = message;
    }

    persist();
    _msgs.push(message);
    notifyChange();
}

void DownloadTask::jobFinished()
{
    {
        std::lock_guard<std::mutex> lock(_jobsMutex);
        --_jobs;
    }
    _idleCondition.notify_all();
}

//---------------------------------------------------------------------------------
// Persistence
//---------------------------------------------------------------------------------

void DownloadTask::setProgress(DownloadProgress progress)
{
    std::lock_guard<std::mutex> lock(_stateMutex);
    _info.progress = std::move(progress);
}

// Writes the current DownloadInfo to <name>.part.json. A failed write is
// reported but doesn't change the task; the in-memory state stays authoritative.
void DownloadTask::persist()
{
    std::lock_guard<std::mutex> persistLock(_persistMutex);

    DownloadInfo info;
    {
        std::lock_guard<std::mutex> lock(_stateMutex);
        if (_discarded || _info.state == DownloadState::Done)
        {
            return;
        }
        info = _info;
    }

    try
    {
        MetadataStore::saveDownloadInfo(info, partMetaPath(_destination));
    }
    catch (const MetadataError &e)
    {
        _msgs.push("Error when saving download state for " + _fileInfo.fileName + ": " + e.what());
    }
}

void DownloadTask::removeSidecar()
{
    std::lock_guard<std::mutex> persistLock(_persistMutex);
    try
    {
        MetadataStore::remove(partMetaPath(_destination));
    }
    catch (const MetadataError &e)
    {
        _msgs.push("Unable to remove .part.json file after download is complete: " + std::string(e.what()));
    }
}

void DownloadTask::notifyChange() const
{
    if (_onChange)
    {
        _onChange();
    }
}
