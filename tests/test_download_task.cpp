#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <vector>

#include "TestSupport.hpp"
#include "aux/MessageLog.hpp"
#include "aux/ThreadPool.hpp"
#include "cache/LocalFileIndex.hpp"
#include "cache/MetadataStore.hpp"
#include "core/DownloadTask.hpp"
#include "util/file.hpp"

using namespace std::chrono_literals;

class DownloadTaskTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        fileInfo.fileId = 42;
        fileInfo.name = "Mod";
        fileInfo.fileName = "mod.zip";
        fileInfo.modId = 7;
        fileInfo.game = "skyrim";
        destination = dir / "skyrim/mod.zip";
    }

    void TearDown() override
    {
        pool.shutdown();
    }

    std::shared_ptr<DownloadTask> makeTask(DownloadProgress progress = DownloadProgress(),
                                           DownloadState state = DownloadState::Downloading)
    {
        DownloadInfo info;
        info.fileInfo = fileInfo;
        info.url = "https://cdn.example/mod.zip";
        info.state = state;
        info.progress = std::move(progress);

        return std::make_shared<DownloadTask>(
            std::move(info), destination, pool, client, index, msgs,
            [this](const FileInfo &fi)
            {
                std::lock_guard<std::mutex> lock(completedMutex);
                completed.push_back(fi);
            },
            [this]()
            { ++changes; });
    }

    size_t completedCount()
    {
        std::lock_guard<std::mutex> lock(completedMutex);
        return completed.size();
    }

    TempDir dir;
    FileInfo fileInfo;
    std::string destination;

    FakeHttpClient client;
    LocalFileIndex index;
    MessageLog msgs;
    std::mutex completedMutex;
    std::vector<FileInfo> completed;
    std::atomic<int> changes{0};

    ThreadPool pool{2};
};

TEST_F(DownloadTaskTest, FreshDownloadCompletesAndRecordsFile)
{
    const std::string body = makeBody(1000);
    client.push(FakeResponse::ok(body));

    auto task = makeTask();
    EXPECT_EQ(task->tryStart(), StartResult::Started);
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(readFile(destination), body);
    EXPECT_FALSE(fileExists(partPath(destination)));
    EXPECT_FALSE(fileExists(partMetaPath(destination)));
    ASSERT_EQ(completedCount(), 1u);
    EXPECT_EQ(completed[0].fileId, 42u);

    auto requests = client.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_FALSE(requests[0].rangeStart.has_value());
    EXPECT_GT(changes.load(), 0);
}

TEST_F(DownloadTaskTest, ResumesFromPartialFileWithRangeRequest)
{
    const std::string body = makeBody(1000);
    writeFile(partPath(destination), body.substr(0, 500));
    client.push(FakeResponse::ok(body.substr(500), 206));

    auto task = makeTask(DownloadProgress(500, 1000));
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    auto requests = client.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_TRUE(requests[0].rangeStart.has_value());
    EXPECT_EQ(*requests[0].rangeStart, 500u);

    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(readFile(destination), body);
    EXPECT_EQ(task->snapshot().bytesRead, 1000u);
}

TEST_F(DownloadTaskTest, FullResponseToRangeRequestReplacesPartialFile)
{
    const std::string body = makeBody(1000);
    writeFile(partPath(destination), "stale bytes");
    client.push(FakeResponse::ok(body, 200));

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(readFile(destination), body);
}

TEST_F(DownloadTaskTest, GoneMarksExpiredAndResumeDoesNothing)
{
    writeFile(partPath(destination), makeBody(100));
    client.push(FakeResponse::statusOnly(410));

    auto task = makeTask(DownloadProgress(100, 1000));
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Expired);
    EXPECT_EQ(task->snapshot().failure, FailureKind::Expired);
    EXPECT_TRUE(msgs.contains("expired"));
    EXPECT_EQ(MetadataStore::loadDownloadInfo(partMetaPath(destination)).state, DownloadState::Expired);

    // The part file was closed and left intact
    EXPECT_EQ(fileSize(partPath(destination)).value_or(0), 100u);

    task->togglePause();
    ASSERT_TRUE(task->waitUntilIdle(5s));
    EXPECT_EQ(task->getState(), DownloadState::Expired);
    EXPECT_EQ(client.requestCount(), 1u);
}

TEST_F(DownloadTaskTest, UnexpectedStatusIsProtocolError)
{
    client.push(FakeResponse::statusOnly(404));

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    const DownloadSnapshot snap = task->snapshot();
    EXPECT_EQ(snap.state, DownloadState::Error);
    EXPECT_EQ(snap.failure, FailureKind::Protocol);
    EXPECT_NE(snap.failureMessage.find("404"), std::string::npos);
    EXPECT_EQ(completedCount(), 0u);
}

TEST_F(DownloadTaskTest, UnreachableServerIsNetworkError)
{
    FakeResponse unreachable;
    unreachable.connectFailure = true;
    client.push(unreachable);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Error);
    EXPECT_EQ(task->snapshot().failure, FailureKind::Network);
    EXPECT_TRUE(msgs.contains("Unable to contact the server"));
}

TEST_F(DownloadTaskTest, MidStreamFailureKeepsFlushedBytesForRetry)
{
    const std::string body = makeBody(1000);
    FakeResponse broken = FakeResponse::ok(body);
    broken.failAfter = 300;
    client.push(broken);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Error);
    EXPECT_EQ(task->snapshot().failure, FailureKind::Network);
    EXPECT_EQ(fileSize(partPath(destination)).value_or(0), 300u);
    EXPECT_EQ(MetadataStore::loadDownloadInfo(partMetaPath(destination)).state, DownloadState::Error);

    client.push(FakeResponse::ok(body.substr(300), 206));
    task->togglePause();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(readFile(destination), body);
    auto requests = client.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].rangeStart.value_or(0), 300u);
}

TEST_F(DownloadTaskTest, PauseAndResumeNeitherLoseNorDuplicateBytes)
{
    const std::string body = makeBody(1000);
    FakeResponse slow = FakeResponse::ok(body);
    slow.stallAfter = 400;
    client.push(slow);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(client.waitForStall());

    task->togglePause();
    EXPECT_EQ(task->getState(), DownloadState::Paused);
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Paused);
    EXPECT_EQ(fileSize(partPath(destination)).value_or(0), 400u);
    EXPECT_EQ(MetadataStore::loadDownloadInfo(partMetaPath(destination)).state, DownloadState::Paused);

    client.push(FakeResponse::ok(body.substr(400), 206));
    task->togglePause();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(readFile(destination), body);
    EXPECT_EQ(client.requests()[1].rangeStart.value_or(0), 400u);
}

TEST_F(DownloadTaskTest, TransferEndingEarlyIsNotCompleted)
{
    FakeResponse shortBody;
    shortBody.status = 200;
    shortBody.contentLength = 1000;
    shortBody.body = makeBody(600);
    client.push(shortBody);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Error);
    EXPECT_FALSE(fileExists(destination));
    EXPECT_EQ(fileSize(partPath(destination)).value_or(0), 600u);
    EXPECT_TRUE(msgs.contains("ended early"));
}

TEST_F(DownloadTaskTest, MoreBytesThanAnnouncedIsProtocolError)
{
    FakeResponse overlong;
    overlong.status = 200;
    overlong.contentLength = 500;
    overlong.body = makeBody(600);
    client.push(overlong);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Error);
    EXPECT_EQ(task->snapshot().failure, FailureKind::Protocol);
    EXPECT_FALSE(fileExists(destination));
}

TEST_F(DownloadTaskTest, ExistingFileWithoutRecordIsBackfilled)
{
    writeFile(destination, "already here");

    auto task = makeTask();
    EXPECT_EQ(task->tryStart(), StartResult::AlreadyDownloaded);

    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(completedCount(), 1u);
    EXPECT_EQ(client.requestCount(), 0u);
    EXPECT_TRUE(msgs.contains("missing its metadata"));
}

TEST_F(DownloadTaskTest, ExistingIndexedFileIsNotDownloadedAgain)
{
    writeFile(destination, "already here");
    writeFile(partMetaPath(destination), "{}");
    index.insert(LocalFile::fromFileInfo(fileInfo, destination));

    auto task = makeTask();
    EXPECT_EQ(task->tryStart(), StartResult::AlreadyDownloaded);

    EXPECT_EQ(completedCount(), 0u);
    EXPECT_EQ(client.requestCount(), 0u);
    EXPECT_TRUE(msgs.contains("won't be downloaded"));
    EXPECT_FALSE(fileExists(partMetaPath(destination)));
    EXPECT_EQ(readFile(destination), "already here");
}

TEST_F(DownloadTaskTest, DiscardCancelsTransferAndRemovesPartialArtifacts)
{
    FakeResponse slow = FakeResponse::ok(makeBody(1000));
    slow.stallAfter = 200;
    client.push(slow);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(client.waitForStall());

    task->discard();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_FALSE(fileExists(partPath(destination)));
    EXPECT_FALSE(fileExists(partMetaPath(destination)));
    EXPECT_FALSE(fileExists(destination));
    EXPECT_EQ(completedCount(), 0u);
}

TEST_F(DownloadTaskTest, StopKeepsRecordedStateForNextStart)
{
    FakeResponse slow = FakeResponse::ok(makeBody(1000));
    slow.stallAfter = 300;
    client.push(slow);

    auto task = makeTask();
    task->tryStart();
    ASSERT_TRUE(client.waitForStall());

    task->stop();
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(task->getState(), DownloadState::Downloading);
    EXPECT_EQ(MetadataStore::loadDownloadInfo(partMetaPath(destination)).state, DownloadState::Downloading);
    EXPECT_EQ(fileSize(partPath(destination)).value_or(0), 300u);
}

TEST_F(DownloadTaskTest, CompletePartFileIsFinishedWithoutRequest)
{
    // Interrupted between the last flush and the rename
    const std::string body = makeBody(1000);
    writeFile(partPath(destination), body);

    auto task = makeTask(DownloadProgress(1000, 1000));
    EXPECT_EQ(task->tryStart(), StartResult::Started);
    ASSERT_TRUE(task->waitUntilIdle(5s));

    EXPECT_EQ(client.requestCount(), 0u);
    EXPECT_EQ(task->getState(), DownloadState::Done);
    EXPECT_EQ(readFile(destination), body);
    EXPECT_FALSE(fileExists(partPath(destination)));
    EXPECT_FALSE(fileExists(partMetaPath(destination)));
    EXPECT_EQ(completedCount(), 1u);
}
