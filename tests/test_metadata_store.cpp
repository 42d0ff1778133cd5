#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "cache/MetadataStore.hpp"
#include "core/Errors.hpp"
#include "util/file.hpp"

namespace
{
    FileInfo sampleFileInfo()
    {
        FileInfo fi;
        fi.fileId = 123456;
        fi.name = "Unofficial Patch";
        fi.fileName = "patch-4.2.zip";
        fi.modId = 266;
        fi.game = "skyrimspecialedition";
        fi.version = "4.2";
        return fi;
    }
}

TEST(MetadataStoreTest, DownloadInfoKeepsEveryField)
{
    TempDir dir;
    DownloadInfo info;
    info.fileInfo = sampleFileInfo();
    info.url = "https://cdn.example/patch.zip?token=1";
    info.state = DownloadState::Paused;
    info.progress = DownloadProgress(500, 1000);

    MetadataStore::saveDownloadInfo(info, dir / "patch.zip.part.json");
    const DownloadInfo loaded = MetadataStore::loadDownloadInfo(dir / "patch.zip.part.json");

    EXPECT_EQ(loaded.fileInfo.fileId, 123456u);
    EXPECT_EQ(loaded.fileInfo.name, "Unofficial Patch");
    EXPECT_EQ(loaded.fileInfo.fileName, "patch-4.2.zip");
    EXPECT_EQ(loaded.fileInfo.modId, 266u);
    EXPECT_EQ(loaded.fileInfo.game, "skyrimspecialedition");
    EXPECT_EQ(loaded.fileInfo.version.value_or(""), "4.2");
    EXPECT_EQ(loaded.url, info.url);
    EXPECT_EQ(loaded.state, DownloadState::Paused);
    EXPECT_EQ(loaded.progress.bytesRead->load(), 500u);
    EXPECT_EQ(loaded.progress.size.value_or(0), 1000u);
}

TEST(MetadataStoreTest, UnknownSizeAndVersionStayEmpty)
{
    TempDir dir;
    DownloadInfo info;
    info.fileInfo = sampleFileInfo();
    info.fileInfo.version.reset();
    info.url = "https://cdn.example/patch.zip";

    MetadataStore::saveDownloadInfo(info, dir / "r.part.json");

    const auto j = nlohmann::json::parse(readFile(dir / "r.part.json"));
    EXPECT_TRUE(j["progress"]["size"].is_null());
    EXPECT_EQ(j["state"], "Downloading");
    EXPECT_FALSE(j["file_info"].contains("version"));

    const DownloadInfo loaded = MetadataStore::loadDownloadInfo(dir / "r.part.json");
    EXPECT_FALSE(loaded.progress.size.has_value());
    EXPECT_FALSE(loaded.fileInfo.version.has_value());
}

TEST(MetadataStoreTest, LocalFileRecord)
{
    TempDir dir;
    const LocalFile lf = LocalFile::fromFileInfo(sampleFileInfo(), "/data/skyrimspecialedition/patch-4.2.zip");

    MetadataStore::saveLocalFile(lf, dir / "patch-4.2.zip.json");
    const LocalFile loaded = MetadataStore::loadLocalFile(dir / "patch-4.2.zip.json");

    EXPECT_EQ(loaded.fileId, lf.fileId);
    EXPECT_EQ(loaded.game, lf.game);
    EXPECT_EQ(loaded.modId, lf.modId);
    EXPECT_EQ(loaded.fileName, lf.fileName);
    EXPECT_EQ(loaded.version, lf.version);
    EXPECT_EQ(loaded.path, lf.path);
    EXPECT_FALSE(fileExists(dir / "patch-4.2.zip.json.tmp"));
}

TEST(MetadataStoreTest, MalformedRecordsThrowMetadataError)
{
    TempDir dir;
    writeFile(dir / "garbage.part.json", "{ this is not json");
    writeFile(dir / "missing.part.json", R"({"url": "x"})");
    writeFile(dir / "state.part.json",
              R"({"file_info": {"file_id": 1, "name": "a", "file_name": "a", "mod_id": 1, "game": "g"},
                  "url": "x", "state": "Exploded", "progress": {"bytes_read": 0, "size": null}})");

    EXPECT_THROW(MetadataStore::loadDownloadInfo(dir / "garbage.part.json"), MetadataError);
    EXPECT_THROW(MetadataStore::loadDownloadInfo(dir / "missing.part.json"), MetadataError);
    EXPECT_THROW(MetadataStore::loadDownloadInfo(dir / "state.part.json"), MetadataError);
    EXPECT_THROW(MetadataStore::loadDownloadInfo(dir / "absent.part.json"), MetadataError);
}

TEST(MetadataStoreTest, RemoveToleratesMissingFile)
{
    TempDir dir;
    writeFile(dir / "x.part.json", "{}");

    EXPECT_NO_THROW(MetadataStore::remove(dir / "x.part.json"));
    EXPECT_FALSE(fileExists(dir / "x.part.json"));
    EXPECT_NO_THROW(MetadataStore::remove(dir / "x.part.json"));
}

TEST(MetadataStoreTest, SavingIntoMissingDirectoryFails)
{
    TempDir dir;
    DownloadInfo info;
    info.fileInfo = sampleFileInfo();

    EXPECT_THROW(MetadataStore::saveDownloadInfo(info, dir / "no/such/dir/r.part.json"), MetadataError);
}

TEST(MetadataStoreTest, UnencodableFieldThrowsMetadataErrorAndWritesNothing)
{
    TempDir dir;
    const std::string path = dir / "bad.zip.json";

    LocalFile lf = LocalFile::fromFileInfo(sampleFileInfo(), dir / "bad.zip");
    lf.fileName = "bad\xff.zip";

    EXPECT_THROW(MetadataStore::saveLocalFile(lf, path), MetadataError);
    EXPECT_FALSE(fileExists(path));
    EXPECT_FALSE(fileExists(path + ".tmp"));
}

TEST(MetadataStoreTest, RecordKindFollowsContent)
{
    TempDir dir;

    DownloadInfo info;
    info.fileInfo = sampleFileInfo();
    info.url = "https://cdn.example/x";
    MetadataStore::saveDownloadInfo(info, dir / "a.part.json");
    MetadataStore::saveLocalFile(LocalFile::fromFileInfo(sampleFileInfo(), dir / "b"), dir / "b.part.json");
    writeFile(dir / "c.json", "[1, 2, 3]");
    writeFile(dir / "d.json", "{ nope");

    EXPECT_EQ(MetadataStore::recordKind(dir / "a.part.json"), RecordKind::Transfer);
    EXPECT_EQ(MetadataStore::recordKind(dir / "b.part.json"), RecordKind::LocalFile);
    EXPECT_EQ(MetadataStore::recordKind(dir / "c.json"), RecordKind::Other);
    EXPECT_THROW(MetadataStore::recordKind(dir / "d.json"), MetadataError);
}
