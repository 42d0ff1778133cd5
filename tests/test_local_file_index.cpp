#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "cache/LocalFileIndex.hpp"
#include "cache/MetadataStore.hpp"

namespace
{
    LocalFile makeLocalFile(uint64_t fileId, const std::string &game, const std::string &fileName)
    {
        LocalFile lf;
        lf.fileId = fileId;
        lf.game = game;
        lf.modId = 1;
        lf.fileName = fileName;
        lf.path = "/downloads/" + game + "/" + fileName;
        return lf;
    }
}

TEST(LocalFileIndexTest, HydrateReadsCompletedRecordsOnly)
{
    TempDir dir;
    writeFile(dir / "skyrim/b.zip", "b");
    MetadataStore::saveLocalFile(makeLocalFile(2, "skyrim", "b.zip"), dir / "skyrim/b.zip.json");
    writeFile(dir / "fallout4/a.7z", "a");
    MetadataStore::saveLocalFile(makeLocalFile(1, "fallout4", "a.7z"), dir / "fallout4/a.7z.json");

    // In-flight records and unreadable ones are not completed files
    writeFile(dir / "skyrim/c.zip.part.json", "{}");
    writeFile(dir / "skyrim/broken.zip.json", "not json");

    LocalFileIndex index;
    EXPECT_EQ(index.hydrate(dir.path()), 2u);
    EXPECT_TRUE(index.contains(1));
    EXPECT_TRUE(index.contains(2));
    EXPECT_EQ(index.size(), 2u);
    ASSERT_TRUE(index.get(2).has_value());
    EXPECT_EQ(index.get(2)->fileName, "b.zip");
}

TEST(LocalFileIndexTest, HydrateOfMissingDirectoryIsEmpty)
{
    TempDir dir;
    LocalFileIndex index;
    EXPECT_EQ(index.hydrate(dir / "nothing-yet"), 0u);
    EXPECT_EQ(index.size(), 0u);
}

TEST(LocalFileIndexTest, InsertReplacesAndItemsAreSortedByName)
{
    LocalFileIndex index;
    index.insert(makeLocalFile(3, "skyrim", "zeta.zip"));
    index.insert(makeLocalFile(1, "skyrim", "alpha.zip"));
    index.insert(makeLocalFile(2, "skyrim", "mid.zip"));
    index.insert(makeLocalFile(1, "skyrim", "beta.zip"));

    const auto items = index.items();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].fileName, "beta.zip");
    EXPECT_EQ(items[1].fileName, "mid.zip");
    EXPECT_EQ(items[2].fileName, "zeta.zip");

    EXPECT_FALSE(index.get(99).has_value());
    EXPECT_FALSE(index.contains(99));
}

TEST(LocalFileIndexTest, RecordsAreRecognisedByContent)
{
    TempDir dir;

    // A downloaded file that is itself JSON (valid or not) is not a record
    writeFile(dir / "skyrim/notes.json", "{ user data");
    MetadataStore::saveLocalFile(makeLocalFile(1, "skyrim", "notes.json"), dir / "skyrim/notes.json.json");

    // "patch.part" finished; its record ends in .part.json
    writeFile(dir / "skyrim/patch.part", "done");
    MetadataStore::saveLocalFile(makeLocalFile(2, "skyrim", "patch.part"), dir / "skyrim/patch.part.json");

    // A real transfer sidecar is skipped
    DownloadInfo inFlight;
    inFlight.fileInfo.fileId = 3;
    inFlight.fileInfo.fileName = "big.zip";
    inFlight.fileInfo.game = "skyrim";
    inFlight.url = "https://cdn.example/big.zip";
    MetadataStore::saveDownloadInfo(inFlight, dir / "skyrim/big.zip.part.json");

    LocalFileIndex index;
    EXPECT_EQ(index.hydrate(dir.path()), 2u);
    EXPECT_TRUE(index.contains(1));
    EXPECT_TRUE(index.contains(2));
    EXPECT_FALSE(index.contains(3));
}
