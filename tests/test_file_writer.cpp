#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "aux/FileWriter.hpp"

TEST(FileWriterTest, BuffersUntilFlushed)
{
    TempDir dir;
    const std::string path = dir / "out.part";

    FileWriter writer(path, false, 16);
    ASSERT_TRUE(writer.isOpen());
    EXPECT_TRUE(writer.write("0123456789", 10));
    EXPECT_EQ(readFile(path), "");

    // Crossing the buffer size spills to disk
    EXPECT_TRUE(writer.write("abcdefghij", 10));
    EXPECT_EQ(readFile(path).size(), 16u);

    EXPECT_TRUE(writer.flush());
    EXPECT_EQ(readFile(path), "0123456789abcdefghij");
}

TEST(FileWriterTest, AppendKeepsExistingBytes)
{
    TempDir dir;
    const std::string path = dir / "out.part";
    writeFile(path, "head-");

    {
        FileWriter writer(path, true);
        EXPECT_TRUE(writer.write("tail", 4));
    }
    EXPECT_EQ(readFile(path), "head-tail");
}

TEST(FileWriterTest, TruncateDiscardsExistingBytes)
{
    TempDir dir;
    const std::string path = dir / "out.part";
    writeFile(path, "old content");

    {
        FileWriter writer(path, false);
        EXPECT_TRUE(writer.write("new", 3));
    }
    EXPECT_EQ(readFile(path), "new");
}

TEST(FileWriterTest, UnopenableFileReportsError)
{
    TempDir dir;
    FileWriter writer(dir / "missing/dir/out.part", false);

    EXPECT_FALSE(writer.isOpen());
    EXPECT_FALSE(writer.error().empty());
    EXPECT_FALSE(writer.write("x", 1));
}
