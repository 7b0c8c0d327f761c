/**
 * @file test_zip_archive.cpp
 * @brief ZIP codec tests
 */

#include <gtest/gtest.h>

#include "ZipArchive.h"
#include "TestUtil.h"

#include <algorithm>

// ============================================
// Round trip through extractZip
// ============================================

TEST(ZipArchive, ExtractsWhatWasArchived)
{
    TempDir tmp;
    std::string big(200000, 'x');
    for (size_t i = 0; i < big.size(); i += 7) big[i] = static_cast<char>('a' + i % 26);

    writeBytes(tmp.path() / "bundle.zip",
               makeZip({{"song.ogg", big}, {"notes/song.ini", "[song]\nname=Test\n"}}));

    ASSERT_TRUE(extractZip(tmp.str("bundle.zip"), tmp.str("out")));
    EXPECT_EQ(readFile(tmp.path() / "out" / "song.ogg"), big);
    EXPECT_EQ(readFile(tmp.path() / "out" / "notes" / "song.ini"), "[song]\nname=Test\n");
}

TEST(ZipArchive, ListsEntries)
{
    TempDir tmp;
    writeBytes(tmp.path() / "a.zip", makeZip({{"one.txt", "1"}, {"two/three.txt", "333"}}));

    std::vector<ZipEntryInfo> entries;
    ASSERT_TRUE(listZip(tmp.str("a.zip"), entries));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "one.txt");
    EXPECT_EQ(entries[0].uncompressedSize, 1u);
    EXPECT_EQ(entries[1].name, "two/three.txt");
    EXPECT_EQ(entries[1].uncompressedSize, 3u);
}

// ============================================
// Empty archives
// ============================================

TEST(ZipArchive, ZeroByteFileIsEmptyArchive)
{
    TempDir tmp;
    writeFile(tmp.path() / "empty.zip", "");

    ASSERT_TRUE(extractZip(tmp.str("empty.zip"), tmp.str("out")));
    EXPECT_TRUE(fs::is_directory(tmp.path() / "out"));
    EXPECT_EQ(countEntries(tmp.path() / "out"), 0u);
}

TEST(ZipArchive, CreatesArchiveWithNoEntries)
{
    TempDir tmp;
    ASSERT_TRUE(createZip(tmp.str("none.zip"), {}));

    std::vector<ZipEntryInfo> entries;
    ASSERT_TRUE(listZip(tmp.str("none.zip"), entries));
    EXPECT_TRUE(entries.empty());
    EXPECT_TRUE(extractZip(tmp.str("none.zip"), tmp.str("out")));
}

// ============================================
// Rejected input
// ============================================

TEST(ZipArchive, RejectsGarbage)
{
    TempDir tmp;
    writeFile(tmp.path() / "bad.zip", "this is definitely not a zip archive");

    EXPECT_FALSE(extractZip(tmp.str("bad.zip"), tmp.str("out")));

    std::vector<ZipEntryInfo> entries;
    EXPECT_FALSE(listZip(tmp.str("bad.zip"), entries));
}

TEST(ZipArchive, RejectsTruncatedArchive)
{
    TempDir tmp;
    std::vector<uint8_t> zip = makeZip({{"song.ogg", std::string(5000, 'q')}});
    ASSERT_FALSE(zip.empty());
    zip.resize(zip.size() / 2);
    writeBytes(tmp.path() / "cut.zip", zip);

    EXPECT_FALSE(extractZip(tmp.str("cut.zip"), tmp.str("out")));
}

TEST(ZipArchive, RejectsEntryEscapingTarget)
{
    TempDir tmp;
    writeBytes(tmp.path() / "evil.zip", makeZip({{"../evil.txt", "gotcha"}}));

    EXPECT_FALSE(extractZip(tmp.str("evil.zip"), tmp.str("out")));
    EXPECT_FALSE(fs::exists(tmp.path() / "evil.txt"));
}

TEST(ZipArchive, RejectsMissingSource)
{
    TempDir tmp;
    EXPECT_FALSE(createZip(tmp.str("x.zip"), {{tmp.str("does-not-exist"), "x"}}));
}

TEST(ZipArchive, MissingArchiveFails)
{
    TempDir tmp;
    EXPECT_FALSE(extractZip(tmp.str("nothing.zip"), tmp.str("out")));
}
