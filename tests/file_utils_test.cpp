#include <gtest/gtest.h>
#include "core/file_utils.hpp"
#include "test_base.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class FileUtilsTest : public TestBase
{
};

TEST_F(FileUtilsTest, ReadableDirectory)
{
    createFile("music/a.mp3");

    std::string error;
    EXPECT_TRUE(FileUtils::isReadableDirectory(getTestRoot(), error));
    EXPECT_TRUE(error.empty());

    EXPECT_FALSE(FileUtils::isReadableDirectory((fs::path(getTestRoot()) / "missing").string(), error));
    EXPECT_NE(error.find("Invalid directory path"), std::string::npos);

    // A regular file is not a directory
    EXPECT_FALSE(FileUtils::isValidDirectory((fs::path(getTestRoot()) / "music" / "a.mp3").string()));
}

TEST_F(FileUtilsTest, ExtensionIsLowerCaseWithoutDot)
{
    EXPECT_EQ(FileUtils::getFileExtension("Album/Track 01.MP3"), "mp3");
    EXPECT_EQ(FileUtils::getFileExtension("cover.Jpeg"), "jpeg");
    EXPECT_EQ(FileUtils::getFileExtension("README"), "");
    EXPECT_EQ(FileUtils::getFileExtension("archive.tar.gz"), "gz");
}

TEST_F(FileUtilsTest, RelativePathUsesNativeSeparator)
{
    fs::path root = fs::path(getTestRoot());
    EXPECT_EQ(FileUtils::relativePath(root / "Artist" / "Album" / "01.mp3", root),
              (fs::path("Artist") / "Album" / "01.mp3").make_preferred().string());
    EXPECT_EQ(FileUtils::relativePath(root, root), ".");
}

TEST_F(FileUtilsTest, Utf8LengthCountsCodePoints)
{
    EXPECT_EQ(FileUtils::utf8Length("abc"), 3u);
    EXPECT_EQ(FileUtils::utf8Length("Bj\xC3\xB6rk"), 5u);         // Björk
    EXPECT_EQ(FileUtils::utf8Length("\xE6\x97\xA5\xE6\x9C\xAC"), 2u); // two CJK characters
    EXPECT_EQ(FileUtils::utf8Length("a\xFF" "b"), 3u);             // invalid byte counts once
    EXPECT_EQ(FileUtils::utf8Length(""), 0u);
}

TEST_F(FileUtilsTest, Utf8CharactersSplitsSequences)
{
    auto characters = FileUtils::utf8Characters("a\xC3\xA9?");
    ASSERT_EQ(characters.size(), 3u);
    EXPECT_EQ(characters[0], "a");
    EXPECT_EQ(characters[1], "\xC3\xA9");
    EXPECT_EQ(characters[2], "?");

    // Truncated sequence: the lead byte stands alone
    auto truncated = FileUtils::utf8Characters("x\xE6\x97");
    ASSERT_EQ(truncated.size(), 3u);
    EXPECT_EQ(truncated[1], "\xE6");
}
