#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include "MediaScanner.hpp"
#include "TestUtil.hpp"

using ::testing::ElementsAre;

namespace {

std::vector<std::string> names(const std::vector<fs::path>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) out.push_back(p.filename().string());
    return out;
}

}

TEST(MediaScannerTest, AcceptsAllowListedExtensionsCaseInsensitively) {
    EXPECT_TRUE(isMediaFile("a.mp3"));
    EXPECT_TRUE(isMediaFile("a.FLAC"));
    EXPECT_TRUE(isMediaFile("/x/y/clip.Mkv"));
    EXPECT_TRUE(isMediaFile("song.opus"));
    EXPECT_FALSE(isMediaFile("cover.jpg"));
    EXPECT_FALSE(isMediaFile("notes.txt"));
    EXPECT_FALSE(isMediaFile("mp3"));
}

TEST(MediaScannerTest, NaturalOrderComparesDigitRunsNumerically) {
    EXPECT_TRUE(naturalLess("track2.mp3", "track10.mp3"));
    EXPECT_FALSE(naturalLess("track10.mp3", "track2.mp3"));
    EXPECT_TRUE(naturalLess("Track1.mp3", "track1b.mp3"));
    EXPECT_TRUE(naturalLess("a.mp3", "B.mp3"));
    EXPECT_TRUE(naturalLess("9 x.mp3", "10 x.mp3"));
    EXPECT_TRUE(naturalLess("1.mp3", "a.mp3"));
}

TEST(MediaScannerTest, NaturalOrderIsStrictWeak) {
    EXPECT_FALSE(naturalLess("same.mp3", "same.mp3"));
    // 数值相同: 前导零少的在前
    EXPECT_TRUE(naturalLess("t1.mp3", "t01.mp3"));
    EXPECT_FALSE(naturalLess("t01.mp3", "t1.mp3"));
    // 只差大小写时次序仍然确定
    EXPECT_NE(naturalLess("A.mp3", "a.mp3"), naturalLess("a.mp3", "A.mp3"));
}

TEST(MediaScannerTest, ScanFiltersAndSortsTopLevelOnly) {
    TempDir dir;
    for (const char* n : {"track10.mp3", "track2.mp3", "Track1.FLAC", "cover.jpg", "readme.txt", "video 3.mp4"})
        writeFile(dir / n);
    writeFile(dir / "sub" / "track0.mp3");
    fs::create_directories(dir / "folder.mp3");

    auto tracks = scanFolder(dir.get());

    EXPECT_THAT(names(tracks), ElementsAre("Track1.FLAC", "track2.mp3", "track10.mp3", "video 3.mp4"));
}

TEST(MediaScannerTest, EmptyFolderYieldsNoTracks) {
    TempDir dir;
    writeFile(dir / "notes.txt");
    EXPECT_TRUE(scanFolder(dir.get()).empty());
}

TEST(MediaScannerTest, MissingFolderThrows) {
    TempDir dir;
    EXPECT_THROW(scanFolder(dir / "missing"), FolderNotFound);

    writeFile(dir / "file.mp3");
    try {
        scanFolder(dir / "file.mp3");
        FAIL() << "expected FolderNotFound";
    } catch (const FolderNotFound& e) {
        EXPECT_EQ(e.getFolder(), (dir / "file.mp3").string());
    }
}
