#include "storage/local_storage.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <stdexcept>

using namespace WarmCache::Storage;
using WarmCache::Testing::TempDirTest;

class LocalStorageTest : public TempDirTest
{
};

TEST_F(LocalStorageTest, RejectsRelativeRoot)
{
    EXPECT_THROW(LocalStorage("relative/root"), std::invalid_argument);
}

TEST_F(LocalStorageTest, ContainsRootAndPathsBelowIt)
{
    LocalStorage storage(array_);
    EXPECT_TRUE(storage.Contains(array_ / "Movies" / "a.mkv"));
    EXPECT_TRUE(storage.Contains(array_));
    EXPECT_FALSE(storage.Contains(cache_ / "a.mkv"));
    EXPECT_FALSE(storage.Contains(array_ / ".." / "cache" / "a.mkv"));
    EXPECT_FALSE(storage.Contains("Movies/a.mkv"));
}

TEST_F(LocalStorageTest, TrailingSeparatorOnRootIsIgnored)
{
    LocalStorage storage(array_.string() + "/");
    EXPECT_EQ(storage.GetPath().string(), array_.string());
    EXPECT_TRUE(storage.Contains(array_ / "x"));
}

TEST_F(LocalStorageTest, OutsidePathsAreInvalid)
{
    LocalStorage storage(array_);
    auto res = storage.CheckIfFileExists(cache_ / "a.mkv");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), StorageErrc::InvalidPath);
}

TEST_F(LocalStorageTest, FileQueries)
{
    LocalStorage storage(array_);
    WriteFile(array_ / "TV" / "ep.mkv", "12345");

    auto exists = storage.CheckIfFileExists(array_ / "TV" / "ep.mkv");
    ASSERT_TRUE(exists.has_value());
    EXPECT_TRUE(*exists);

    auto missing = storage.CheckIfFileExists(array_ / "TV" / "none.mkv");
    ASSERT_TRUE(missing.has_value());
    EXPECT_FALSE(*missing);

    auto size = storage.GetFileSize(array_ / "TV" / "ep.mkv");
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 5u);

    auto dir_size = storage.GetFileSize(array_ / "TV");
    ASSERT_FALSE(dir_size.has_value());
    EXPECT_EQ(dir_size.error(), StorageErrc::IsADirectory);

    auto gone = storage.GetAttributes(array_ / "TV" / "none.mkv");
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error(), StorageErrc::FileNotFound);
}

TEST_F(LocalStorageTest, CreateDirectoriesAppliesMode)
{
    LocalStorage storage(cache_);
    ASSERT_TRUE(storage.Initialize().has_value());

    DirectoryOwnership ownership;
    ownership.mode = 0750;
    const auto dir = cache_ / "Movies" / "Film (2020)";
    ASSERT_TRUE(storage.CreateDirectories(dir, ownership).has_value());

    struct stat st{};
    ASSERT_EQ(::stat(dir.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_EQ(st.st_mode & 0777, 0750u);
    ASSERT_EQ(::stat((cache_ / "Movies").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0750u);

    // Existing directories are accepted as they are
    EXPECT_TRUE(storage.CreateDirectories(dir, ownership).has_value());
}

TEST_F(LocalStorageTest, RemoveAndTidyDirectories)
{
    LocalStorage storage(array_);
    WriteFile(array_ / "Show" / "a.mkv", "a");
    WriteFile(array_ / "Show" / "a.srt", "s");

    ASSERT_TRUE(storage.Remove(array_ / "Show" / "a.mkv").has_value());
    EXPECT_FALSE(fs::exists(array_ / "Show" / "a.mkv"));
    // Removing something already gone is not an error
    EXPECT_TRUE(storage.Remove(array_ / "Show" / "a.mkv").has_value());

    auto kept = storage.RemoveDirectoryIfEmpty(array_ / "Show");
    ASSERT_TRUE(kept.has_value());
    EXPECT_FALSE(*kept);

    ASSERT_TRUE(storage.Remove(array_ / "Show" / "a.srt").has_value());
    auto removed = storage.RemoveDirectoryIfEmpty(array_ / "Show");
    ASSERT_TRUE(removed.has_value());
    EXPECT_TRUE(*removed);
    EXPECT_FALSE(fs::exists(array_ / "Show"));

    auto root = storage.RemoveDirectoryIfEmpty(array_);
    ASSERT_TRUE(root.has_value());
    EXPECT_FALSE(*root);
    EXPECT_TRUE(fs::exists(array_));
}

TEST_F(LocalStorageTest, ListFilesRecursiveIsSorted)
{
    LocalStorage storage(cache_);
    WriteFile(cache_ / "lib" / "b" / "2.srt", "x");
    WriteFile(cache_ / "lib" / "a" / "1.mkv", "x");
    WriteFile(cache_ / "lib" / "c.nfo", "x");
    fs::create_directories(cache_ / "lib" / "empty");

    auto files = storage.ListFilesRecursive(cache_ / "lib");
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 3u);
    EXPECT_EQ((*files)[0].string(), (cache_ / "lib" / "a" / "1.mkv").string());
    EXPECT_EQ((*files)[1].string(), (cache_ / "lib" / "b" / "2.srt").string());
    EXPECT_EQ((*files)[2].string(), (cache_ / "lib" / "c.nfo").string());

    auto missing = storage.ListFilesRecursive(cache_ / "nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), StorageErrc::FileNotFound);
}

TEST_F(LocalStorageTest, ListDirectoryIsShallowAndSorted)
{
    LocalStorage storage(cache_);
    WriteFile(cache_ / "lib" / "b.srt", "x");
    WriteFile(cache_ / "lib" / "A.MKV", "x");
    WriteFile(cache_ / "lib" / "sub" / "c.nfo", "x");

    auto files = storage.ListDirectory(cache_ / "lib");
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ((*files)[0].filename().string(), "A.MKV");
    EXPECT_EQ((*files)[1].filename().string(), "b.srt");

    auto missing = storage.ListDirectory(cache_ / "nope");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), StorageErrc::FileNotFound);

    EXPECT_EQ(storage.ListDirectory(array_).error(), StorageErrc::InvalidPath);
}

TEST_F(LocalStorageTest, InitializeFailsForMissingRoot)
{
    LocalStorage storage(root_ / "does-not-exist");
    auto res = storage.Initialize();
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), StorageErrc::FileNotFound);
}

TEST_F(LocalStorageTest, ReportsAvailableBytes)
{
    LocalStorage storage(cache_);
    auto res = storage.GetAvailableBytes();
    ASSERT_TRUE(res.has_value());
    EXPECT_GT(*res, 0u);
}
