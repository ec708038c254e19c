#include "copy/native_copier.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <chrono>

using namespace WarmCache::Copy;
using WarmCache::Storage::StorageErrc;
using WarmCache::Testing::TempDirTest;

class NativeCopierTest : public TempDirTest
{
};

TEST_F(NativeCopierTest, CopiesContentAndTimestamps)
{
    const auto src = array_ / "a.mkv";
    const auto dst = cache_ / "a.mkv";
    WriteFile(src, "media-bytes");
    const auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(48);
    fs::last_write_time(src, old_time);
    fs::permissions(src, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);

    NativeCopier copier({});
    auto res = copier.Copy(src, dst, {});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, 11u);
    EXPECT_EQ(ReadFile(dst), "media-bytes");

    struct stat src_st{};
    struct stat dst_st{};
    ASSERT_EQ(::stat(src.c_str(), &src_st), 0);
    ASSERT_EQ(::stat(dst.c_str(), &dst_st), 0);
    EXPECT_EQ(src_st.st_mtim.tv_sec, dst_st.st_mtim.tv_sec);
    EXPECT_EQ(dst_st.st_mode & 07777, 0640u);
}

TEST_F(NativeCopierTest, OverwritesExistingDestination)
{
    WriteFile(array_ / "a.mkv", "new");
    WriteFile(cache_ / "a.mkv", "old-and-longer");

    NativeCopier copier({});
    ASSERT_TRUE(copier.Copy(array_ / "a.mkv", cache_ / "a.mkv", {}).has_value());
    EXPECT_EQ(ReadFile(cache_ / "a.mkv"), "new");
}

TEST_F(NativeCopierTest, DryRunWritesNothing)
{
    WriteFile(array_ / "a.mkv", "abc");

    NativeCopier copier({});
    auto res = copier.Copy(array_ / "a.mkv", cache_ / "a.mkv", {.checksum = false, .dry_run = true});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, 3u);
    EXPECT_FALSE(fs::exists(cache_ / "a.mkv"));
}

TEST_F(NativeCopierTest, ChecksumModeVerifiesContent)
{
    WriteFile(array_ / "a.mkv", std::string(200000, 'x'));

    NativeCopier copier({});
    auto res = copier.Copy(array_ / "a.mkv", cache_ / "a.mkv", {.checksum = true, .dry_run = false});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, 200000u);
    EXPECT_EQ(
        NativeCopier::ComputeChecksum(array_ / "a.mkv").value(),
        NativeCopier::ComputeChecksum(cache_ / "a.mkv").value()
    );
}

TEST_F(NativeCopierTest, ChecksumMatchesCrc32CheckValue)
{
    WriteFile(array_ / "check.txt", "123456789");
    auto crc = NativeCopier::ComputeChecksum(array_ / "check.txt");
    ASSERT_TRUE(crc.has_value());
    EXPECT_EQ(*crc, 0xCBF43926u);
}

TEST_F(NativeCopierTest, MissingSourceIsReported)
{
    NativeCopier copier({});
    auto res = copier.Copy(array_ / "none.mkv", cache_ / "none.mkv", {});
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), StorageErrc::FileNotFound);
    EXPECT_FALSE(fs::exists(cache_ / "none.mkv"));
}
