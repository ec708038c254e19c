#include "transfer/transfer_executor.hpp"

#include "candidates/exclusion_check.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>
#include <memory>

using namespace WarmCache::Transfer;
using WarmCache::Storage::DirectoryOwnership;
using WarmCache::Storage::LocalStorage;
using WarmCache::Storage::StorageErrc;
using WarmCache::Testing::FakeCopier;
using WarmCache::Testing::TempDirTest;

namespace
{

class InUseNames : public WarmCache::Candidates::IExclusionCheck
{
    public:
    explicit InUseNames(std::set<std::string> names) : names_(std::move(names)) {}

    bool IsInUse(const fs::path& path) const override
    {
        return names_.contains(path.filename().string());
    }

    private:
    std::set<std::string> names_;
};

}  // namespace

class TransferExecutorTest : public TempDirTest
{
    protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        array_tier_ = std::make_unique<LocalStorage>(array_);
        cache_tier_ = std::make_unique<LocalStorage>(cache_);
    }

    std::unique_ptr<TransferExecutor> MakeExecutor(
        PhaseOptions options, const WarmCache::Candidates::IExclusionCheck* exclusion = nullptr
    )
    {
        return std::make_unique<TransferExecutor>(
            *array_tier_, *cache_tier_, copier_, resolver_, DirectoryOwnership{0775, {}, {}},
            std::move(options), exclusion
        );
    }

    CandidateItem Item(const std::string& relative, std::uint64_t size = 0)
    {
        return CandidateItem{"/data/" + relative, array_ / relative, cache_ / relative, size};
    }

    std::unique_ptr<LocalStorage> array_tier_;
    std::unique_ptr<LocalStorage> cache_tier_;
    FakeCopier copier_;
    SidecarResolver resolver_{{"srt", "nfo"}};
};

TEST_F(TransferExecutorTest, MoveDeletesSourceAfterVerify)
{
    WriteFile(array_ / "Movies" / "Film" / "Film.mkv", "0123456789");
    auto executor = MakeExecutor({.name = "warm", .move = true, .sidecars = true});

    const auto result = executor->Execute(Item("Movies/Film/Film.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Moved);
    EXPECT_EQ(result.bytes, 10u);
    EXPECT_EQ(ReadFile(cache_ / "Movies" / "Film" / "Film.mkv"), "0123456789");
    EXPECT_FALSE(fs::exists(array_ / "Movies" / "Film" / "Film.mkv"));
    // Emptied source directory is tidied, its parent is not
    EXPECT_FALSE(fs::exists(array_ / "Movies" / "Film"));
    EXPECT_TRUE(fs::exists(array_ / "Movies"));
}

TEST_F(TransferExecutorTest, CopyOnlyKeepsSource)
{
    WriteFile(array_ / "a.mkv", "abc");
    auto executor = MakeExecutor({.name = "warm", .move = false});

    const auto result = executor->Execute(Item("a.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Copied);
    EXPECT_TRUE(fs::exists(array_ / "a.mkv"));
    EXPECT_EQ(ReadFile(cache_ / "a.mkv"), "abc");
}

TEST_F(TransferExecutorTest, PersistentMismatchKeepsSource)
{
    WriteFile(array_ / "a.mkv", "0123456789");
    copier_.short_copies_remaining = 1;
    copier_.truncate_on_checksum   = true;
    auto executor                  = MakeExecutor({.name = "warm", .move = true});

    const auto result = executor->Execute(Item("a.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Failed);
    EXPECT_TRUE(result.error == StorageErrc::VerifyMismatch);
    EXPECT_EQ(ReadFile(array_ / "a.mkv"), "0123456789");
    EXPECT_EQ(copier_.calls.size(), 2u);
    EXPECT_EQ(copier_.CountChecksumCalls(), 1u);
}

TEST_F(TransferExecutorTest, ChecksumRetryRecoversShortCopy)
{
    WriteFile(array_ / "a.mkv", "0123456789");
    copier_.short_copies_remaining = 1;
    auto executor                  = MakeExecutor({.name = "warm", .move = true});

    const auto result = executor->Execute(Item("a.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Moved);
    EXPECT_EQ(copier_.CountChecksumCalls(), 1u);
    EXPECT_EQ(ReadFile(cache_ / "a.mkv"), "0123456789");
    EXPECT_FALSE(fs::exists(array_ / "a.mkv"));
}

TEST_F(TransferExecutorTest, CopyFailureKeepsSource)
{
    WriteFile(array_ / "a.mkv", "abc");
    copier_.failing_names.insert("a.mkv");
    auto executor = MakeExecutor({.name = "warm", .move = true});

    const auto result = executor->Execute(Item("a.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Failed);
    EXPECT_TRUE(result.error == StorageErrc::CopyFailed);
    EXPECT_TRUE(fs::exists(array_ / "a.mkv"));
}

TEST_F(TransferExecutorTest, DryRunChangesNoFiles)
{
    WriteFile(array_ / "Show" / "ep.mkv", "abcd");
    WriteFile(array_ / "Show" / "ep.srt", "subs");
    auto executor = MakeExecutor({.name = "warm", .move = true, .sidecars = true, .dry_run = true});

    const auto result = executor->Execute(Item("Show/ep.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Moved);
    EXPECT_EQ(result.bytes, 4u);
    EXPECT_EQ(result.sidecars_transferred, 1u);
    EXPECT_TRUE(fs::exists(array_ / "Show" / "ep.mkv"));
    EXPECT_TRUE(fs::exists(array_ / "Show" / "ep.srt"));
    EXPECT_FALSE(fs::exists(cache_ / "Show" / "ep.mkv"));
    ASSERT_FALSE(copier_.calls.empty());
    EXPECT_TRUE(copier_.calls.front().options.dry_run);
}

TEST_F(TransferExecutorTest, SecondRunIsIdempotent)
{
    WriteFile(array_ / "a.mkv", "abc");
    auto mover = MakeExecutor({.name = "warm", .move = true});
    EXPECT_EQ(mover->Execute(Item("a.mkv")).outcome, TransferOutcome::Moved);
    EXPECT_EQ(mover->Execute(Item("a.mkv")).outcome, TransferOutcome::SkippedAlreadyPresent);
    EXPECT_EQ(copier_.calls.size(), 1u);

    WriteFile(array_ / "b.mkv", "abc");
    auto copier_only = MakeExecutor({.name = "warm", .move = false});
    EXPECT_EQ(copier_only->Execute(Item("b.mkv")).outcome, TransferOutcome::Copied);
    EXPECT_EQ(copier_only->Execute(Item("b.mkv")).outcome, TransferOutcome::SkippedAlreadyPresent);
    EXPECT_EQ(copier_.calls.size(), 2u);
}

TEST_F(TransferExecutorTest, MissingSourceIsSkipped)
{
    auto executor = MakeExecutor({.name = "warm", .move = true});
    EXPECT_EQ(executor->Execute(Item("nope.mkv")).outcome, TransferOutcome::SkippedMissing);
    EXPECT_TRUE(copier_.calls.empty());
}

TEST_F(TransferExecutorTest, InUseItemIsExcluded)
{
    WriteFile(array_ / "busy.mkv", "abc");
    InUseNames in_use({"busy.mkv"});
    auto executor = MakeExecutor({.name = "warm", .move = true}, &in_use);

    EXPECT_EQ(executor->Execute(Item("busy.mkv")).outcome, TransferOutcome::SkippedExcluded);
    EXPECT_TRUE(fs::exists(array_ / "busy.mkv"));
    EXPECT_TRUE(copier_.calls.empty());
}

TEST_F(TransferExecutorTest, SidecarFailureDoesNotFailMedia)
{
    WriteFile(array_ / "a.mkv", "media");
    WriteFile(array_ / "a.srt", "subs");
    WriteFile(array_ / "a.nfo", "meta");
    copier_.failing_names.insert("a.srt");
    auto executor = MakeExecutor({.name = "warm", .move = true, .sidecars = true});

    const auto result = executor->Execute(Item("a.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Moved);
    EXPECT_EQ(result.sidecars_transferred, 1u);
    EXPECT_EQ(result.sidecars_failed, 1u);
    EXPECT_TRUE(fs::exists(cache_ / "a.nfo"));
    EXPECT_FALSE(fs::exists(array_ / "a.nfo"));
    EXPECT_TRUE(fs::exists(array_ / "a.srt"));
    EXPECT_FALSE(fs::exists(cache_ / "a.srt"));
}

TEST_F(TransferExecutorTest, SidecarsCanBeDisabled)
{
    WriteFile(array_ / "a.mkv", "media");
    WriteFile(array_ / "a.srt", "subs");
    auto executor = MakeExecutor({.name = "warm", .move = true, .sidecars = false});

    const auto result = executor->Execute(Item("a.mkv"));

    EXPECT_EQ(result.outcome, TransferOutcome::Moved);
    EXPECT_EQ(result.sidecars_transferred, 0u);
    EXPECT_TRUE(fs::exists(array_ / "a.srt"));
    EXPECT_FALSE(fs::exists(cache_ / "a.srt"));
}

TEST_F(TransferExecutorTest, CreatedDirectoriesGetConfiguredMode)
{
    WriteFile(array_ / "Deep" / "Er" / "a.mkv", "abc");
    auto executor = MakeExecutor({.name = "warm", .move = false});

    ASSERT_EQ(executor->Execute(Item("Deep/Er/a.mkv")).outcome, TransferOutcome::Copied);

    struct stat st{};
    ASSERT_EQ(::stat((cache_ / "Deep" / "Er").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0775u);
    ASSERT_EQ(::stat((cache_ / "Deep").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0775u);
}
