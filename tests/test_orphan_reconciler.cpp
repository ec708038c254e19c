#include "transfer/orphan_reconciler.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace WarmCache::Transfer;
using WarmCache::Storage::DirectoryOwnership;
using WarmCache::Storage::LocalStorage;
using WarmCache::Testing::FakeCopier;
using WarmCache::Testing::TempDirTest;

class OrphanReconcilerTest : public TempDirTest
{
    protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        array_tier_ = std::make_unique<LocalStorage>(array_);
        cache_tier_ = std::make_unique<LocalStorage>(cache_);
        translator_ = std::make_unique<PathTranslator>(
            array_, cache_, std::vector<WarmCache::Config::PathMapRule>{}
        );

        const auto dir = cache_ / "Movies" / "Film (2020)";
        WriteFile(dir / "Film.mkv", "media");
        WriteFile(dir / "Film.srt", "subs");
        WriteFile(dir / "Film.en.srt", "english subs");
        WriteFile(dir / "Gone.srt", "stranded subs");
        WriteFile(dir / "Gone.nfo", "stranded meta");
    }

    std::uint64_t Reconcile(const std::vector<fs::path>& roots, bool dry_run = false)
    {
        TransferExecutor mover(
            *cache_tier_, *array_tier_, copier_, resolver_, DirectoryOwnership{},
            PhaseOptions{"orphan", true, false, dry_run}
        );
        OrphanReconciler reconciler(*cache_tier_, *translator_, resolver_, {"mkv", "mp4"}, mover);
        return reconciler.Reconcile(roots);
    }

    std::unique_ptr<LocalStorage> array_tier_;
    std::unique_ptr<LocalStorage> cache_tier_;
    std::unique_ptr<PathTranslator> translator_;
    FakeCopier copier_;
    SidecarResolver resolver_{{"srt", "nfo"}};
};

TEST_F(OrphanReconcilerTest, RelocatesStrandedSidecarsOnly)
{
    EXPECT_EQ(Reconcile({cache_ / "Movies"}), 2u);

    const auto cache_dir = cache_ / "Movies" / "Film (2020)";
    const auto array_dir = array_ / "Movies" / "Film (2020)";
    EXPECT_EQ(ReadFile(array_dir / "Gone.srt"), "stranded subs");
    EXPECT_EQ(ReadFile(array_dir / "Gone.nfo"), "stranded meta");
    EXPECT_FALSE(fs::exists(cache_dir / "Gone.srt"));
    EXPECT_FALSE(fs::exists(cache_dir / "Gone.nfo"));

    EXPECT_TRUE(fs::exists(cache_dir / "Film.mkv"));
    EXPECT_TRUE(fs::exists(cache_dir / "Film.srt"));
    EXPECT_TRUE(fs::exists(cache_dir / "Film.en.srt"));
    EXPECT_FALSE(fs::exists(array_dir / "Film.srt"));
}

TEST_F(OrphanReconcilerTest, TaggedSidecarBelongsToBaseStem)
{
    TransferExecutor mover(
        *cache_tier_, *array_tier_, copier_, resolver_, DirectoryOwnership{}, PhaseOptions{}
    );
    OrphanReconciler reconciler(*cache_tier_, *translator_, resolver_, {"mkv"}, mover);
    const auto dir = cache_ / "Movies" / "Film (2020)";
    EXPECT_FALSE(reconciler.IsOrphan(dir / "Film.en.srt"));
    EXPECT_FALSE(reconciler.IsOrphan(dir / "Film.srt"));
    EXPECT_TRUE(reconciler.IsOrphan(dir / "Gone.srt"));
}

TEST_F(OrphanReconcilerTest, MediaExtensionMatchesIgnoringCase)
{
    const auto dir = cache_ / "Movies" / "Cam";
    WriteFile(dir / "Cam.MKV", "media");
    WriteFile(dir / "Cam.srt", "subs");
    WriteFile(dir / "Clip.Mp4", "media");
    WriteFile(dir / "Clip.en.SRT", "subs");

    EXPECT_EQ(Reconcile({dir}), 0u);
    EXPECT_TRUE(fs::exists(dir / "Cam.srt"));
    EXPECT_TRUE(fs::exists(dir / "Clip.en.SRT"));
    EXPECT_FALSE(fs::exists(array_ / "Movies" / "Cam" / "Cam.srt"));
}

TEST_F(OrphanReconcilerTest, StemMustMatchExactly)
{
    const auto dir = cache_ / "Movies" / "Cam";
    WriteFile(dir / "cam.mkv", "media");
    WriteFile(dir / "Cam.srt", "subs");

    EXPECT_EQ(Reconcile({dir}), 1u);
    EXPECT_TRUE(fs::exists(array_ / "Movies" / "Cam" / "Cam.srt"));
    EXPECT_TRUE(fs::exists(dir / "cam.mkv"));
}

TEST_F(OrphanReconcilerTest, NoRootsDoesNothing)
{
    EXPECT_EQ(Reconcile({}), 0u);
    EXPECT_TRUE(copier_.calls.empty());
}

TEST_F(OrphanReconcilerTest, MissingOrForeignRootIsSkipped)
{
    EXPECT_EQ(Reconcile({cache_ / "NoSuchLibrary", array_ / "Movies"}), 0u);
    EXPECT_TRUE(fs::exists(cache_ / "Movies" / "Film (2020)" / "Gone.srt"));
}

TEST_F(OrphanReconcilerTest, DryRunLeavesFilesInPlace)
{
    Reconcile({cache_ / "Movies"}, true);
    EXPECT_TRUE(fs::exists(cache_ / "Movies" / "Film (2020)" / "Gone.srt"));
    EXPECT_FALSE(fs::exists(array_ / "Movies" / "Film (2020)" / "Gone.srt"));
}
