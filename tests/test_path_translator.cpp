#include "transfer/path_translator.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

using WarmCache::Config::PathMapRule;
using WarmCache::Storage::StorageErrc;
using WarmCache::Transfer::PathTranslator;

class PathTranslatorTest : public ::testing::Test
{
    protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    std::vector<PathMapRule> rules_{
        {"/data", "/mnt/user"},
        {"/media/", "/mnt/user/media/"},
    };
    PathTranslator translator_{"/mnt/user0", "/mnt/cache", rules_, "/mnt/user"};
};

TEST_F(PathTranslatorTest, FirstMatchingRuleWins)
{
    const std::vector<PathMapRule> rules{{"/data", "/mnt/user"}, {"/data/movies", "/elsewhere"}};
    EXPECT_EQ(
        PathTranslator::Translate("/data/movies/a.mkv", rules).value_or(""),
        "/mnt/user/movies/a.mkv"
    );
}

TEST_F(PathTranslatorTest, PrefixMustEndAtComponentBoundary)
{
    EXPECT_FALSE(PathTranslator::Translate("/database/a.mkv", rules_).has_value());
    EXPECT_FALSE(PathTranslator::Translate("/data", rules_).has_value());
    EXPECT_EQ(PathTranslator::Translate("/media/x.mkv", rules_).value_or(""), "/mnt/user/media/x.mkv");
}

TEST_F(PathTranslatorTest, NoRulesNeverMatch)
{
    EXPECT_FALSE(PathTranslator::Translate("/data/a.mkv", {}).has_value());
}

TEST_F(PathTranslatorTest, ToHostNormalisesShareRootOntoArray)
{
    auto res = translator_.ToHost("/data/Movies/Film (2020)/Film.mkv");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->string(), "/mnt/user0/Movies/Film (2020)/Film.mkv");
}

TEST_F(PathTranslatorTest, ToHostAcceptsPathsAlreadyOnTheHost)
{
    auto array_path = translator_.ToHost("/mnt/user0/TV/ep.mkv");
    ASSERT_TRUE(array_path.has_value());
    EXPECT_EQ(array_path->string(), "/mnt/user0/TV/ep.mkv");

    auto cache_path = translator_.ToHost("/mnt/cache/TV/ep.mkv");
    ASSERT_TRUE(cache_path.has_value());
    EXPECT_EQ(cache_path->string(), "/mnt/cache/TV/ep.mkv");

    auto share_path = translator_.ToHost("/mnt/user/TV/ep.mkv");
    ASSERT_TRUE(share_path.has_value());
    EXPECT_EQ(share_path->string(), "/mnt/user0/TV/ep.mkv");
}

TEST_F(PathTranslatorTest, ToHostFailsWithoutMatchingRule)
{
    auto res = translator_.ToHost("/srv/library/a.mkv");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), StorageErrc::TranslationFailed);

    EXPECT_FALSE(translator_.ToHost("relative/a.mkv").has_value());
}

TEST_F(PathTranslatorTest, RootSubstitution)
{
    auto cache = translator_.ToCache("/mnt/user0/Movies/a.mkv");
    ASSERT_TRUE(cache.has_value());
    EXPECT_EQ(cache->string(), "/mnt/cache/Movies/a.mkv");

    auto array = translator_.ToArray("/mnt/cache/Movies/a.mkv");
    ASSERT_TRUE(array.has_value());
    EXPECT_EQ(array->string(), "/mnt/user0/Movies/a.mkv");

    EXPECT_EQ(translator_.ToCache("/mnt/cache/a.mkv").error(), StorageErrc::InvalidPath);
    EXPECT_EQ(translator_.ToCache("/mnt/user0").error(), StorageErrc::InvalidPath);
    EXPECT_EQ(translator_.ToArray("/mnt/user0/a.mkv").error(), StorageErrc::InvalidPath);
}

TEST_F(PathTranslatorTest, SiblingRootIsNotInside)
{
    PathTranslator translator("/mnt/user", "/mnt/cache", {});
    EXPECT_TRUE(translator.IsUnderArray("/mnt/user/a.mkv"));
    EXPECT_FALSE(translator.IsUnderArray("/mnt/user0/a.mkv"));
    EXPECT_FALSE(translator.IsUnderArray("/mnt/user/../cache/a.mkv"));
    EXPECT_TRUE(translator.IsUnderCache("/mnt/user/../cache/a.mkv"));
}

TEST_F(PathTranslatorTest, RejectsInvalidRoots)
{
    EXPECT_THROW(PathTranslator("/mnt/user0", "/mnt/user0/", {}), std::invalid_argument);
    EXPECT_THROW(PathTranslator("mnt/user0", "/mnt/cache", {}), std::invalid_argument);
    EXPECT_THROW(PathTranslator("/", "/mnt/cache", {}), std::invalid_argument);
    EXPECT_NO_THROW(PathTranslator("/mnt/user0", "/mnt/cache", {}));
}
