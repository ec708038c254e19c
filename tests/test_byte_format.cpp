#include "util/byte_format.hpp"

#include <gtest/gtest.h>
#include <cstdint>

using WarmCache::Util::FormatBytes;

TEST(ByteFormatTest, SmallValuesArePlainBytes)
{
    EXPECT_EQ(FormatBytes(std::uint64_t{0}), "0");
    EXPECT_EQ(FormatBytes(std::uint64_t{512}), "512");
    EXPECT_EQ(FormatBytes(std::uint64_t{1023}), "1023");
}

TEST(ByteFormatTest, UsesIecSuffixes)
{
    EXPECT_EQ(FormatBytes(std::uint64_t{1536}), "1.5K");
    EXPECT_EQ(FormatBytes(std::uint64_t{700} * 1024 * 1024), "700M");
    EXPECT_EQ(FormatBytes(std::uint64_t{3} * 1024 * 1024 * 1024 / 2), "1.5G");
    EXPECT_EQ(FormatBytes(std::uint64_t{70} * 1024 * 1024 * 1024), "70G");
    EXPECT_EQ(FormatBytes(std::uint64_t{2} * 1024 * 1024 * 1024 * 1024), "2.0T");
}

TEST(ByteFormatTest, NegativeAllowance)
{
    EXPECT_EQ(FormatBytes(std::int64_t{-2048}), "-2.0K");
    EXPECT_EQ(FormatBytes(std::int64_t{100}), "100");
}
