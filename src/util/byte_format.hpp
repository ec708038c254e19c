#ifndef WARMCACHE_SRC_UTIL_BYTE_FORMAT_HPP_
#define WARMCACHE_SRC_UTIL_BYTE_FORMAT_HPP_

#include <array>
#include <cstdint>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace WarmCache::Util
{

/// Formats a byte count with IEC suffixes, one decimal below 10 ("1.5G", "700M", "512").
inline std::string FormatBytes(std::uint64_t bytes)
{
    static constexpr std::array<char, 6> kSuffixes = {'K', 'M', 'G', 'T', 'P', 'E'};
    if (bytes < 1024) {
        return std::to_string(bytes);
    }
    double value    = static_cast<double>(bytes);
    std::size_t idx = 0;
    value /= 1024.0;
    while (value >= 1024.0 && idx + 1 < kSuffixes.size()) {
        value /= 1024.0;
        ++idx;
    }
    if (value < 10.0) {
        return fmt::format("{:.1f}{}", value, kSuffixes[idx]);
    }
    return fmt::format("{:.0f}{}", value, kSuffixes[idx]);
}

/// Signed variant for allowances that may be negative.
inline std::string FormatBytes(std::int64_t bytes)
{
    if (bytes < 0) {
        return "-" + FormatBytes(static_cast<std::uint64_t>(-(bytes + 1)) + 1);
    }
    return FormatBytes(static_cast<std::uint64_t>(bytes));
}

}  // namespace WarmCache::Util

#endif  // WARMCACHE_SRC_UTIL_BYTE_FORMAT_HPP_
