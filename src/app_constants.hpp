#ifndef WARMCACHE_SRC_APP_CONSTANTS_HPP_
#define WARMCACHE_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <sys/types.h>
#include <array>
#include <cstdint>
#include <string_view>

namespace WarmCache::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "WarmCache";
// TODO: Derive from cmake
constexpr std::string_view APP_VERSION_STRING = "WarmCache version 0.1.0";
constexpr std::string_view APP_VERSION_SHORT  = "0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::info;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr std::string_view DEFAULT_FILE_LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

// Run coordination
constexpr std::string_view DEFAULT_LOCK_FILE = "/tmp/warmcache.lock";
constexpr std::size_t DEFAULT_MAX_ITEMS      = 500;

// Space budget
constexpr std::uint64_t GIB                       = 1024ULL * 1024ULL * 1024ULL;
constexpr std::uint64_t DEFAULT_RESERVE_BYTES     = 10 * GIB;
constexpr std::uint64_t DEFAULT_MIN_FREE_BYTES    = 20 * GIB;
constexpr mode_t DEFAULT_DIRECTORY_MODE           = 0775;

// Copy capability
constexpr std::string_view DEFAULT_RSYNC_PATH = "rsync";

// Companion and media file extensions (lower case, without the dot)
constexpr std::array<std::string_view, 6> DEFAULT_SIDECAR_EXTENSIONS = {
    "srt", "ass", "sub", "nfo", "jpg", "png"
};
constexpr std::array<std::string_view, 12> DEFAULT_MEDIA_EXTENSIONS = {
    "mkv", "mp4", "m4v", "avi", "mov", "wmv", "ts", "m2ts", "webm", "mpg", "mpeg", "flv"
};

// Process exit codes
constexpr int EXIT_RAN     = 0;
constexpr int EXIT_STARTUP = 1;
constexpr int EXIT_ABORTED = 2;

}  // namespace WarmCache::Constants

#endif  // WARMCACHE_SRC_APP_CONSTANTS_HPP_
