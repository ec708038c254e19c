#ifndef WARMCACHE_SRC_TRANSFER_PATH_TRANSLATOR_HPP_
#define WARMCACHE_SRC_TRANSFER_PATH_TRANSLATOR_HPP_

#include "config/config_types.hpp"
#include "storage/storage_error.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WarmCache::Transfer
{

namespace fs = std::filesystem;

/**
 * @brief Maps foreign-rooted paths onto the host and between the two tiers.
 *
 * Foreign paths are rewritten with an ordered list of prefix rules where the
 * first matching rule wins. A rule matches a path equal to its prefix or
 * starting with the prefix followed by '/'. Host paths under the share root
 * are then normalised onto the array root.
 */
class PathTranslator
{
    public:
    /// Throws std::invalid_argument unless both roots are absolute and distinct.
    PathTranslator(
        fs::path array_root, fs::path cache_root, std::vector<Config::PathMapRule> rules,
        std::optional<fs::path> share_root = std::nullopt
    );

    /// Applies the first matching rule. Pure string rewrite, no filesystem access.
    static std::optional<std::string> Translate(
        std::string_view foreign_path, const std::vector<Config::PathMapRule>& rules
    );

    /// Resolves a candidate path to a host path. Paths no rule matches are
    /// accepted only when they already lie under one of the known roots.
    Storage::StorageResult<fs::path> ToHost(std::string_view foreign_path) const;

    Storage::StorageResult<fs::path> ToCache(const fs::path& array_path) const;
    Storage::StorageResult<fs::path> ToArray(const fs::path& cache_path) const;

    bool IsUnderArray(const fs::path& path) const;
    bool IsUnderCache(const fs::path& path) const;

    const fs::path& GetArrayRoot() const { return array_root_; }
    const fs::path& GetCacheRoot() const { return cache_root_; }

    private:
    static std::optional<fs::path> Rebase(
        const fs::path& path, const fs::path& from_root, const fs::path& to_root
    );

    fs::path array_root_;
    fs::path cache_root_;
    std::optional<fs::path> share_root_;
    std::vector<Config::PathMapRule> rules_;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_PATH_TRANSLATOR_HPP_
