#ifndef WARMCACHE_SRC_CANDIDATES_EXCLUSION_CHECK_HPP_
#define WARMCACHE_SRC_CANDIDATES_EXCLUSION_CHECK_HPP_

#include "transfer/path_translator.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace WarmCache::Candidates
{

namespace fs = std::filesystem;

/// Liveness check for files that must not be touched right now.
class IExclusionCheck
{
    public:
    virtual ~IExclusionCheck() = default;

    virtual bool IsInUse(const fs::path& host_path) const = 0;
};

/**
 * @brief Exclusion check over a snapshot of in-use paths.
 *
 * Each reported path is translated to the host and registered under both
 * its array and cache equivalents, so a file is excluded regardless of the
 * tier it currently sits on. Untranslatable entries are ignored.
 */
class PathSetExclusionCheck : public IExclusionCheck
{
    public:
    PathSetExclusionCheck(
        const std::vector<std::string>& in_use_paths, const Transfer::PathTranslator& translator
    );

    bool IsInUse(const fs::path& host_path) const override;

    std::size_t Size() const { return paths_.size(); }

    private:
    std::unordered_set<std::string> paths_;
};

}  // namespace WarmCache::Candidates

#endif  // WARMCACHE_SRC_CANDIDATES_EXCLUSION_CHECK_HPP_
