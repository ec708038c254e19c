#ifndef WARMCACHE_SRC_COPY_RSYNC_COPIER_HPP_
#define WARMCACHE_SRC_COPY_RSYNC_COPIER_HPP_

#include "copy/i_copier.hpp"

#include <string>
#include <vector>

namespace WarmCache::Copy
{

/// Copies by running rsync as a child process.
class RsyncCopier : public ICopier
{
    public:
    RsyncCopier(std::string rsync_path, CopierSettings settings, std::vector<std::string> extra_args);
    ~RsyncCopier() override = default;

    Storage::StorageResult<std::uint64_t> Copy(
        const fs::path& src, const fs::path& dst, const CopyOptions& options
    ) override;

    const char* GetName() const override { return "rsync"; }

    /// Full argument vector for one invocation, argv[0] included.
    std::vector<std::string> BuildArguments(
        const fs::path& src, const fs::path& dst, const CopyOptions& options
    ) const;

    private:
    std::string rsync_path_;
    CopierSettings settings_;
    std::vector<std::string> extra_args_;
};

}  // namespace WarmCache::Copy

#endif  // WARMCACHE_SRC_COPY_RSYNC_COPIER_HPP_
