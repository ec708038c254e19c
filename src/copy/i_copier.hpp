#ifndef WARMCACHE_SRC_COPY_I_COPIER_HPP_
#define WARMCACHE_SRC_COPY_I_COPIER_HPP_

#include "storage/storage_error.hpp"

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace WarmCache::Copy
{

namespace fs = std::filesystem;

/// Per-call copy modes
struct CopyOptions {
    bool checksum = false;  ///< Compare content, not just size and mtime
    bool dry_run  = false;  ///< Report what would be copied without writing
};

/// Settings fixed for the lifetime of a copier
struct CopierSettings {
    std::optional<uid_t> owner_uid;  ///< Ownership override for copied files
    std::optional<gid_t> owner_gid;
    bool preserve_attributes = true;  ///< Keep timestamps and permission bits
    bool in_place            = true;  ///< Write directly into the destination (resumable)
};

/// The bulk copy capability. Implementations block until the copy completes.
class ICopier
{
    public:
    virtual ~ICopier() = default;

    /// Copies src onto dst (created or overwritten) and returns the bytes
    /// transferred. The destination's parent directory must already exist.
    virtual Storage::StorageResult<std::uint64_t> Copy(
        const fs::path& src, const fs::path& dst, const CopyOptions& options
    ) = 0;

    virtual const char* GetName() const = 0;
};

}  // namespace WarmCache::Copy

#endif  // WARMCACHE_SRC_COPY_I_COPIER_HPP_
