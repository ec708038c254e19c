#ifndef WARMCACHE_SRC_STORAGE_I_STORAGE_HPP_
#define WARMCACHE_SRC_STORAGE_I_STORAGE_HPP_

#include "storage/storage_error.hpp"

#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace WarmCache::Storage
{

namespace fs = std::filesystem;

/// Ownership and permission bits applied to directories created on a tier
struct DirectoryOwnership {
    mode_t mode = 0775;
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;
};

/// Access to one storage tier (array or cache). All paths are absolute host
/// paths and must lie under the tier root; anything else is rejected with
/// StorageErrc::InvalidPath.
class IStorage
{
    public:
    virtual ~IStorage() = default;

    [[nodiscard]] virtual const fs::path& GetPath() const = 0;
    [[nodiscard]] virtual bool Contains(const fs::path& path) const = 0;

    [[nodiscard]] virtual StorageResult<std::uint64_t> GetAvailableBytes() const = 0;
    virtual StorageResult<struct statvfs> GetFilesystemStats() const             = 0;

    virtual StorageResult<bool> CheckIfFileExists(const fs::path& path) const      = 0;
    virtual StorageResult<struct stat> GetAttributes(const fs::path& path) const   = 0;
    virtual StorageResult<std::uint64_t> GetFileSize(const fs::path& path) const   = 0;
    virtual StorageResult<std::vector<fs::path>> ListFilesRecursive(const fs::path& dir) const = 0;
    /// Regular files directly inside dir, sorted
    virtual StorageResult<std::vector<fs::path>> ListDirectory(const fs::path& dir) const = 0;

    virtual StorageResult<void> Remove(const fs::path& path) = 0;

    /// Removes the directory if it is empty. Returns false when it was kept.
    /// The tier root itself is never removed.
    virtual StorageResult<bool> RemoveDirectoryIfEmpty(const fs::path& dir) = 0;

    /// Creates every missing component of dir, applying ownership to each one created.
    virtual StorageResult<void> CreateDirectories(
        const fs::path& dir, const DirectoryOwnership& ownership
    ) = 0;

    virtual StorageResult<void> Initialize() = 0;
};

}  // namespace WarmCache::Storage

#endif  // WARMCACHE_SRC_STORAGE_I_STORAGE_HPP_
