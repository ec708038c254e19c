#ifndef WARMCACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_
#define WARMCACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_

#include "storage/i_storage.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace WarmCache::Storage
{

namespace fs = std::filesystem;

class LocalStorage : public IStorage
{
    public:
    explicit LocalStorage(const fs::path& base_path);
    ~LocalStorage() override = default;

    LocalStorage(const LocalStorage&)            = delete;
    LocalStorage& operator=(const LocalStorage&) = delete;
    LocalStorage(LocalStorage&&)                 = delete;
    LocalStorage& operator=(LocalStorage&&)      = delete;

    const fs::path& GetPath() const override { return base_path_; }
    bool Contains(const fs::path& path) const override;

    StorageResult<std::uint64_t> GetAvailableBytes() const override;
    StorageResult<struct statvfs> GetFilesystemStats() const override;

    StorageResult<bool> CheckIfFileExists(const fs::path& path) const override;
    StorageResult<struct stat> GetAttributes(const fs::path& path) const override;
    StorageResult<std::uint64_t> GetFileSize(const fs::path& path) const override;
    StorageResult<std::vector<fs::path>> ListFilesRecursive(const fs::path& dir) const override;
    StorageResult<std::vector<fs::path>> ListDirectory(const fs::path& dir) const override;

    StorageResult<void> Remove(const fs::path& path) override;
    StorageResult<bool> RemoveDirectoryIfEmpty(const fs::path& dir) override;
    StorageResult<void> CreateDirectories(
        const fs::path& dir, const DirectoryOwnership& ownership
    ) override;

    StorageResult<void> Initialize() override;

    private:
    fs::path GetValidatedFullPath(const fs::path& path) const;

    fs::path base_path_;
};

}  // namespace WarmCache::Storage

#endif  // WARMCACHE_SRC_STORAGE_LOCAL_STORAGE_HPP_
