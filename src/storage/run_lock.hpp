#ifndef WARMCACHE_SRC_STORAGE_RUN_LOCK_HPP_
#define WARMCACHE_SRC_STORAGE_RUN_LOCK_HPP_

#include "storage/fd_guard.hpp"
#include "storage/storage_error.hpp"

#include <filesystem>

namespace WarmCache::Storage
{

namespace fs = std::filesystem;

/**
 * @brief Exclusive advisory lock that keeps overlapping runs apart.
 *
 * The lock is an flock(2) on a lock file. It is released when the RunLock is
 * destroyed, and by the kernel when the process dies, so a crashed run never
 * leaves a stale lock behind. The lock file itself is left in place.
 */
class RunLock
{
    public:
    RunLock(const RunLock&)            = delete;
    RunLock& operator=(const RunLock&) = delete;
    RunLock(RunLock&&) noexcept            = default;
    RunLock& operator=(RunLock&&) noexcept = default;
    ~RunLock();

    /**
     * @brief Tries to take the lock without blocking.
     *
     * @return The held lock, StorageErrc::LockHeld if another process owns it,
     * or the error that prevented opening the lock file.
     */
    static StorageResult<RunLock> TryAcquire(const fs::path& lock_path);

    const fs::path& GetPath() const { return path_; }

    private:
    RunLock(fs::path path, FileDescriptorGuard fd);

    fs::path path_;
    FileDescriptorGuard fd_;
};

}  // namespace WarmCache::Storage

#endif  // WARMCACHE_SRC_STORAGE_RUN_LOCK_HPP_
