#include "storage/run_lock.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace WarmCache::Storage
{

RunLock::RunLock(fs::path path, FileDescriptorGuard fd) : path_(std::move(path)), fd_(std::move(fd))
{
}

RunLock::~RunLock()
{
    if (fd_) {
        if (::flock(fd_.get(), LOCK_UN) == -1) {
            spdlog::warn("Failed to release run lock {}: {}", path_.string(), std::strerror(errno));
        } else {
            spdlog::debug("Released run lock {}", path_.string());
        }
    }
}

StorageResult<RunLock> RunLock::TryAcquire(const fs::path& lock_path)
{
    std::error_code ec;
    if (lock_path.has_parent_path()) {
        fs::create_directories(lock_path.parent_path(), ec);
        if (ec) {
            spdlog::error(
                "Cannot create directory for run lock {}: {}", lock_path.string(), ec.message()
            );
            return std::unexpected(MapFilesystemError(ec));
        }
    }

    const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        auto err = LastErrnoError();
        spdlog::error("Cannot open run lock {}: {}", lock_path.string(), err.message());
        return std::unexpected(err);
    }
    FileDescriptorGuard fd_guard(fd);

    if (::flock(fd_guard.get(), LOCK_EX | LOCK_NB) == -1) {
        const int lock_errno = errno;
        if (lock_errno == EWOULDBLOCK) {
            return std::unexpected(make_error_code(StorageErrc::LockHeld));
        }
        return std::unexpected(make_error_code(ErrnoToStorageErrc(lock_errno)));
    }

    // Record the holder for operators; failure to write is harmless
    const std::string pid_line = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd_guard.get(), 0) == 0) {
        if (::write(fd_guard.get(), pid_line.data(), pid_line.size()) == -1) {
            spdlog::debug("Could not record pid in run lock {}", lock_path.string());
        }
    }

    spdlog::debug("Acquired run lock {}", lock_path.string());
    return RunLock(lock_path, std::move(fd_guard));
}

}  // namespace WarmCache::Storage
