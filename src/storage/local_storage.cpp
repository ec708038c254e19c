#include "storage/local_storage.hpp"

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace WarmCache::Storage
{

namespace fs = std::filesystem;

LocalStorage::LocalStorage(const fs::path& base_path)
    : base_path_(base_path.lexically_normal())
{
    if (base_path_.empty() || !base_path_.is_absolute()) {
        throw std::invalid_argument("LocalStorage requires a non-empty absolute path.");
    }
    // Drop a trailing separator so prefix checks compare whole components
    if (!base_path_.has_filename() && base_path_ != base_path_.root_path()) {
        base_path_ = base_path_.parent_path();
    }
    spdlog::debug("LocalStorage created for path: {}", base_path_.string());
}

bool LocalStorage::Contains(const fs::path& path) const
{
    return !GetValidatedFullPath(path).empty();
}

fs::path LocalStorage::GetValidatedFullPath(const fs::path& path) const
{
    if (!path.is_absolute()) {
        return {};
    }
    auto full = path.lexically_normal();
    if (!full.has_filename() && full != full.root_path()) {
        full = full.parent_path();
    }
    auto rel = full.lexically_relative(base_path_);
    if (rel.empty() || *rel.begin() == "..") {
        return {};
    }
    return full;
}

StorageResult<void> LocalStorage::Initialize()
{
    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        spdlog::error("LocalStorage Initialize: tier root '{}' does not exist.", base_path_.string());
        return std::unexpected(MapFilesystemError(
            ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory)
        ));
    }
    if (!fs::is_directory(base_path_, ec)) {
        spdlog::error(
            "LocalStorage Initialize: tier root '{}' is not a directory.", base_path_.string()
        );
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    }
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return {};
}

StorageResult<struct statvfs> LocalStorage::GetFilesystemStats() const
{
    struct statvfs st = {};
    if (::statvfs(base_path_.c_str(), &st) == -1) {
        return std::unexpected(LastErrnoError());
    }
    return st;
}

StorageResult<std::uint64_t> LocalStorage::GetAvailableBytes() const
{
    auto stats_res = GetFilesystemStats();
    if (!stats_res) {
        return std::unexpected(stats_res.error());
    }
    // Blocks available to unprivileged users, like the "Available" column of df
    return static_cast<std::uint64_t>(stats_res->f_bavail) *
           static_cast<std::uint64_t>(stats_res->f_frsize);
}

StorageResult<bool> LocalStorage::CheckIfFileExists(const fs::path& path) const
{
    auto full_path = GetValidatedFullPath(path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    bool exists = fs::is_regular_file(full_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return std::unexpected(MapFilesystemError(ec));
    }
    return exists;
}

StorageResult<struct stat> LocalStorage::GetAttributes(const fs::path& path) const
{
    auto full_path = GetValidatedFullPath(path);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    struct stat stbuf{};
    if (::stat(full_path.c_str(), &stbuf) == -1) {
        return std::unexpected(LastErrnoError());
    }
    return stbuf;
}

StorageResult<std::uint64_t> LocalStorage::GetFileSize(const fs::path& path) const
{
    auto attr_res = GetAttributes(path);
    if (!attr_res) {
        return std::unexpected(attr_res.error());
    }
    if (S_ISDIR(attr_res->st_mode)) {
        return std::unexpected(make_error_code(StorageErrc::IsADirectory));
    }
    return static_cast<std::uint64_t>(attr_res->st_size);
}

StorageResult<std::vector<fs::path>> LocalStorage::ListFilesRecursive(const fs::path& dir) const
{
    auto full_path = GetValidatedFullPath(dir);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    if (!fs::is_directory(full_path, ec)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return std::unexpected(MapFilesystemError(ec));
        }
        return std::unexpected(make_error_code(
            fs::exists(full_path) ? StorageErrc::NotADirectory : StorageErrc::FileNotFound
        ));
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(
        full_path, fs::directory_options::skip_permission_denied, ec
    );
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error while scanning '{}': {}", full_path.string(), ec.message());
            return std::unexpected(MapFilesystemError(ec));
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    std::ranges::sort(files);
    return files;
}

StorageResult<std::vector<fs::path>> LocalStorage::ListDirectory(const fs::path& dir) const
{
    auto full_path = GetValidatedFullPath(dir);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    std::error_code ec;
    fs::directory_iterator it(full_path, ec);
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }

    std::vector<fs::path> files;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }
    std::ranges::sort(files);
    return files;
}

StorageResult<void> LocalStorage::Remove(const fs::path& path)
{
    const auto full_path = GetValidatedFullPath(path);
    if (full_path.empty() || full_path == base_path_) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    if (::unlink(full_path.c_str()) == -1) {
        const int unlink_errno = errno;
        if (unlink_errno == ENOENT) {
            return {};
        }
        return std::unexpected(make_error_code(ErrnoToStorageErrc(unlink_errno)));
    }
    return {};
}

StorageResult<bool> LocalStorage::RemoveDirectoryIfEmpty(const fs::path& dir)
{
    const auto full_path = GetValidatedFullPath(dir);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }
    if (full_path == base_path_) {
        return false;
    }

    if (::rmdir(full_path.c_str()) == -1) {
        const int rmdir_errno = errno;
        if (rmdir_errno == ENOTEMPTY || rmdir_errno == EEXIST) {
            return false;
        }
        return std::unexpected(make_error_code(ErrnoToStorageErrc(rmdir_errno)));
    }
    return true;
}

StorageResult<void> LocalStorage::CreateDirectories(
    const fs::path& dir, const DirectoryOwnership& ownership
)
{
    const auto full_path = GetValidatedFullPath(dir);
    if (full_path.empty()) {
        return std::unexpected(make_error_code(StorageErrc::InvalidPath));
    }

    // Collect missing components from the deepest up to the first existing ancestor
    std::vector<fs::path> missing;
    std::error_code ec;
    for (auto current = full_path; !fs::exists(current, ec); current = current.parent_path()) {
        if (ec) {
            return std::unexpected(MapFilesystemError(ec));
        }
        if (current == base_path_ || current == current.root_path()) {
            return std::unexpected(make_error_code(StorageErrc::FileNotFound));
        }
        missing.push_back(current);
    }
    if (ec) {
        return std::unexpected(MapFilesystemError(ec));
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        if (::mkdir(it->c_str(), ownership.mode) == -1 && errno != EEXIST) {
            const int mkdir_errno = errno;
            spdlog::error("mkdir '{}' failed: {}", it->string(), std::strerror(mkdir_errno));
            return std::unexpected(make_error_code(ErrnoToStorageErrc(mkdir_errno)));
        }
        // mkdir honours the umask; apply the configured bits explicitly
        if (::chmod(it->c_str(), ownership.mode) == -1) {
            return std::unexpected(LastErrnoError());
        }
        if (ownership.uid.has_value() || ownership.gid.has_value()) {
            const uid_t uid = ownership.uid.value_or(static_cast<uid_t>(-1));
            const gid_t gid = ownership.gid.value_or(static_cast<gid_t>(-1));
            if (::chown(it->c_str(), uid, gid) == -1) {
                const int chown_errno = errno;
                spdlog::error(
                    "chown '{}' to {}:{} failed: {}", it->string(), uid, gid,
                    std::strerror(chown_errno)
                );
                return std::unexpected(make_error_code(ErrnoToStorageErrc(chown_errno)));
            }
        }
        spdlog::trace("Created directory {}", it->string());
    }

    if (!fs::is_directory(full_path, ec)) {
        return std::unexpected(make_error_code(StorageErrc::NotADirectory));
    }
    return {};
}

}  // namespace WarmCache::Storage
