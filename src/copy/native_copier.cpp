#include "copy/native_copier.hpp"

#include "storage/fd_guard.hpp"

#include <boost/crc.hpp>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <system_error>

namespace WarmCache::Copy
{

using Storage::StorageErrc;

NativeCopier::NativeCopier(CopierSettings settings) : settings_(settings) {}

Storage::StorageResult<std::uint32_t> NativeCopier::ComputeChecksum(const fs::path& path)
{
    Storage::FileDescriptorGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        return std::unexpected(Storage::LastErrnoError());
    }

    boost::crc_32_type crc;
    std::array<char, 1 << 16> buffer{};
    while (true) {
        const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(Storage::LastErrnoError());
        }
        if (n == 0) {
            break;
        }
        crc.process_bytes(buffer.data(), static_cast<std::size_t>(n));
    }
    return static_cast<std::uint32_t>(crc.checksum());
}

Storage::StorageResult<void> NativeCopier::CopyOnce(const fs::path& src, const fs::path& dst)
{
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error(
            "copy_file '{}' -> '{}' failed: {}", src.string(), dst.string(), ec.message()
        );
        return std::unexpected(Storage::MapFilesystemError(ec));
    }
    return ApplyAttributes(src, dst);
}

Storage::StorageResult<void> NativeCopier::ApplyAttributes(
    const fs::path& src, const fs::path& dst
)
{
    struct stat src_stat{};
    if (::stat(src.c_str(), &src_stat) == -1) {
        return std::unexpected(Storage::LastErrnoError());
    }

    if (settings_.preserve_attributes) {
        if (::chmod(dst.c_str(), src_stat.st_mode & 07777) == -1) {
            return std::unexpected(Storage::LastErrnoError());
        }
        const std::array<struct timespec, 2> times{src_stat.st_atim, src_stat.st_mtim};
        if (::utimensat(AT_FDCWD, dst.c_str(), times.data(), 0) == -1) {
            return std::unexpected(Storage::LastErrnoError());
        }
    }

    if (settings_.owner_uid.has_value() || settings_.owner_gid.has_value()) {
        const uid_t uid = settings_.owner_uid.value_or(static_cast<uid_t>(-1));
        const gid_t gid = settings_.owner_gid.value_or(static_cast<gid_t>(-1));
        if (::chown(dst.c_str(), uid, gid) == -1) {
            spdlog::error("chown '{}' to {}:{} failed", dst.string(), uid, gid);
            return std::unexpected(Storage::LastErrnoError());
        }
    }
    return {};
}

Storage::StorageResult<std::uint64_t> NativeCopier::Copy(
    const fs::path& src, const fs::path& dst, const CopyOptions& options
)
{
    struct stat src_stat{};
    if (::stat(src.c_str(), &src_stat) == -1) {
        return std::unexpected(Storage::LastErrnoError());
    }
    if (!S_ISREG(src_stat.st_mode)) {
        return std::unexpected(Storage::make_error_code(StorageErrc::IsADirectory));
    }
    const auto size = static_cast<std::uint64_t>(src_stat.st_size);

    if (options.dry_run) {
        spdlog::info("[native] would copy '{}' -> '{}' ({} bytes)", src.string(), dst.string(), size);
        return size;
    }

    spdlog::info("[native] copy '{}' -> '{}'", src.string(), dst.string());
    if (auto res = CopyOnce(src, dst); !res) {
        return std::unexpected(res.error());
    }

    if (!options.checksum) {
        return size;
    }

    auto src_crc = ComputeChecksum(src);
    if (!src_crc) {
        return std::unexpected(src_crc.error());
    }
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto dst_crc = ComputeChecksum(dst);
        if (!dst_crc) {
            return std::unexpected(dst_crc.error());
        }
        if (*dst_crc == *src_crc) {
            spdlog::debug("[native] checksum match {:08x} for '{}'", *src_crc, dst.string());
            return size;
        }
        spdlog::warn(
            "[native] checksum mismatch for '{}' (source {:08x}, destination {:08x})",
            dst.string(), *src_crc, *dst_crc
        );
        if (attempt == 0) {
            if (auto res = CopyOnce(src, dst); !res) {
                return std::unexpected(res.error());
            }
        }
    }
    return std::unexpected(Storage::make_error_code(StorageErrc::VerifyMismatch));
}

}  // namespace WarmCache::Copy
