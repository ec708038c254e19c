#ifndef WARMCACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
#define WARMCACHE_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace WarmCache::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Tier/Transfer Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,        // Not an error
    FileNotFound,       // Path does not exist on the tier
    PermissionDenied,   // Operation not permitted
    IOError,            // General I/O error
    NotSupported,       // Operation is not supported by this backend
    OutOfSpace,         // No space left on the storage medium
    AlreadyExists,      // Attempted to create something that already exists
    NotADirectory,      // Expected a directory, found a file
    IsADirectory,       // Expected a file, found a directory
    NotEmpty,           // Attempted to remove a non-empty directory
    InvalidPath,        // Path is outside the tier root or malformed
    CopyFailed,         // Copy capability reported a failure
    VerifyMismatch,     // Destination does not match source after copy
    ToolNotFound,       // External program could not be executed
    TranslationFailed,  // No path-mapping rule matched
    LockHeld,           // Another run holds the run lock
    UnknownError,       // An unspecified error occurred
};
// clang-format on

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::FileNotFound;
        case EACCES:
        case EPERM:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case ENOSPC:
            return StorageErrc::OutOfSpace;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EISDIR:
            return StorageErrc::IsADirectory;
        case ENOTEMPTY:
            return StorageErrc::NotEmpty;
        case EOPNOTSUPP:
            return StorageErrc::NotSupported;
        case EWOULDBLOCK:
            return StorageErrc::LockHeld;

        default:
            return StorageErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "WarmCache::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::FileNotFound:
                return "File or directory not found";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::NotSupported:
                return "Operation not supported";
            case StorageErrc::OutOfSpace:
                return "No space left on device";
            case StorageErrc::AlreadyExists:
                return "File or directory already exists";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::IsADirectory:
                return "Path is a directory";
            case StorageErrc::NotEmpty:
                return "Directory not empty";
            case StorageErrc::InvalidPath:
                return "Invalid path";
            case StorageErrc::CopyFailed:
                return "Copy failed";
            case StorageErrc::VerifyMismatch:
                return "Destination does not match source";
            case StorageErrc::ToolNotFound:
                return "External program could not be executed";
            case StorageErrc::TranslationFailed:
                return "No path mapping rule matched";
            case StorageErrc::LockHeld:
                return "Another run holds the run lock";
            case StorageErrc::UnknownError:
                return "Unknown storage error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

// Maps errors coming from std::filesystem or raw syscalls into the storage category
inline std::error_code MapFilesystemError(const std::error_code& ec)
{
    if (!ec) {
        return {};
    }
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return make_error_code(ErrnoToStorageErrc(ec.value()));
    }
    return ec;
}

inline std::error_code LastErrnoError() { return make_error_code(ErrnoToStorageErrc(errno)); }

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

}  // namespace WarmCache::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<WarmCache::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // WARMCACHE_SRC_STORAGE_STORAGE_ERROR_HPP_
