#ifndef WARMCACHE_SRC_COPY_NATIVE_COPIER_HPP_
#define WARMCACHE_SRC_COPY_NATIVE_COPIER_HPP_

#include "copy/i_copier.hpp"

#include <cstdint>

namespace WarmCache::Copy
{

/**
 * @brief In-process copier for hosts without rsync.
 *
 * Copies with std::filesystem::copy_file, then re-applies the source's
 * permission bits and modification time and the configured ownership. In
 * checksum mode the CRC-32 of source and destination are compared after the
 * copy and the copy is repeated once if they differ.
 */
class NativeCopier : public ICopier
{
    public:
    explicit NativeCopier(CopierSettings settings);
    ~NativeCopier() override = default;

    Storage::StorageResult<std::uint64_t> Copy(
        const fs::path& src, const fs::path& dst, const CopyOptions& options
    ) override;

    const char* GetName() const override { return "native"; }

    /// CRC-32 of a whole file
    static Storage::StorageResult<std::uint32_t> ComputeChecksum(const fs::path& path);

    private:
    Storage::StorageResult<void> CopyOnce(const fs::path& src, const fs::path& dst);
    Storage::StorageResult<void> ApplyAttributes(const fs::path& src, const fs::path& dst);

    CopierSettings settings_;
};

}  // namespace WarmCache::Copy

#endif  // WARMCACHE_SRC_COPY_NATIVE_COPIER_HPP_
