#ifndef WARMCACHE_SRC_TRANSFER_SIDECAR_RESOLVER_HPP_
#define WARMCACHE_SRC_TRANSFER_SIDECAR_RESOLVER_HPP_

#include "storage/i_storage.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace WarmCache::Transfer
{

namespace fs = std::filesystem;

/// Lower-case extension of path without the leading dot ("" when there is none)
std::string ExtensionOf(const fs::path& path);

/// Finds companion files (subtitles, artwork, metadata) that share a media file's stem.
class SidecarResolver
{
    public:
    explicit SidecarResolver(std::vector<std::string> extensions);

    /// Existing sidecars of media_path on the given tier, in extension order.
    /// The stem must match exactly; the extension is compared ignoring case.
    std::vector<fs::path> Resolve(const Storage::IStorage& tier, const fs::path& media_path) const;

    /// True when path carries one of the configured sidecar extensions.
    bool IsSidecar(const fs::path& path) const;

    const std::vector<std::string>& GetExtensions() const { return extensions_; }

    private:
    std::vector<std::string> extensions_;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_SIDECAR_RESOLVER_HPP_
