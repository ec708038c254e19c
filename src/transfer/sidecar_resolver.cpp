#include "transfer/sidecar_resolver.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace WarmCache::Transfer
{

std::string ExtensionOf(const fs::path& path)
{
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

SidecarResolver::SidecarResolver(std::vector<std::string> extensions)
    : extensions_(std::move(extensions))
{
    for (auto& ext : extensions_) {
        std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    }
}

std::vector<fs::path> SidecarResolver::Resolve(
    const Storage::IStorage& tier, const fs::path& media_path
) const
{
    std::vector<fs::path> sidecars;
    const auto stem = media_path.stem().string();
    if (stem.empty()) {
        return sidecars;
    }

    auto entries_res = tier.ListDirectory(media_path.parent_path());
    if (!entries_res) {
        spdlog::debug(
            "Sidecar lookup in '{}' failed: {}", media_path.parent_path().string(),
            entries_res.error().message()
        );
        return sidecars;
    }

    // Stem matches exactly, extension ignoring case
    for (const auto& ext : extensions_) {
        for (const auto& entry : *entries_res) {
            if (entry.filename() != media_path.filename() && entry.stem().string() == stem &&
                ExtensionOf(entry) == ext) {
                sidecars.push_back(entry);
            }
        }
    }
    return sidecars;
}

bool SidecarResolver::IsSidecar(const fs::path& path) const
{
    const auto ext = ExtensionOf(path);
    return !ext.empty() && std::ranges::find(extensions_, ext) != extensions_.end();
}

}  // namespace WarmCache::Transfer
