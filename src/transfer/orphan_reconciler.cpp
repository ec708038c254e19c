#include "transfer/orphan_reconciler.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace WarmCache::Transfer
{

using Storage::StorageErrc;

OrphanReconciler::OrphanReconciler(
    const Storage::IStorage& cache_tier, const PathTranslator& translator,
    const SidecarResolver& sidecars, std::vector<std::string> media_extensions,
    TransferExecutor& mover
)
    : cache_(cache_tier),
      translator_(translator),
      sidecars_(sidecars),
      media_extensions_(std::move(media_extensions)),
      mover_(mover)
{
    for (auto& ext : media_extensions_) {
        std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    }
}

bool OrphanReconciler::HasMediaWithStem(
    const std::vector<fs::path>& entries, const std::string& stem
) const
{
    return std::ranges::any_of(entries, [&](const fs::path& entry) {
        return entry.stem().string() == stem &&
               std::ranges::find(media_extensions_, ExtensionOf(entry)) != media_extensions_.end();
    });
}

bool OrphanReconciler::IsOrphan(const fs::path& sidecar) const
{
    auto entries_res = cache_.ListDirectory(sidecar.parent_path());
    if (!entries_res) {
        spdlog::warn(
            "Cannot list '{}', keeping '{}': {}", sidecar.parent_path().string(), sidecar.string(),
            entries_res.error().message()
        );
        return false;
    }

    std::string stem = sidecar.stem().string();
    while (!stem.empty()) {
        if (HasMediaWithStem(*entries_res, stem)) {
            return false;
        }
        const auto dot = stem.rfind('.');
        if (dot == std::string::npos || dot == 0) {
            break;
        }
        stem.erase(dot);
    }
    return true;
}

std::uint64_t OrphanReconciler::Reconcile(const std::vector<fs::path>& library_roots)
{
    if (library_roots.empty()) {
        spdlog::debug("No library roots configured, skipping orphan reconciliation");
        return 0;
    }

    std::uint64_t relocated = 0;
    for (const auto& root : library_roots) {
        if (!cache_.Contains(root)) {
            spdlog::warn("Library root '{}' is not on the cache tier, skipping", root.string());
            continue;
        }
        auto files_res = cache_.ListFilesRecursive(root);
        if (!files_res) {
            if (files_res.error() == StorageErrc::FileNotFound) {
                spdlog::debug("Library root '{}' does not exist on cache", root.string());
            } else {
                spdlog::warn(
                    "Cannot scan library root '{}': {}", root.string(),
                    files_res.error().message()
                );
            }
            continue;
        }

        for (const auto& file : *files_res) {
            if (!sidecars_.IsSidecar(file) || !IsOrphan(file)) {
                continue;
            }
            auto array_res = translator_.ToArray(file);
            if (!array_res) {
                spdlog::warn("Orphan '{}' has no array equivalent", file.string());
                continue;
            }
            spdlog::info("[orphan] {} -> {}", file.string(), array_res->string());

            CandidateItem item{file.string(), file, *array_res, 0};
            const auto result = mover_.Execute(item);
            if (result.outcome == TransferOutcome::Moved) {
                ++relocated;
            } else if (result.outcome == TransferOutcome::Failed) {
                spdlog::warn(
                    "[orphan] Could not relocate '{}': {}", file.string(), result.error.message()
                );
            }
        }
    }
    spdlog::info("Orphan reconciliation complete: {} sidecar(s) relocated to array", relocated);
    return relocated;
}

}  // namespace WarmCache::Transfer
