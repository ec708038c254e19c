#ifndef WARMCACHE_SRC_TRANSFER_ORPHAN_RECONCILER_HPP_
#define WARMCACHE_SRC_TRANSFER_ORPHAN_RECONCILER_HPP_

#include "storage/i_storage.hpp"
#include "transfer/path_translator.hpp"
#include "transfer/sidecar_resolver.hpp"
#include "transfer/transfer_executor.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace WarmCache::Transfer
{

/**
 * @brief Returns sidecars stranded on the cache tier to the array.
 *
 * A sidecar is stranded when no media file with the same stem sits next to
 * it. Stems are also tried with trailing dotted tags removed, so
 * "Film.en.srt" belongs to "Film.mkv". Media extensions match ignoring case
 * ("Film.MKV" counts). Relocation goes through the given
 * executor, which must move from the cache tier to the array tier.
 */
class OrphanReconciler
{
    public:
    OrphanReconciler(
        const Storage::IStorage& cache_tier, const PathTranslator& translator,
        const SidecarResolver& sidecars, std::vector<std::string> media_extensions,
        TransferExecutor& mover
    );

    /// Scans each library root and relocates orphans. Returns how many were relocated.
    std::uint64_t Reconcile(const std::vector<fs::path>& library_roots);

    bool IsOrphan(const fs::path& sidecar) const;

    private:
    bool HasMediaWithStem(const std::vector<fs::path>& entries, const std::string& stem) const;

    const Storage::IStorage& cache_;
    const PathTranslator& translator_;
    const SidecarResolver& sidecars_;
    std::vector<std::string> media_extensions_;
    TransferExecutor& mover_;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_ORPHAN_RECONCILER_HPP_
