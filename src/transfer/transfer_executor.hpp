#ifndef WARMCACHE_SRC_TRANSFER_TRANSFER_EXECUTOR_HPP_
#define WARMCACHE_SRC_TRANSFER_TRANSFER_EXECUTOR_HPP_

#include "candidates/exclusion_check.hpp"
#include "copy/i_copier.hpp"
#include "storage/i_storage.hpp"
#include "transfer/sidecar_resolver.hpp"
#include "transfer/transfer_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace WarmCache::Transfer
{

/// Behaviour of one transfer phase (warm or demote)
struct PhaseOptions {
    std::string name = "warm";  ///< Log label
    bool move        = true;    ///< Delete the source after a verified copy
    bool sidecars    = true;    ///< Carry companion files along
    bool dry_run     = false;
};

struct TransferResult {
    TransferOutcome outcome           = TransferOutcome::Failed;
    std::uint64_t bytes               = 0;
    std::uint64_t sidecars_transferred = 0;
    std::uint64_t sidecars_failed      = 0;
    std::error_code error;
};

enum class TransferState : std::uint8_t {
    Pending,
    Copying,
    Verifying,
    DeletingSource,
    Keeping,
    Done,
    Failed,
};

const char* TransferStateToString(TransferState state);

/**
 * @brief Copy, verify and optionally delete the source, one item at a time.
 *
 * Pending -> Copying -> Verifying -> {DeletingSource | Keeping} -> Done, or
 * Failed. A size mismatch after the copy triggers exactly one checksum copy
 * before the item fails. The source is only deleted after a passed verify,
 * with move semantics enabled and outside a dry run.
 *
 * Sidecars follow the same copy semantics but never fail their media item.
 */
class TransferExecutor
{
    public:
    TransferExecutor(
        Storage::IStorage& source_tier, Storage::IStorage& destination_tier, Copy::ICopier& copier,
        const SidecarResolver& sidecars, Storage::DirectoryOwnership ownership,
        PhaseOptions options, const Candidates::IExclusionCheck* exclusion = nullptr
    );

    TransferExecutor(const TransferExecutor&)            = delete;
    TransferExecutor& operator=(const TransferExecutor&) = delete;

    /// Checks that resolve an item without copying. Returns the skip outcome, or
    /// nullopt when the item has to be transferred.
    std::optional<TransferOutcome> Precheck(const CandidateItem& item) const;

    TransferResult Execute(const CandidateItem& item);

    const PhaseOptions& GetOptions() const { return options_; }

    private:
    struct FileTransfer {
        std::uint64_t bytes  = 0;
        bool source_deleted = false;
    };

    Storage::StorageResult<FileTransfer> TransferFile(const fs::path& src, const fs::path& dst);
    Storage::StorageResult<void> Verify(const fs::path& src, const fs::path& dst) const;
    bool MatchesQuickCheck(const fs::path& src, const fs::path& dst) const;
    void TransferSidecars(const CandidateItem& item, TransferResult& result);
    void TidySourceDirectory(const fs::path& dir);
    void SetState(const fs::path& path, TransferState next);

    Storage::IStorage& source_;
    Storage::IStorage& destination_;
    Copy::ICopier& copier_;
    const SidecarResolver& sidecars_;
    Storage::DirectoryOwnership ownership_;
    PhaseOptions options_;
    const Candidates::IExclusionCheck* exclusion_;
    TransferState state_ = TransferState::Pending;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_TRANSFER_EXECUTOR_HPP_
