#ifndef WARMCACHE_SRC_TRANSFER_TRANSFER_TYPES_HPP_
#define WARMCACHE_SRC_TRANSFER_TRANSFER_TYPES_HPP_

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace WarmCache::Transfer
{

namespace fs = std::filesystem;

//------------------------------------------------------------------------------//
// Candidates and Plans
//------------------------------------------------------------------------------//

/// One resolved candidate. Immutable once resolved.
struct CandidateItem {
    std::string foreign_path;   ///< As emitted by the candidate source
    fs::path source_path;       ///< Host path on the source tier
    fs::path destination_path;  ///< Host path on the destination tier
    std::uint64_t size_bytes = 0;
};

/// Space allowance for one run. Sampled once, never revised mid-run.
struct TransferBudget {
    std::uint64_t free_bytes     = 0;
    std::uint64_t reserve_bytes  = 0;
    std::uint64_t min_free_bytes = 0;
    std::int64_t allowed_bytes   = 0;  ///< free - reserve - min_free, may be negative

    static TransferBudget Compute(
        std::uint64_t free_bytes, std::uint64_t reserve_bytes, std::uint64_t min_free_bytes
    );
};

/// Accepted items in candidate order plus the ones trimmed away.
struct TransferPlan {
    std::vector<CandidateItem> accepted;
    std::vector<CandidateItem> rejected;
    std::uint64_t accepted_bytes  = 0;
    std::uint64_t requested_bytes = 0;

    bool WasTrimmed() const { return !rejected.empty(); }
};

enum class PlanAbortReason : std::uint8_t {
    InsufficientSpace,   ///< Allowance is not positive before any transfer
    ExceedsAllowance,    ///< Candidates do not fit and trimming is disabled
};

struct PlanAbort {
    PlanAbortReason reason;
    TransferBudget budget;
    std::uint64_t requested_bytes = 0;
};

const char* PlanAbortReasonToString(PlanAbortReason reason);

//------------------------------------------------------------------------------//
// Outcomes and Summaries
//------------------------------------------------------------------------------//

enum class TransferOutcome : std::uint8_t {
    Copied,
    Moved,  ///< Copied, verified, source deleted
    SkippedAlreadyPresent,
    SkippedOutOfBudget,
    SkippedExcluded,
    SkippedMissing,
    Failed,
};

const char* TransferOutcomeToString(TransferOutcome outcome);
bool IsSkip(TransferOutcome outcome);

/// Counters for one phase
struct PhaseSummary {
    std::uint64_t copied                  = 0;  ///< Copied and kept at the source
    std::uint64_t moved                   = 0;
    std::uint64_t skipped_already_present = 0;
    std::uint64_t skipped_out_of_budget   = 0;
    std::uint64_t skipped_excluded        = 0;
    std::uint64_t skipped_missing         = 0;
    std::uint64_t dropped_unmapped        = 0;  ///< Untranslatable or outside the source root
    std::uint64_t failed                  = 0;
    std::uint64_t bytes_transferred       = 0;
    std::uint64_t sidecars_transferred    = 0;
    std::uint64_t sidecars_failed         = 0;

    void Record(TransferOutcome outcome, std::uint64_t bytes = 0);

    std::uint64_t GetTransferred() const { return copied + moved; }
    std::uint64_t GetSkipped() const
    {
        return skipped_already_present + skipped_out_of_budget + skipped_excluded +
               skipped_missing + dropped_unmapped;
    }
};

struct RunSummary {
    PhaseSummary warm;
    std::optional<PhaseSummary> demote;
    std::uint64_t orphans_relocated = 0;
    bool dry_run                    = false;
    bool aborted                    = false;
    std::optional<std::string> abort_reason;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_TRANSFER_TYPES_HPP_
