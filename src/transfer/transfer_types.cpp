#include "transfer/transfer_types.hpp"

#include <initializer_list>
#include <limits>

namespace WarmCache::Transfer
{

namespace
{
std::int64_t ClampToSigned(std::uint64_t value)
{
    constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    return static_cast<std::int64_t>(value > kMax ? kMax : value);
}
}  // namespace

TransferBudget TransferBudget::Compute(
    std::uint64_t free_bytes, std::uint64_t reserve_bytes, std::uint64_t min_free_bytes
)
{
    TransferBudget budget;
    budget.free_bytes     = free_bytes;
    budget.reserve_bytes  = reserve_bytes;
    budget.min_free_bytes = min_free_bytes;

    // Saturating subtraction; sizes beyond int64 only occur with absurd configuration
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    std::int64_t allowed = ClampToSigned(free_bytes);
    for (const std::uint64_t deduction : {reserve_bytes, min_free_bytes}) {
        const std::int64_t d = ClampToSigned(deduction);
        allowed              = allowed < kMin + d ? kMin : allowed - d;
    }
    budget.allowed_bytes = allowed;
    return budget;
}

const char* PlanAbortReasonToString(PlanAbortReason reason)
{
    switch (reason) {
        case PlanAbortReason::InsufficientSpace:
            return "insufficient space before any transfer";
        case PlanAbortReason::ExceedsAllowance:
            return "plan exceeds cache allowance";
        default:
            return "unknown";
    }
}

const char* TransferOutcomeToString(TransferOutcome outcome)
{
    switch (outcome) {
        case TransferOutcome::Copied:
            return "Copied";
        case TransferOutcome::Moved:
            return "Moved";
        case TransferOutcome::SkippedAlreadyPresent:
            return "SkippedAlreadyPresent";
        case TransferOutcome::SkippedOutOfBudget:
            return "SkippedOutOfBudget";
        case TransferOutcome::SkippedExcluded:
            return "SkippedExcluded";
        case TransferOutcome::SkippedMissing:
            return "SkippedMissing";
        case TransferOutcome::Failed:
            return "Failed";
        default:
            return "Unknown";
    }
}

bool IsSkip(TransferOutcome outcome)
{
    switch (outcome) {
        case TransferOutcome::SkippedAlreadyPresent:
        case TransferOutcome::SkippedOutOfBudget:
        case TransferOutcome::SkippedExcluded:
        case TransferOutcome::SkippedMissing:
            return true;
        default:
            return false;
    }
}

void PhaseSummary::Record(TransferOutcome outcome, std::uint64_t bytes)
{
    switch (outcome) {
        case TransferOutcome::Copied:
            ++copied;
            bytes_transferred += bytes;
            break;
        case TransferOutcome::Moved:
            ++moved;
            bytes_transferred += bytes;
            break;
        case TransferOutcome::SkippedAlreadyPresent:
            ++skipped_already_present;
            break;
        case TransferOutcome::SkippedOutOfBudget:
            ++skipped_out_of_budget;
            break;
        case TransferOutcome::SkippedExcluded:
            ++skipped_excluded;
            break;
        case TransferOutcome::SkippedMissing:
            ++skipped_missing;
            break;
        case TransferOutcome::Failed:
            ++failed;
            break;
    }
}

}  // namespace WarmCache::Transfer
