#include "transfer/space_budget_planner.hpp"

#include "util/byte_format.hpp"

#include <spdlog/spdlog.h>

namespace WarmCache::Transfer
{

using Util::FormatBytes;

PlanResult SpaceBudgetPlanner::Plan(
    const std::vector<CandidateItem>& candidates, const TransferBudget& budget,
    bool trim_on_overflow
) const
{
    std::uint64_t requested = 0;
    for (const auto& item : candidates) {
        requested += item.size_bytes;
    }

    spdlog::info(
        "Cache free={} need={} allow-after-reserve={} (reserve={}, min_free={})",
        FormatBytes(budget.free_bytes), FormatBytes(requested), FormatBytes(budget.allowed_bytes),
        FormatBytes(budget.reserve_bytes), FormatBytes(budget.min_free_bytes)
    );

    if (budget.allowed_bytes <= 0) {
        spdlog::warn("Not enough free space even before copying, aborting");
        return std::unexpected(
            PlanAbort{PlanAbortReason::InsufficientSpace, budget, requested}
        );
    }
    const auto allowed = static_cast<std::uint64_t>(budget.allowed_bytes);

    TransferPlan plan;
    plan.requested_bytes = requested;
    for (const auto& item : candidates) {
        // Subtraction form avoids overflow on the running total
        if (item.size_bytes <= allowed - plan.accepted_bytes) {
            plan.accepted_bytes += item.size_bytes;
            plan.accepted.push_back(item);
            continue;
        }
        if (!trim_on_overflow) {
            spdlog::warn(
                "Plan exceeds cache allowance ({} > {}) and trimming is disabled, aborting",
                FormatBytes(requested), FormatBytes(allowed)
            );
            return std::unexpected(PlanAbort{PlanAbortReason::ExceedsAllowance, budget, requested});
        }
        spdlog::info(
            "[skip] out of space for: {} ({})", item.source_path.string(),
            FormatBytes(item.size_bytes)
        );
        plan.rejected.push_back(item);
    }

    spdlog::info(
        "Will transfer {} item(s), total {} ({} trimmed)", plan.accepted.size(),
        FormatBytes(plan.accepted_bytes), plan.rejected.size()
    );
    return plan;
}

}  // namespace WarmCache::Transfer
