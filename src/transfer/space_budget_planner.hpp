#ifndef WARMCACHE_SRC_TRANSFER_SPACE_BUDGET_PLANNER_HPP_
#define WARMCACHE_SRC_TRANSFER_SPACE_BUDGET_PLANNER_HPP_

#include "transfer/transfer_types.hpp"

#include <expected>
#include <vector>

namespace WarmCache::Transfer
{

using PlanResult = std::expected<TransferPlan, PlanAbort>;

/**
 * @brief Bounds a candidate list by the destination's space allowance.
 *
 * Greedy first-fit in candidate order: an item is accepted iff the running
 * total plus its size stays within the allowance. A rejected item is skipped,
 * never reordered, so a later smaller item may still be accepted after an
 * earlier larger one was refused. This is not a bin-packing optimum; the
 * caller's priority order always wins over space utilisation.
 *
 * The budget is a single snapshot taken before the first transfer and is not
 * re-sampled per item. Another writer on the same tier can make the real
 * remaining space diverge from the plan; the reserve absorbs that.
 */
class SpaceBudgetPlanner
{
    public:
    SpaceBudgetPlanner() = default;

    PlanResult Plan(
        const std::vector<CandidateItem>& candidates, const TransferBudget& budget,
        bool trim_on_overflow
    ) const;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_SPACE_BUDGET_PLANNER_HPP_
