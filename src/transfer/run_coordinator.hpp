#ifndef WARMCACHE_SRC_TRANSFER_RUN_COORDINATOR_HPP_
#define WARMCACHE_SRC_TRANSFER_RUN_COORDINATOR_HPP_

#include "candidates/candidate_source.hpp"
#include "candidates/exclusion_check.hpp"
#include "config/config_types.hpp"
#include "copy/i_copier.hpp"
#include "storage/i_storage.hpp"
#include "transfer/path_translator.hpp"
#include "transfer/sidecar_resolver.hpp"
#include "transfer/space_budget_planner.hpp"
#include "transfer/transfer_executor.hpp"
#include "transfer/transfer_types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace WarmCache::Transfer
{

/**
 * @brief Runs one warm pass and, if enabled, one demote pass.
 *
 * candidates -> translate -> filter -> plan under budget -> warm transfers
 * -> demote transfers -> orphan reconciliation -> summary.
 *
 * Single-threaded. Assumes no other run is active; the caller holds the run lock.
 */
class RunCoordinator
{
    public:
    /// Throws std::invalid_argument when the roots are not distinct absolute paths.
    RunCoordinator(
        const Config::NodeConfig& config, Storage::IStorage& array_tier,
        Storage::IStorage& cache_tier, Copy::ICopier& copier
    );

    RunCoordinator(const RunCoordinator&)            = delete;
    RunCoordinator& operator=(const RunCoordinator&) = delete;

    void SetWarmSource(std::unique_ptr<Candidates::ICandidateSource> source);
    void SetDemoteSource(std::unique_ptr<Candidates::ICandidateSource> source);
    void SetInUseSource(std::unique_ptr<Candidates::ICandidateSource> source);

    RunSummary Run();

    /// Process exit status for a finished run
    static int ExitCodeFor(const RunSummary& summary);
    static void LogSummary(const RunSummary& summary);

    const PathTranslator& GetTranslator() const { return translator_; }

    private:
    std::vector<CandidateItem> ResolveWarmCandidates(
        const std::vector<std::string>& raw, const TransferExecutor& executor,
        PhaseSummary& phase
    ) const;
    std::vector<CandidateItem> ResolveDemoteCandidates(
        const std::vector<std::string>& raw, PhaseSummary& phase
    ) const;

    /// Returns false when the run has to be aborted.
    bool RunWarmPhase(RunSummary& summary);
    void RunDemotePhase(RunSummary& summary);

    static void RecordResult(PhaseSummary& phase, const TransferResult& result);

    const Config::NodeConfig& config_;
    Storage::IStorage& array_;
    Storage::IStorage& cache_;
    Copy::ICopier& copier_;

    PathTranslator translator_;
    SidecarResolver sidecars_;
    SpaceBudgetPlanner planner_;
    Storage::DirectoryOwnership ownership_;

    std::unique_ptr<Candidates::ICandidateSource> warm_source_;
    std::unique_ptr<Candidates::ICandidateSource> demote_source_;
    std::unique_ptr<Candidates::ICandidateSource> in_use_source_;
    std::unique_ptr<Candidates::IExclusionCheck> exclusion_;
};

}  // namespace WarmCache::Transfer

#endif  // WARMCACHE_SRC_TRANSFER_RUN_COORDINATOR_HPP_
