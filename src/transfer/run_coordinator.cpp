#include "transfer/run_coordinator.hpp"

#include "app_constants.hpp"
#include "candidates/candidate_set.hpp"
#include "transfer/orphan_reconciler.hpp"
#include "util/byte_format.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace WarmCache::Transfer
{

using Util::FormatBytes;

RunCoordinator::RunCoordinator(
    const Config::NodeConfig& config, Storage::IStorage& array_tier, Storage::IStorage& cache_tier,
    Copy::ICopier& copier
)
    : config_(config),
      array_(array_tier),
      cache_(cache_tier),
      copier_(copier),
      translator_(config.array_root, config.cache_root, config.path_map, config.share_root),
      sidecars_(config.sidecar_extensions),
      ownership_{config.ownership.dir_mode, config.ownership.uid, config.ownership.gid}
{
}

void RunCoordinator::SetWarmSource(std::unique_ptr<Candidates::ICandidateSource> source)
{
    warm_source_ = std::move(source);
}

void RunCoordinator::SetDemoteSource(std::unique_ptr<Candidates::ICandidateSource> source)
{
    demote_source_ = std::move(source);
}

void RunCoordinator::SetInUseSource(std::unique_ptr<Candidates::ICandidateSource> source)
{
    in_use_source_ = std::move(source);
}

//------------------------------------------------------------------------------//
// Run Sequencing
//------------------------------------------------------------------------------//

RunSummary RunCoordinator::Run()
{
    RunSummary summary;
    summary.dry_run = config_.dry_run;

    spdlog::info(
        "Run start: dry_run={} warm_move={} array={} cache={}", config_.dry_run, config_.warm.move,
        config_.array_root.string(), config_.cache_root.string()
    );

    exclusion_.reset();
    if (in_use_source_) {
        exclusion_ = std::make_unique<Candidates::PathSetExclusionCheck>(
            in_use_source_->Fetch(), translator_
        );
    }

    if (!RunWarmPhase(summary)) {
        LogSummary(summary);
        spdlog::info("Run end (aborted)");
        return summary;
    }

    if (config_.demote.enabled) {
        RunDemotePhase(summary);
    }

    LogSummary(summary);
    spdlog::info("Run end");
    return summary;
}

int RunCoordinator::ExitCodeFor(const RunSummary& summary)
{
    return summary.aborted ? Constants::EXIT_ABORTED : Constants::EXIT_RAN;
}

void RunCoordinator::RecordResult(PhaseSummary& phase, const TransferResult& result)
{
    phase.Record(result.outcome, result.bytes);
    phase.sidecars_transferred += result.sidecars_transferred;
    phase.sidecars_failed += result.sidecars_failed;
}

//------------------------------------------------------------------------------//
// Warm Phase
//------------------------------------------------------------------------------//

std::vector<CandidateItem> RunCoordinator::ResolveWarmCandidates(
    const std::vector<std::string>& raw, const TransferExecutor& executor, PhaseSummary& phase
) const
{
    Candidates::CandidateSet seen(config_.max_items);
    std::vector<CandidateItem> items;

    for (const auto& foreign : raw) {
        auto host_res = translator_.ToHost(foreign);
        if (!host_res) {
            spdlog::warn("[skip] no path mapping for: {}", foreign);
            ++phase.dropped_unmapped;
            continue;
        }
        const auto& host = *host_res;
        if (seen.IsFull()) {
            spdlog::info("Candidate cap of {} reached, ignoring the rest", config_.max_items);
            break;
        }
        if (!seen.Add(host.string())) {
            continue;
        }

        if (translator_.IsUnderCache(host)) {
            spdlog::info("[skip] already on cache: {}", host.string());
            phase.Record(TransferOutcome::SkippedAlreadyPresent);
            continue;
        }
        if (!translator_.IsUnderArray(host)) {
            spdlog::warn("[skip] not under array root: {}", host.string());
            ++phase.dropped_unmapped;
            continue;
        }

        CandidateItem item{foreign, host, *translator_.ToCache(host), 0};
        if (auto skip = executor.Precheck(item)) {
            phase.Record(*skip);
            continue;
        }

        auto size_res = array_.GetFileSize(host);
        if (!size_res) {
            spdlog::warn("[skip] cannot size '{}': {}", host.string(), size_res.error().message());
            phase.Record(TransferOutcome::SkippedMissing);
            continue;
        }
        item.size_bytes = *size_res;
        items.push_back(std::move(item));
    }
    if (seen.GetDuplicateCount() > 0) {
        spdlog::debug("Dropped {} duplicate candidate(s)", seen.GetDuplicateCount());
    }
    return items;
}

bool RunCoordinator::RunWarmPhase(RunSummary& summary)
{
    PhaseSummary& phase = summary.warm;
    const bool dry_run  = config_.dry_run;

    const auto* exclusion = config_.warm.skip_in_use ? exclusion_.get() : nullptr;
    TransferExecutor executor(
        array_, cache_, copier_, sidecars_, ownership_,
        PhaseOptions{"warm", config_.warm.move, config_.warm.sidecars, dry_run}, exclusion
    );

    std::vector<std::string> raw;
    if (warm_source_) {
        raw = warm_source_->Fetch();
        spdlog::info("{} warm candidate(s) from {}", raw.size(), warm_source_->Describe());
    } else {
        spdlog::info("No warm candidate source configured");
    }
    const auto candidates = ResolveWarmCandidates(raw, executor, phase);

    // Free space is sampled once here and not re-read between transfers
    auto free_res = cache_.GetAvailableBytes();
    if (!free_res) {
        spdlog::error(
            "Cannot read free space on '{}': {}", cache_.GetPath().string(),
            free_res.error().message()
        );
        summary.aborted      = true;
        summary.abort_reason = "cannot read cache free space";
        return false;
    }
    const auto budget = TransferBudget::Compute(
        *free_res, config_.budget.reserve_bytes, config_.budget.min_free_bytes
    );

    auto plan_res = planner_.Plan(candidates, budget, config_.budget.trim_plan);
    if (!plan_res) {
        summary.aborted      = true;
        summary.abort_reason = PlanAbortReasonToString(plan_res.error().reason);
        return false;
    }

    phase.skipped_out_of_budget += plan_res->rejected.size();
    for (const auto& item : plan_res->accepted) {
        RecordResult(phase, executor.Execute(item));
    }

    spdlog::info(
        "Warm/copy phase complete: {} copied ({} moved - source deleted after verify)",
        phase.GetTransferred(), phase.moved
    );
    return true;
}

//------------------------------------------------------------------------------//
// Demote Phase
//------------------------------------------------------------------------------//

std::vector<CandidateItem> RunCoordinator::ResolveDemoteCandidates(
    const std::vector<std::string>& raw, PhaseSummary& phase
) const
{
    Candidates::CandidateSet seen(config_.max_items);
    std::vector<CandidateItem> items;

    for (const auto& foreign : raw) {
        auto host_res = translator_.ToHost(foreign);
        if (!host_res) {
            spdlog::warn("[back] [skip] no path mapping for: {}", foreign);
            ++phase.dropped_unmapped;
            continue;
        }

        fs::path cache_src;
        if (translator_.IsUnderCache(*host_res)) {
            cache_src = *host_res;
        } else if (translator_.IsUnderArray(*host_res)) {
            cache_src = *translator_.ToCache(*host_res);
        } else {
            spdlog::warn("[back] [skip] not under cache or array root: {}", host_res->string());
            ++phase.dropped_unmapped;
            continue;
        }

        if (seen.IsFull()) {
            spdlog::info("Candidate cap of {} reached, ignoring the rest", config_.max_items);
            break;
        }
        if (!seen.Add(cache_src.string())) {
            continue;
        }
        items.push_back(CandidateItem{foreign, cache_src, *translator_.ToArray(cache_src), 0});
    }
    return items;
}

void RunCoordinator::RunDemotePhase(RunSummary& summary)
{
    spdlog::info("Move-back phase start");
    PhaseSummary& phase = summary.demote.emplace();

    TransferExecutor executor(
        cache_, array_, copier_, sidecars_, ownership_,
        PhaseOptions{"back", true, config_.demote.sidecars, config_.dry_run}, exclusion_.get()
    );

    std::vector<std::string> raw;
    if (demote_source_) {
        raw = demote_source_->Fetch();
        spdlog::info("{} demote candidate(s) from {}", raw.size(), demote_source_->Describe());
    } else {
        spdlog::info("No demote candidate source configured");
    }

    for (const auto& item : ResolveDemoteCandidates(raw, phase)) {
        RecordResult(phase, executor.Execute(item));
    }
    spdlog::info("Move-back phase complete: {} items moved back to array", phase.moved);

    TransferExecutor orphan_mover(
        cache_, array_, copier_, sidecars_, ownership_,
        PhaseOptions{"orphan", true, false, config_.dry_run}, exclusion_.get()
    );
    OrphanReconciler reconciler(
        cache_, translator_, sidecars_, config_.media_extensions, orphan_mover
    );
    summary.orphans_relocated = reconciler.Reconcile(config_.library_roots);
}

//------------------------------------------------------------------------------//
// Reporting
//------------------------------------------------------------------------------//

namespace
{
void LogPhase(const char* name, const PhaseSummary& phase)
{
    spdlog::info(
        "{} summary: copied={} moved={} skipped={} (present={}, out_of_budget={}, excluded={}, "
        "missing={}, unmapped={}) failed={} bytes={} sidecars={} sidecar_failures={}",
        name, phase.copied, phase.moved, phase.GetSkipped(), phase.skipped_already_present,
        phase.skipped_out_of_budget, phase.skipped_excluded, phase.skipped_missing,
        phase.dropped_unmapped, phase.failed, FormatBytes(phase.bytes_transferred),
        phase.sidecars_transferred, phase.sidecars_failed
    );
}
}  // namespace

void RunCoordinator::LogSummary(const RunSummary& summary)
{
    if (summary.dry_run) {
        spdlog::info("Dry run: no file was modified by the copy tool");
    }
    LogPhase("Warm", summary.warm);
    if (summary.demote.has_value()) {
        LogPhase("Demote", *summary.demote);
        spdlog::info("Orphaned sidecars relocated: {}", summary.orphans_relocated);
    }
    if (summary.aborted) {
        spdlog::warn("Run aborted: {}", summary.abort_reason.value_or("unknown reason"));
    }
}

}  // namespace WarmCache::Transfer
