#include "transfer/transfer_executor.hpp"

#include "util/byte_format.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace WarmCache::Transfer
{

using Storage::StorageErrc;
using Util::FormatBytes;

const char* TransferStateToString(TransferState state)
{
    switch (state) {
        case TransferState::Pending:
            return "Pending";
        case TransferState::Copying:
            return "Copying";
        case TransferState::Verifying:
            return "Verifying";
        case TransferState::DeletingSource:
            return "DeletingSource";
        case TransferState::Keeping:
            return "Keeping";
        case TransferState::Done:
            return "Done";
        case TransferState::Failed:
            return "Failed";
        default:
            return "Unknown";
    }
}

TransferExecutor::TransferExecutor(
    Storage::IStorage& source_tier, Storage::IStorage& destination_tier, Copy::ICopier& copier,
    const SidecarResolver& sidecars, Storage::DirectoryOwnership ownership, PhaseOptions options,
    const Candidates::IExclusionCheck* exclusion
)
    : source_(source_tier),
      destination_(destination_tier),
      copier_(copier),
      sidecars_(sidecars),
      ownership_(ownership),
      options_(std::move(options)),
      exclusion_(exclusion)
{
}

void TransferExecutor::SetState(const fs::path& path, TransferState next)
{
    spdlog::trace(
        "[{}] {}: {} -> {}", options_.name, path.string(), TransferStateToString(state_),
        TransferStateToString(next)
    );
    state_ = next;
}

//------------------------------------------------------------------------------//
// Pre-condition Checks
//------------------------------------------------------------------------------//

std::optional<TransferOutcome> TransferExecutor::Precheck(const CandidateItem& item) const
{
    auto src_exists = source_.CheckIfFileExists(item.source_path);
    if (!src_exists || !*src_exists) {
        auto dst_exists = destination_.CheckIfFileExists(item.destination_path);
        if (dst_exists && *dst_exists) {
            spdlog::info(
                "[{}] [skip] already present: {}", options_.name, item.destination_path.string()
            );
            return TransferOutcome::SkippedAlreadyPresent;
        }
        spdlog::warn("[{}] [skip] missing source: {}", options_.name, item.source_path.string());
        return TransferOutcome::SkippedMissing;
    }

    if (exclusion_ != nullptr && exclusion_->IsInUse(item.source_path)) {
        spdlog::info("[{}] [skip] in use: {}", options_.name, item.source_path.string());
        return TransferOutcome::SkippedExcluded;
    }

    if (!options_.move && MatchesQuickCheck(item.source_path, item.destination_path)) {
        spdlog::info(
            "[{}] [skip] already present (size and mtime match): {}", options_.name,
            item.destination_path.string()
        );
        return TransferOutcome::SkippedAlreadyPresent;
    }
    return std::nullopt;
}

bool TransferExecutor::MatchesQuickCheck(const fs::path& src, const fs::path& dst) const
{
    auto dst_attr = destination_.GetAttributes(dst);
    if (!dst_attr) {
        return false;
    }
    auto src_attr = source_.GetAttributes(src);
    if (!src_attr) {
        return false;
    }
    return src_attr->st_size == dst_attr->st_size &&
           src_attr->st_mtim.tv_sec == dst_attr->st_mtim.tv_sec;
}

//------------------------------------------------------------------------------//
// Transfer State Machine
//------------------------------------------------------------------------------//

TransferResult TransferExecutor::Execute(const CandidateItem& item)
{
    TransferResult result;
    state_ = TransferState::Pending;

    if (auto skip = Precheck(item)) {
        result.outcome = *skip;
        return result;
    }

    auto file_res = TransferFile(item.source_path, item.destination_path);
    if (!file_res) {
        SetState(item.source_path, TransferState::Failed);
        spdlog::error(
            "[{}] FAILED {} -> {}: {} (source kept)", options_.name, item.source_path.string(),
            item.destination_path.string(), file_res.error().message()
        );
        result.outcome = TransferOutcome::Failed;
        result.error   = file_res.error();
        return result;
    }
    SetState(item.source_path, TransferState::Done);

    result.bytes = file_res->bytes;
    if (options_.dry_run) {
        result.outcome = options_.move ? TransferOutcome::Moved : TransferOutcome::Copied;
    } else {
        result.outcome =
            file_res->source_deleted ? TransferOutcome::Moved : TransferOutcome::Copied;
    }
    spdlog::info(
        "[{}] {}{}: {} -> {} ({})", options_.name, options_.dry_run ? "[dry-run] " : "",
        TransferOutcomeToString(result.outcome), item.source_path.string(),
        item.destination_path.string(), FormatBytes(result.bytes)
    );

    if (options_.sidecars) {
        TransferSidecars(item, result);
    }
    if (file_res->source_deleted) {
        TidySourceDirectory(item.source_path.parent_path());
    }
    return result;
}

Storage::StorageResult<TransferExecutor::FileTransfer> TransferExecutor::TransferFile(
    const fs::path& src, const fs::path& dst
)
{
    // Directories are created in dry runs too so the copy tool can resolve the target
    if (auto mk_res = destination_.CreateDirectories(dst.parent_path(), ownership_); !mk_res) {
        spdlog::error(
            "[{}] Cannot create destination directory '{}': {}", options_.name,
            dst.parent_path().string(), mk_res.error().message()
        );
        return std::unexpected(mk_res.error());
    }

    SetState(src, TransferState::Copying);
    auto copy_res = copier_.Copy(src, dst, {.checksum = false, .dry_run = options_.dry_run});
    if (!copy_res) {
        return std::unexpected(copy_res.error());
    }
    if (options_.dry_run) {
        return FileTransfer{*copy_res, false};
    }

    SetState(src, TransferState::Verifying);
    auto verify_res = Verify(src, dst);
    if (!verify_res) {
        if (verify_res.error() != StorageErrc::VerifyMismatch) {
            return std::unexpected(verify_res.error());
        }
        spdlog::warn("[{}] Size mismatch for '{}', retrying with checksum", options_.name, dst.string());
        auto retry_res = copier_.Copy(src, dst, {.checksum = true, .dry_run = false});
        if (!retry_res) {
            return std::unexpected(retry_res.error());
        }
        verify_res = Verify(src, dst);
        if (!verify_res) {
            spdlog::error(
                "[{}] Verify failed after checksum retry for '{}'", options_.name, dst.string()
            );
            return std::unexpected(verify_res.error());
        }
    }
    spdlog::debug("[{}] Verified '{}'", options_.name, dst.string());

    if (!options_.move) {
        SetState(src, TransferState::Keeping);
        return FileTransfer{*copy_res, false};
    }

    SetState(src, TransferState::DeletingSource);
    if (auto rm_res = source_.Remove(src); !rm_res) {
        spdlog::error(
            "[{}] Copied and verified, but could not delete source '{}': {}", options_.name,
            src.string(), rm_res.error().message()
        );
        return FileTransfer{*copy_res, false};
    }
    return FileTransfer{*copy_res, true};
}

Storage::StorageResult<void> TransferExecutor::Verify(const fs::path& src, const fs::path& dst) const
{
    auto src_size = source_.GetFileSize(src);
    if (!src_size) {
        return std::unexpected(src_size.error());
    }
    auto dst_size = destination_.GetFileSize(dst);
    if (!dst_size) {
        if (dst_size.error() == StorageErrc::FileNotFound) {
            spdlog::warn("[{}] Destination '{}' missing after copy", options_.name, dst.string());
            return std::unexpected(Storage::make_error_code(StorageErrc::VerifyMismatch));
        }
        return std::unexpected(dst_size.error());
    }
    if (*src_size != *dst_size) {
        spdlog::warn(
            "[{}] Size mismatch: '{}' is {} bytes, '{}' is {} bytes", options_.name, src.string(),
            *src_size, dst.string(), *dst_size
        );
        return std::unexpected(Storage::make_error_code(StorageErrc::VerifyMismatch));
    }
    return {};
}

//------------------------------------------------------------------------------//
// Sidecars and Cleanup
//------------------------------------------------------------------------------//

void TransferExecutor::TransferSidecars(const CandidateItem& item, TransferResult& result)
{
    const auto dst_dir = item.destination_path.parent_path();
    for (const auto& sidecar : sidecars_.Resolve(source_, item.source_path)) {
        const auto sidecar_dst = dst_dir / sidecar.filename();
        auto res               = TransferFile(sidecar, sidecar_dst);
        if (!res) {
            ++result.sidecars_failed;
            spdlog::warn(
                "[{}] Sidecar '{}' not transferred: {}", options_.name, sidecar.string(),
                res.error().message()
            );
            continue;
        }
        ++result.sidecars_transferred;
        spdlog::info("[{}] Sidecar {} -> {}", options_.name, sidecar.string(), sidecar_dst.string());
    }
}

void TransferExecutor::TidySourceDirectory(const fs::path& dir)
{
    auto rm_res = source_.RemoveDirectoryIfEmpty(dir);
    if (!rm_res) {
        spdlog::debug(
            "[{}] Could not remove directory '{}': {}", options_.name, dir.string(),
            rm_res.error().message()
        );
        return;
    }
    if (*rm_res) {
        spdlog::debug("[{}] Removed empty directory '{}'", options_.name, dir.string());
    }
}

}  // namespace WarmCache::Transfer
