#include "copy/rsync_copier.hpp"

#include "process/subprocess.hpp"

#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <string_view>
#include <utility>

namespace WarmCache::Copy
{

using Storage::StorageErrc;

RsyncCopier::RsyncCopier(
    std::string rsync_path, CopierSettings settings, std::vector<std::string> extra_args
)
    : rsync_path_(std::move(rsync_path)),
      settings_(settings),
      extra_args_(std::move(extra_args))
{
}

std::vector<std::string> RsyncCopier::BuildArguments(
    const fs::path& src, const fs::path& dst, const CopyOptions& options
) const
{
    std::vector<std::string> args{rsync_path_};
    // Whole-file transfers: both tiers are local, delta encoding only costs CPU
    args.emplace_back(settings_.preserve_attributes ? "-ahvW" : "-rhvW");
    if (settings_.in_place) {
        args.emplace_back("--inplace");
        args.emplace_back("--partial");
    }
    args.emplace_back("--numeric-ids");
    if (settings_.preserve_attributes) {
        args.emplace_back("--xattrs");
        args.emplace_back("--acls");
    }
    if (settings_.owner_uid.has_value() || settings_.owner_gid.has_value()) {
        std::string chown = "--chown=";
        if (settings_.owner_uid) {
            chown += std::to_string(*settings_.owner_uid);
        }
        chown += ":";
        if (settings_.owner_gid) {
            chown += std::to_string(*settings_.owner_gid);
        }
        args.push_back(std::move(chown));
    }
    if (options.checksum) {
        args.emplace_back("--checksum");
    }
    if (options.dry_run) {
        args.emplace_back("--dry-run");
    }
    args.insert(args.end(), extra_args_.begin(), extra_args_.end());
    args.push_back(src.string());
    args.push_back(dst.string());
    return args;
}

Storage::StorageResult<std::uint64_t> RsyncCopier::Copy(
    const fs::path& src, const fs::path& dst, const CopyOptions& options
)
{
    struct stat src_stat{};
    if (::stat(src.c_str(), &src_stat) == -1) {
        return std::unexpected(Storage::LastErrnoError());
    }

    const auto args = BuildArguments(src, dst, options);
    std::string command_line;
    for (const auto& arg : args) {
        if (!command_line.empty()) {
            command_line += ' ';
        }
        command_line += arg;
    }
    spdlog::info("[rsync] {}", command_line);

    auto run_res = Process::RunCommand(args, {.merge_stderr = true});
    if (!run_res) {
        spdlog::error("rsync could not be started ({}): {}", rsync_path_, run_res.error().message());
        return std::unexpected(run_res.error());
    }

    std::string_view output = run_res->output;
    while (!output.empty()) {
        auto eol = output.find('\n');
        auto line = output.substr(0, eol);
        if (!line.empty()) {
            spdlog::debug("[rsync] {}", line);
        }
        if (eol == std::string_view::npos) {
            break;
        }
        output.remove_prefix(eol + 1);
    }

    if (!run_res->Succeeded()) {
        spdlog::error(
            "rsync exited with status {} copying '{}' -> '{}'", run_res->exit_code, src.string(),
            dst.string()
        );
        return std::unexpected(Storage::make_error_code(StorageErrc::CopyFailed));
    }
    return static_cast<std::uint64_t>(src_stat.st_size);
}

}  // namespace WarmCache::Copy
