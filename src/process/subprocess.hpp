#ifndef WARMCACHE_SRC_PROCESS_SUBPROCESS_HPP_
#define WARMCACHE_SRC_PROCESS_SUBPROCESS_HPP_

#include "storage/storage_error.hpp"

#include <string>
#include <vector>

namespace WarmCache::Process
{

struct CommandResult {
    int exit_code = -1;  ///< Exit status, or 128 + signal number when killed
    std::string output;  ///< Captured stdout (and stderr when merged)

    bool Succeeded() const { return exit_code == 0; }
};

struct CommandOptions {
    bool merge_stderr = false;  ///< Capture stderr together with stdout
};

/// Runs argv[0] (looked up in PATH) with the given arguments, blocking until it exits.
/// Fails with StorageErrc::ToolNotFound when the program cannot be executed.
Storage::StorageResult<CommandResult> RunCommand(
    const std::vector<std::string>& argv, const CommandOptions& options = {}
);

/// Runs a command line through /bin/sh -c.
Storage::StorageResult<CommandResult> RunShellCommand(
    const std::string& command_line, const CommandOptions& options = {}
);

}  // namespace WarmCache::Process

#endif  // WARMCACHE_SRC_PROCESS_SUBPROCESS_HPP_
