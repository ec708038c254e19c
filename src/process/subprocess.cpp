#include "process/subprocess.hpp"

#include "storage/fd_guard.hpp"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <array>
#include <cerrno>
#include <cstring>

namespace WarmCache::Process
{

using Storage::FileDescriptorGuard;
using Storage::StorageErrc;

namespace
{

Storage::StorageResult<std::array<FileDescriptorGuard, 2>> MakePipe()
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        return std::unexpected(Storage::LastErrnoError());
    }
    return std::array<FileDescriptorGuard, 2>{FileDescriptorGuard(fds[0]), FileDescriptorGuard(fds[1])};
}

ssize_t ReadRetrying(int fd, char* buf, std::size_t len)
{
    ssize_t n;
    do {
        n = ::read(fd, buf, len);
    } while (n == -1 && errno == EINTR);
    return n;
}

}  // namespace

Storage::StorageResult<CommandResult> RunCommand(
    const std::vector<std::string>& argv, const CommandOptions& options
)
{
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(Storage::make_error_code(StorageErrc::InvalidPath));
    }

    auto out_pipe = MakePipe();
    if (!out_pipe) {
        return std::unexpected(out_pipe.error());
    }
    // Reports an exec failure back to the parent; closed on a successful exec
    auto err_pipe = MakePipe();
    if (!err_pipe) {
        return std::unexpected(err_pipe.error());
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    spdlog::trace("Spawning '{}' with {} argument(s)", argv.front(), argv.size() - 1);

    const pid_t pid = ::fork();
    if (pid == -1) {
        return std::unexpected(Storage::LastErrnoError());
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::dup2((*out_pipe)[1].get(), STDOUT_FILENO);
        if (options.merge_stderr) {
            ::dup2((*out_pipe)[1].get(), STDERR_FILENO);
        }
        ::execvp(c_argv[0], c_argv.data());
        const int exec_errno = errno;
        if (::write((*err_pipe)[1].get(), &exec_errno, sizeof(exec_errno)) == -1) {
            ::_exit(127);
        }
        ::_exit(127);
    }

    (*out_pipe)[1].reset();
    (*err_pipe)[1].reset();

    CommandResult result;
    std::array<char, 4096> buffer{};
    for (;;) {
        const ssize_t n = ReadRetrying((*out_pipe)[0].get(), buffer.data(), buffer.size());
        if (n <= 0) {
            break;
        }
        result.output.append(buffer.data(), static_cast<std::size_t>(n));
    }

    int exec_errno   = 0;
    const ssize_t en = ReadRetrying((*err_pipe)[0].get(), reinterpret_cast<char*>(&exec_errno),
                                    sizeof(exec_errno));

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return std::unexpected(Storage::LastErrnoError());
        }
    }

    if (en == static_cast<ssize_t>(sizeof(exec_errno))) {
        spdlog::error("Failed to execute '{}': {}", argv.front(), std::strerror(exec_errno));
        return std::unexpected(Storage::make_error_code(StorageErrc::ToolNotFound));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    spdlog::trace("'{}' exited with status {}", argv.front(), result.exit_code);
    return result;
}

Storage::StorageResult<CommandResult> RunShellCommand(
    const std::string& command_line, const CommandOptions& options
)
{
    return RunCommand({"/bin/sh", "-c", command_line}, options);
}

}  // namespace WarmCache::Process
