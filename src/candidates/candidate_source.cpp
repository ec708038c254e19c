#include "candidates/candidate_source.hpp"

#include "process/subprocess.hpp"

#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>
#include <utility>

namespace WarmCache::Candidates
{

std::vector<std::string> ParseCandidateLines(std::string_view text, std::string_view origin)
{
    std::vector<std::string> paths;
    std::size_t malformed = 0;
    while (!text.empty()) {
        auto eol             = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);

        const auto first = line.find_first_not_of(" \t\r");
        if (first == std::string_view::npos) {
            continue;
        }
        const auto last = line.find_last_not_of(" \t\r");
        line            = line.substr(first, last - first + 1);

        if (line.front() != '/') {
            spdlog::warn("Ignoring malformed candidate from {}: '{}'", origin, line);
            ++malformed;
            continue;
        }
        paths.emplace_back(line);
    }
    spdlog::debug(
        "Parsed {} candidate(s) from {} ({} malformed)", paths.size(), origin, malformed
    );
    return paths;
}

//------------------------------------------------------------------------------//
// CommandCandidateSource
//------------------------------------------------------------------------------//

CommandCandidateSource::CommandCandidateSource(std::string command) : command_(std::move(command))
{
}

std::string CommandCandidateSource::Describe() const { return "command '" + command_ + "'"; }

std::vector<std::string> CommandCandidateSource::Fetch()
{
    auto res = Process::RunShellCommand(command_);
    if (!res) {
        spdlog::warn(
            "Candidate {} could not be run: {}. Treating as empty.", Describe(),
            res.error().message()
        );
        return {};
    }
    if (!res->Succeeded()) {
        spdlog::warn(
            "Candidate {} exited with status {}. Treating as empty.", Describe(), res->exit_code
        );
        return {};
    }
    return ParseCandidateLines(res->output, Describe());
}

//------------------------------------------------------------------------------//
// FileCandidateSource
//------------------------------------------------------------------------------//

FileCandidateSource::FileCandidateSource(fs::path path) : path_(std::move(path)) {}

std::string FileCandidateSource::Describe() const { return "list file '" + path_.string() + "'"; }

std::vector<std::string> FileCandidateSource::Fetch()
{
    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::warn("Candidate {} could not be opened. Treating as empty.", Describe());
        return {};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        spdlog::warn("Candidate {} could not be read. Treating as empty.", Describe());
        return {};
    }
    return ParseCandidateLines(contents.str(), Describe());
}

std::unique_ptr<ICandidateSource> MakeCandidateSource(
    const std::optional<std::string>& command, const std::optional<fs::path>& list_file
)
{
    if (command.has_value() && !command->empty()) {
        return std::make_unique<CommandCandidateSource>(*command);
    }
    if (list_file.has_value() && !list_file->empty()) {
        return std::make_unique<FileCandidateSource>(*list_file);
    }
    return nullptr;
}

}  // namespace WarmCache::Candidates
