#ifndef WARMCACHE_SRC_CANDIDATES_CANDIDATE_SOURCE_HPP_
#define WARMCACHE_SRC_CANDIDATES_CANDIDATE_SOURCE_HPP_

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace WarmCache::Candidates
{

namespace fs = std::filesystem;

/// Produces an ordered list of absolute paths, most relevant first.
/// A source that fails returns an empty list; it never aborts the run.
class ICandidateSource
{
    public:
    virtual ~ICandidateSource() = default;

    virtual std::vector<std::string> Fetch() = 0;
    virtual std::string Describe() const     = 0;
};

/// Splits raw list output into trimmed absolute paths. Blank lines are
/// skipped, anything that is not an absolute path is dropped with a warning.
std::vector<std::string> ParseCandidateLines(std::string_view text, std::string_view origin);

/// Runs a shell command and reads the list from its stdout.
class CommandCandidateSource : public ICandidateSource
{
    public:
    explicit CommandCandidateSource(std::string command);

    std::vector<std::string> Fetch() override;
    std::string Describe() const override;

    private:
    std::string command_;
};

/// Reads the list from a file.
class FileCandidateSource : public ICandidateSource
{
    public:
    explicit FileCandidateSource(fs::path path);

    std::vector<std::string> Fetch() override;
    std::string Describe() const override;

    private:
    fs::path path_;
};

/// A fixed list, used when the caller already holds the paths.
class StaticCandidateSource : public ICandidateSource
{
    public:
    explicit StaticCandidateSource(std::vector<std::string> paths) : paths_(std::move(paths)) {}

    std::vector<std::string> Fetch() override { return paths_; }
    std::string Describe() const override { return "static list"; }

    private:
    std::vector<std::string> paths_;
};

/// Builds a source from the command/list pair of one configuration slot.
/// The command takes precedence; returns nullptr when neither is set.
std::unique_ptr<ICandidateSource> MakeCandidateSource(
    const std::optional<std::string>& command, const std::optional<fs::path>& list_file
);

}  // namespace WarmCache::Candidates

#endif  // WARMCACHE_SRC_CANDIDATES_CANDIDATE_SOURCE_HPP_
