#include "candidates/exclusion_check.hpp"

#include <spdlog/spdlog.h>

namespace WarmCache::Candidates
{

PathSetExclusionCheck::PathSetExclusionCheck(
    const std::vector<std::string>& in_use_paths, const Transfer::PathTranslator& translator
)
{
    for (const auto& raw : in_use_paths) {
        auto host_res = translator.ToHost(raw);
        if (!host_res) {
            spdlog::debug("In-use path '{}' could not be translated, ignoring", raw);
            continue;
        }
        const auto& host = *host_res;
        paths_.insert(host.string());
        if (translator.IsUnderArray(host)) {
            if (auto cache_res = translator.ToCache(host)) {
                paths_.insert(cache_res->string());
            }
        } else if (translator.IsUnderCache(host)) {
            if (auto array_res = translator.ToArray(host)) {
                paths_.insert(array_res->string());
            }
        }
    }
    spdlog::info("{} path(s) currently in use", in_use_paths.size());
}

bool PathSetExclusionCheck::IsInUse(const fs::path& host_path) const
{
    return paths_.contains(host_path.lexically_normal().string());
}

}  // namespace WarmCache::Candidates
