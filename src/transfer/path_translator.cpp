#include "transfer/path_translator.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace WarmCache::Transfer
{

using Storage::StorageErrc;

namespace
{

std::string_view StripTrailingSlashes(std::string_view s)
{
    while (s.size() > 1 && s.back() == '/') {
        s.remove_suffix(1);
    }
    return s;
}

fs::path NormalizeRoot(const fs::path& root)
{
    auto normal = root.lexically_normal();
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

}  // namespace

PathTranslator::PathTranslator(
    fs::path array_root, fs::path cache_root, std::vector<Config::PathMapRule> rules,
    std::optional<fs::path> share_root
)
    : array_root_(NormalizeRoot(array_root)),
      cache_root_(NormalizeRoot(cache_root)),
      rules_(std::move(rules))
{
    if (!array_root_.is_absolute() || !cache_root_.is_absolute()) {
        throw std::invalid_argument("Array and cache roots must be absolute paths.");
    }
    if (array_root_ == cache_root_ || array_root_ == array_root_.root_path() ||
        cache_root_ == cache_root_.root_path()) {
        throw std::invalid_argument(
            "Array root '" + array_root_.string() + "' and cache root '" + cache_root_.string() +
            "' must be distinct directories."
        );
    }
    if (share_root.has_value()) {
        share_root_ = NormalizeRoot(*share_root);
    }
}

std::optional<std::string> PathTranslator::Translate(
    std::string_view foreign_path, const std::vector<Config::PathMapRule>& rules
)
{
    for (const auto& rule : rules) {
        const auto prefix      = StripTrailingSlashes(rule.prefix);
        const auto replacement = StripTrailingSlashes(rule.replacement);
        if (prefix.empty() || prefix == "/" || !foreign_path.starts_with(prefix)) {
            continue;
        }
        const auto rest = foreign_path.substr(prefix.size());
        if (!rest.starts_with('/')) {
            continue;
        }
        std::string result(replacement);
        result.append(rest);
        return result;
    }
    return std::nullopt;
}

std::optional<fs::path> PathTranslator::Rebase(
    const fs::path& path, const fs::path& from_root, const fs::path& to_root
)
{
    const auto normal = path.lexically_normal();
    const auto rel    = normal.lexically_relative(from_root);
    if (rel.empty() || *rel.begin() == ".." || rel == ".") {
        return std::nullopt;
    }
    return to_root / rel;
}

Storage::StorageResult<fs::path> PathTranslator::ToHost(std::string_view foreign_path) const
{
    fs::path host;
    if (auto translated = Translate(foreign_path, rules_)) {
        host = fs::path(*translated).lexically_normal();
        spdlog::trace("Translated '{}' -> '{}'", foreign_path, host.string());
    } else {
        host = fs::path(foreign_path).lexically_normal();
        const bool under_known_root =
            host.is_absolute() && (IsUnderArray(host) || IsUnderCache(host) ||
                                   (share_root_ && Rebase(host, *share_root_, *share_root_)));
        if (!under_known_root) {
            return std::unexpected(Storage::make_error_code(StorageErrc::TranslationFailed));
        }
    }

    if (share_root_.has_value() && !IsUnderArray(host) && !IsUnderCache(host)) {
        if (auto normalized = Rebase(host, *share_root_, array_root_)) {
            spdlog::trace("Normalised share path '{}' -> '{}'", host.string(), normalized->string());
            return *normalized;
        }
    }
    return host;
}

Storage::StorageResult<fs::path> PathTranslator::ToCache(const fs::path& array_path) const
{
    if (auto rebased = Rebase(array_path, array_root_, cache_root_)) {
        return *rebased;
    }
    return std::unexpected(Storage::make_error_code(StorageErrc::InvalidPath));
}

Storage::StorageResult<fs::path> PathTranslator::ToArray(const fs::path& cache_path) const
{
    if (auto rebased = Rebase(cache_path, cache_root_, array_root_)) {
        return *rebased;
    }
    return std::unexpected(Storage::make_error_code(StorageErrc::InvalidPath));
}

bool PathTranslator::IsUnderArray(const fs::path& path) const
{
    return Rebase(path, array_root_, array_root_).has_value();
}

bool PathTranslator::IsUnderCache(const fs::path& path) const
{
    return Rebase(path, cache_root_, cache_root_).has_value();
}

}  // namespace WarmCache::Transfer
