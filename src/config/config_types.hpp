#ifndef WARMCACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
#define WARMCACHE_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace WarmCache::Config
{

//------------------------------------------------------------------------------//
// Enumerations for Configuration Types
//------------------------------------------------------------------------------//

enum class CopyMethod : std::uint8_t { Rsync, Native };

std::optional<CopyMethod> StringToCopyMethod(const std::string &method_str);
const char *CopyMethodToString(CopyMethod method);

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

/// One ordered prefix substitution, e.g. "/data" -> "/mnt/user"
struct PathMapRule {
    std::string prefix;
    std::string replacement;
};

struct GlobalSettings {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::optional<std::filesystem::path> log_file;
    std::filesystem::path lock_file = std::string(Constants::DEFAULT_LOCK_FILE);
};

struct BudgetSettings {
    std::uint64_t reserve_bytes  = Constants::DEFAULT_RESERVE_BYTES;
    std::uint64_t min_free_bytes = Constants::DEFAULT_MIN_FREE_BYTES;
    bool trim_plan               = true;
};

struct WarmSettings {
    bool move        = true;
    bool sidecars    = true;
    bool skip_in_use = true;
};

struct DemoteSettings {
    bool enabled  = false;
    bool sidecars = true;
};

struct OwnershipSettings {
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;
    mode_t dir_mode = Constants::DEFAULT_DIRECTORY_MODE;
};

struct CopySettings {
    CopyMethod method = CopyMethod::Rsync;
    std::string rsync_path = std::string(Constants::DEFAULT_RSYNC_PATH);
    std::vector<std::string> extra_args;
};

/// Where candidate and in-use lists come from. Each list may be produced by a
/// shell command or read from a file; the command wins when both are set.
struct SourceSettings {
    std::optional<std::string> warm_command;
    std::optional<std::filesystem::path> warm_list;
    std::optional<std::string> demote_command;
    std::optional<std::filesystem::path> demote_list;
    std::optional<std::string> in_use_command;
    std::optional<std::filesystem::path> in_use_list;
};

struct NodeConfig {
    std::filesystem::path array_root;
    std::filesystem::path cache_root;
    std::optional<std::filesystem::path> share_root;
    std::vector<PathMapRule> path_map;

    BudgetSettings budget;
    WarmSettings warm;
    DemoteSettings demote;
    OwnershipSettings ownership;
    CopySettings copy;
    SourceSettings sources;
    GlobalSettings global_settings;

    std::vector<std::string> sidecar_extensions;
    std::vector<std::string> media_extensions;
    std::vector<std::filesystem::path> library_roots;

    std::size_t max_items = Constants::DEFAULT_MAX_ITEMS;
    bool dry_run          = false;

    bool IsValid() const;
};

//------------------------------------------------------------------------------//
// Implementation of Enum / Logging Conversion Functions
//------------------------------------------------------------------------------//

inline std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str)
{
    if (level_str == "trace") {
        return spdlog::level::trace;
    }
    if (level_str == "debug") {
        return spdlog::level::debug;
    }
    if (level_str == "info") {
        return spdlog::level::info;
    }
    if (level_str == "warn") {
        return spdlog::level::warn;
    }
    if (level_str == "error") {
        return spdlog::level::err;
    }
    if (level_str == "fatal" || level_str == "critical") {
        return spdlog::level::critical;
    }
    if (level_str == "off") {
        return spdlog::level::off;
    }
    return std::nullopt;
}

inline std::optional<CopyMethod> StringToCopyMethod(const std::string &method_str)
{
    if (method_str == "rsync") {
        return CopyMethod::Rsync;
    }
    if (method_str == "native") {
        return CopyMethod::Native;
    }
    return std::nullopt;
}

inline const char *CopyMethodToString(CopyMethod method)
{
    switch (method) {
        case CopyMethod::Rsync:
            return "rsync";
        case CopyMethod::Native:
            return "native";
        default:
            return "unknown";
    }
}

//------------------------------------------------------------------------------//
// Implementation of Configuration Structs Functions
//------------------------------------------------------------------------------//

namespace detail
{
inline bool IsSameOrNested(const std::filesystem::path &outer, const std::filesystem::path &inner)
{
    auto rel = inner.lexically_normal().lexically_relative(outer.lexically_normal());
    return !rel.empty() && *rel.begin() != "..";
}
}  // namespace detail

inline bool NodeConfig::IsValid() const
{
    if (array_root.empty() || cache_root.empty()) {
        spdlog::error("Both 'array_root' and 'cache_root' must be set.");
        return false;
    }
    if (!array_root.is_absolute() || !cache_root.is_absolute()) {
        spdlog::error(
            "Roots must be absolute paths (array='{}', cache='{}').", array_root.string(),
            cache_root.string()
        );
        return false;
    }
    if (detail::IsSameOrNested(array_root, cache_root) ||
        detail::IsSameOrNested(cache_root, array_root)) {
        spdlog::error(
            "Array root '{}' and cache root '{}' must be distinct, non-nested directories.",
            array_root.string(), cache_root.string()
        );
        return false;
    }
    if (share_root.has_value() && !share_root->is_absolute()) {
        spdlog::error("'share_root' must be an absolute path: {}", share_root->string());
        return false;
    }
    for (const auto &rule : path_map) {
        if (rule.prefix.empty() || rule.replacement.empty()) {
            spdlog::error("Path map rules need a non-empty prefix and replacement.");
            return false;
        }
        if (rule.prefix.find_first_not_of('/') == std::string::npos) {
            spdlog::error("Path map prefix '{}' must name a directory below '/'.", rule.prefix);
            return false;
        }
    }
    for (const auto &root : library_roots) {
        if (root.is_absolute() && !detail::IsSameOrNested(cache_root, root)) {
            spdlog::error(
                "Library root '{}' is not inside cache root '{}'.", root.string(),
                cache_root.string()
            );
            return false;
        }
    }
    if (sidecar_extensions.empty() && (warm.sidecars || demote.sidecars)) {
        spdlog::warn("Sidecar handling is enabled but no sidecar extensions are configured.");
    }
    return true;
}

}  // namespace WarmCache::Config

#endif  // WARMCACHE_SRC_CONFIG_CONFIG_TYPES_HPP_
