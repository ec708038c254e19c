#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <system_error>
#include <unordered_map>
#include "config_types.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <limits>

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

#define TRY_ASSIGN_REQUIRED(target, json_obj, key, type)                            \
    try {                                                                           \
        if (!json_obj.contains(key)) {                                              \
            spdlog::error("Missing required JSON key: '{}'", key);                  \
            return std::unexpected(LoadError::ValidationError);                     \
        }                                                                           \
        target = json_obj.at(key).get<type>();                                      \
    } catch (const nlohmann::json::exception &e) {                                  \
        spdlog::error("JSON parse error for required key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                          \
    }

namespace WarmCache::Config
{

namespace
{

// Accepts either a byte count or a size string for a budget key.
std::expected<std::optional<std::uint64_t>, LoadError> ParseSizeField(
    const nlohmann::json &obj, const char *key
)
{
    if (!obj.contains(key)) {
        return std::nullopt;
    }
    const auto &value = obj.at(key);
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    if (value.is_string()) {
        auto parsed = ParseSizeStringToBytes(value.get<std::string>());
        if (!parsed) {
            spdlog::error("Invalid size string for '{}': '{}'", key, value.get<std::string>());
            return std::unexpected(LoadError::ValidationError);
        }
        return parsed;
    }
    spdlog::error("'{}' must be a non-negative number of bytes or a size string.", key);
    return std::unexpected(LoadError::ValidationError);
}

std::optional<mode_t> ParseOctalMode(const std::string &mode_str)
{
    unsigned int mode = 0;
    auto res = std::from_chars(mode_str.data(), mode_str.data() + mode_str.size(), mode, 8);
    if (res.ec != std::errc() || res.ptr != mode_str.data() + mode_str.size() || mode > 07777) {
        return std::nullopt;
    }
    return static_cast<mode_t>(mode);
}

std::string NormalizeExtension(std::string ext)
{
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext;
}

template <std::size_t N>
std::vector<std::string> ToStrings(const std::array<std::string_view, N> &defaults)
{
    return {defaults.begin(), defaults.end()};
}

}  // namespace

std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str)
{
    if (size_str.empty()) {
        return std::nullopt;
    }

    std::string num_part;
    std::string unit_part;

    size_t i = 0;
    while (i < size_str.length() && std::isdigit(static_cast<unsigned char>(size_str[i]))) {
        num_part += size_str[i];
        i++;
    }

    // Allow optional space between number and unit
    while (i < size_str.length() && std::isspace(static_cast<unsigned char>(size_str[i]))) {
        i++;
    }

    while (i < size_str.length() && std::isalpha(static_cast<unsigned char>(size_str[i]))) {
        unit_part += size_str[i];
        i++;
    }

    if (i < size_str.length()) {
        spdlog::warn("Invalid characters found after unit in size string: '{}'", size_str);
        return std::nullopt;
    }

    if (num_part.empty()) {
        spdlog::warn("No numeric part in size string: '{}'", size_str);
        return std::nullopt;
    }

    uint64_t value;
    auto conv_res = std::from_chars(num_part.data(), num_part.data() + num_part.length(), value);
    if (conv_res.ec != std::errc() || conv_res.ptr != num_part.data() + num_part.length()) {
        spdlog::warn("Failed to parse numeric part '{}' of size string: '{}'", num_part, size_str);
        return std::nullopt;
    }

    if (unit_part.empty()) {  // Assume bytes if no unit
        return value;
    }

    std::ranges::transform(unit_part, unit_part.begin(), [](unsigned char c) {
        return std::tolower(c);
    });

    static const std::unordered_map<std::string, uint64_t> unit_multipliers = {
        {  "b",                                     1},
        { "kb",                               1024ULL},
        {  "k",                               1024ULL},
        {"kib",                               1024ULL},
        { "mb",                     1024ULL * 1024ULL},
        {  "m",                     1024ULL * 1024ULL},
        {"mib",                     1024ULL * 1024ULL},
        { "gb",           1024ULL * 1024ULL * 1024ULL},
        {  "g",           1024ULL * 1024ULL * 1024ULL},
        {"gib",           1024ULL * 1024ULL * 1024ULL},
        { "tb", 1024ULL * 1024ULL * 1024ULL * 1024ULL},
        {  "t", 1024ULL * 1024ULL * 1024ULL * 1024ULL},
        {"tib", 1024ULL * 1024ULL * 1024ULL * 1024ULL}
    };
    auto it = unit_multipliers.find(unit_part);
    if (it == unit_multipliers.end()) {
        spdlog::warn("Unknown size unit '{}' in string '{}'", unit_part, size_str);
        return std::nullopt;
    }
    if (value > std::numeric_limits<uint64_t>::max() / it->second) {
        spdlog::warn("Size string '{}' does not fit in 64 bits", size_str);
        return std::nullopt;
    }
    return value * it->second;
}

std::vector<PathMapRule> ParsePathMapString(const std::string &map_str)
{
    std::vector<PathMapRule> rules;
    std::size_t start = 0;
    while (start <= map_str.size()) {
        auto end = map_str.find(',', start);
        if (end == std::string::npos) {
            end = map_str.size();
        }
        std::string pair = map_str.substr(start, end - start);
        start            = end + 1;

        auto first = pair.find_first_not_of(" \t");
        auto last  = pair.find_last_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        pair     = pair.substr(first, last - first + 1);
        auto sep = pair.find('=');
        if (sep == std::string::npos) {
            spdlog::warn("Ignoring path map entry without '=': '{}'", pair);
            continue;
        }
        PathMapRule rule{pair.substr(0, sep), pair.substr(sep + 1)};
        if (rule.prefix.empty() || rule.replacement.empty()) {
            spdlog::warn("Ignoring incomplete path map entry: '{}'", pair);
            continue;
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

LoadResult loadConfigFromJson(const nlohmann::json &j)
{
    if (!j.is_object()) {
        spdlog::error("Configuration root must be a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    NodeConfig config;

    // Roots
    {
        std::string array_root_str;
        std::string cache_root_str;
        TRY_ASSIGN_REQUIRED(array_root_str, j, "array_root", std::string);
        TRY_ASSIGN_REQUIRED(cache_root_str, j, "cache_root", std::string);
        config.array_root = std::filesystem::path(array_root_str).lexically_normal();
        config.cache_root = std::filesystem::path(cache_root_str).lexically_normal();

        std::string share_root_str;
        TRY_ASSIGN(share_root_str, j, "share_root", std::string);
        if (!share_root_str.empty()) {
            config.share_root = std::filesystem::path(share_root_str).lexically_normal();
        }
    }

    // Path translation rules
    if (j.contains("path_map")) {
        const auto &pm = j.at("path_map");
        if (pm.is_string()) {
            config.path_map = ParsePathMapString(pm.get<std::string>());
        } else if (pm.is_array()) {
            for (const auto &item : pm) {
                if (!item.is_object()) {
                    spdlog::error("Item in 'path_map' array is not an object.");
                    return std::unexpected(LoadError::ValidationError);
                }
                PathMapRule rule;
                TRY_ASSIGN_REQUIRED(rule.prefix, item, "prefix", std::string);
                TRY_ASSIGN_REQUIRED(rule.replacement, item, "replacement", std::string);
                config.path_map.push_back(std::move(rule));
            }
        } else {
            spdlog::error("'path_map' must be an array or a 'prefix=replacement,...' string.");
            return std::unexpected(LoadError::ValidationError);
        }
    }
    spdlog::info(
        "Parsed roots: array='{}', cache='{}', share='{}', {} path map rule(s)",
        config.array_root.string(), config.cache_root.string(),
        config.share_root ? config.share_root->string() : "-", config.path_map.size()
    );

    if (j.contains("budget")) {
        const auto &b = j.at("budget");
        if (!b.is_object()) {
            spdlog::error("'budget' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        auto reserve = ParseSizeField(b, "reserve");
        if (!reserve) {
            return std::unexpected(reserve.error());
        }
        if (reserve->has_value()) {
            config.budget.reserve_bytes = **reserve;
        }
        auto min_free = ParseSizeField(b, "min_free");
        if (!min_free) {
            return std::unexpected(min_free.error());
        }
        if (min_free->has_value()) {
            config.budget.min_free_bytes = **min_free;
        }
        TRY_ASSIGN(config.budget.trim_plan, b, "trim_plan", bool);
    }
    spdlog::info(
        "Budget settings: reserve={} bytes, min_free={} bytes, trim_plan={}",
        config.budget.reserve_bytes, config.budget.min_free_bytes, config.budget.trim_plan
    );

    if (j.contains("warm")) {
        const auto &w = j.at("warm");
        if (!w.is_object()) {
            spdlog::error("'warm' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.warm.move, w, "move", bool);
        TRY_ASSIGN(config.warm.sidecars, w, "sidecars", bool);
        TRY_ASSIGN(config.warm.skip_in_use, w, "skip_in_use", bool);
    }

    if (j.contains("demote")) {
        const auto &d = j.at("demote");
        if (!d.is_object()) {
            spdlog::error("'demote' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.demote.enabled, d, "enabled", bool);
        TRY_ASSIGN(config.demote.sidecars, d, "sidecars", bool);
    }

    if (j.contains("ownership")) {
        const auto &o = j.at("ownership");
        if (!o.is_object()) {
            spdlog::error("'ownership' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        if (o.contains("uid")) {
            uid_t uid = 0;
            TRY_ASSIGN(uid, o, "uid", uid_t);
            config.ownership.uid = uid;
        }
        if (o.contains("gid")) {
            gid_t gid = 0;
            TRY_ASSIGN(gid, o, "gid", gid_t);
            config.ownership.gid = gid;
        }
        std::string mode_str;
        TRY_ASSIGN(mode_str, o, "dir_mode", std::string);
        if (!mode_str.empty()) {
            auto mode = ParseOctalMode(mode_str);
            if (!mode) {
                spdlog::error("Invalid octal 'dir_mode': '{}'", mode_str);
                return std::unexpected(LoadError::ValidationError);
            }
            config.ownership.dir_mode = *mode;
        }
    }

    if (j.contains("copy")) {
        const auto &c = j.at("copy");
        if (!c.is_object()) {
            spdlog::error("'copy' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string method_str = CopyMethodToString(config.copy.method);
        TRY_ASSIGN(method_str, c, "method", std::string);
        auto method = StringToCopyMethod(method_str);
        if (!method) {
            spdlog::error("Invalid copy 'method' value: {}", method_str);
            return std::unexpected(LoadError::ValidationError);
        }
        config.copy.method = *method;
        TRY_ASSIGN(config.copy.rsync_path, c, "rsync_path", std::string);
        TRY_ASSIGN(config.copy.extra_args, c, "extra_args", std::vector<std::string>);
    }
    spdlog::info(
        "Copy settings: method='{}', rsync='{}', {} extra arg(s)",
        CopyMethodToString(config.copy.method), config.copy.rsync_path,
        config.copy.extra_args.size()
    );

    if (j.contains("sources")) {
        const auto &s = j.at("sources");
        if (!s.is_object()) {
            spdlog::error("'sources' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        try {
            if (s.contains("warm_command")) {
                config.sources.warm_command = s.at("warm_command").get<std::string>();
            }
            if (s.contains("warm_list")) {
                config.sources.warm_list = s.at("warm_list").get<std::string>();
            }
            if (s.contains("demote_command")) {
                config.sources.demote_command = s.at("demote_command").get<std::string>();
            }
            if (s.contains("demote_list")) {
                config.sources.demote_list = s.at("demote_list").get<std::string>();
            }
            if (s.contains("in_use_command")) {
                config.sources.in_use_command = s.at("in_use_command").get<std::string>();
            }
            if (s.contains("in_use_list")) {
                config.sources.in_use_list = s.at("in_use_list").get<std::string>();
            }
        } catch (const nlohmann::json::exception &e) {
            spdlog::error("JSON parse error within 'sources': {}", e.what());
            return std::unexpected(LoadError::JsonParseError);
        }
    }

    config.sidecar_extensions = ToStrings(Constants::DEFAULT_SIDECAR_EXTENSIONS);
    config.media_extensions   = ToStrings(Constants::DEFAULT_MEDIA_EXTENSIONS);
    TRY_ASSIGN(config.sidecar_extensions, j, "sidecar_extensions", std::vector<std::string>);
    TRY_ASSIGN(config.media_extensions, j, "media_extensions", std::vector<std::string>);
    std::ranges::transform(
        config.sidecar_extensions, config.sidecar_extensions.begin(), NormalizeExtension
    );
    std::ranges::transform(
        config.media_extensions, config.media_extensions.begin(), NormalizeExtension
    );

    {
        std::vector<std::string> roots;
        TRY_ASSIGN(roots, j, "library_roots", std::vector<std::string>);
        for (const auto &root : roots) {
            std::filesystem::path p(root);
            config.library_roots.push_back(
                p.is_absolute() ? p.lexically_normal() : (config.cache_root / p).lexically_normal()
            );
        }
    }

    TRY_ASSIGN(config.max_items, j, "max_items", std::size_t);
    TRY_ASSIGN(config.dry_run, j, "dry_run", bool);

    if (j.contains("global_settings")) {
        const auto &gs = j.at("global_settings");
        if (!gs.is_object()) {
            spdlog::error("'global_settings' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::string log_level_str;
        TRY_ASSIGN(log_level_str, gs, "log_level", std::string);
        if (!log_level_str.empty()) {
            auto level_opt = StringToLogLevel(log_level_str);
            if (!level_opt) {
                spdlog::error(
                    "Invalid 'log_level' value: {}. Using default '{}'.", log_level_str,
                    spdlog::level::to_string_view(config.global_settings.log_level)
                );
            } else {
                config.global_settings.log_level = *level_opt;
            }
        }
        std::string log_file_str;
        TRY_ASSIGN(log_file_str, gs, "log_file", std::string);
        if (!log_file_str.empty()) {
            config.global_settings.log_file = log_file_str;
        }
        std::string lock_file_str;
        TRY_ASSIGN(lock_file_str, gs, "lock_file", std::string);
        if (!lock_file_str.empty()) {
            config.global_settings.lock_file = lock_file_str;
        }
    }
    spdlog::info(
        "Global settings: log_level='{}', log_file='{}', lock_file='{}'",
        spdlog::level::to_string_view(config.global_settings.log_level),
        config.global_settings.log_file ? config.global_settings.log_file->string() : "-",
        config.global_settings.lock_file.string()
    );

    if (!config.IsValid()) {
        spdlog::error("Overall configuration is invalid after parsing.");
        return std::unexpected(LoadError::ValidationError);
    }

    spdlog::info(
        "Configuration loaded: warm(move={}, sidecars={}, skip_in_use={}), demote(enabled={}, "
        "sidecars={}), dry_run={}, max_items={}",
        config.warm.move, config.warm.sidecars, config.warm.skip_in_use, config.demote.enabled,
        config.demote.sidecars, config.dry_run, config.max_items
    );
    return config;
}

LoadResult loadConfigFromFile(const std::filesystem::path &file_path)
{
    spdlog::info("Attempting to load configuration from: {}", file_path.string());

    std::ifstream config_stream(file_path);
    if (!config_stream.is_open()) {
        spdlog::error("Failed to open config file: {}", file_path.string());
        return std::unexpected(LoadError::FileNotFound);
    }

    nlohmann::json j;
    try {
        config_stream >> j;
    } catch (const nlohmann::json::parse_error &e) {
        spdlog::error("Failed to parse JSON config file: {}", e.what());
        return std::unexpected(LoadError::JsonParseError);
    }

    return loadConfigFromJson(j);
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path)
{
    auto result = loadConfigFromFile(file_path);
    if (result.has_value()) {
        return result.value();
    } else {
        std::string error_message = "Failed to load config (" + file_path.string() + "): ";
        switch (result.error()) {
            case LoadError::FileNotFound:
                error_message += "File not found.";
                break;
            case LoadError::JsonParseError:
                error_message += "JSON parsing failed.";
                break;
            case LoadError::ValidationError:
                error_message += "Configuration validation failed.";
                break;
            default:
                error_message += "Unknown error.";
                break;
        }
        return std::unexpected(error_message);
    }
}

}  // namespace WarmCache::Config
