#ifndef WARMCACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
#define WARMCACHE_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace WarmCache::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<NodeConfig, LoadError>;
using LoadErrorMsg = std::expected<NodeConfig, std::string>;

// Parses a size string (e.g., "500MB", "2GB", "1024") into bytes.
std::optional<std::uint64_t> ParseSizeStringToBytes(const std::string &size_str);

// Parses the legacy "prefix=replacement,prefix=replacement" path map form.
std::vector<PathMapRule> ParsePathMapString(const std::string &map_str);

LoadResult loadConfigFromJson(const nlohmann::json &j);
LoadResult loadConfigFromFile(const std::filesystem::path &file_path);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path);

}  // namespace WarmCache::Config

#endif  // WARMCACHE_SRC_CONFIG_CONFIG_LOADER_HPP_
