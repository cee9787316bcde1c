#ifndef BUILDCACHES3_SRC_CONFIG_CONFIG_LOADER_HPP_
#define BUILDCACHES3_SRC_CONFIG_CONFIG_LOADER_HPP_

#include "config/config_types.hpp"

#include <expected>
#include <filesystem>
#include <string>

namespace BuildCacheS3::Config
{

//------------------------------------------------------------------------------//
// Error Handling for Configuration Loading
//------------------------------------------------------------------------------//

enum class LoadError {
    FileNotFound,
    JsonParseError,
    ValidationError,
};

using LoadResult   = std::expected<AppConfig, LoadError>;
using LoadErrorMsg = std::expected<AppConfig, std::string>;

// Reads a JSON config file on top of `base`. Keys missing from the file keep
// the value from `base`. The result is not validated as a whole, since flags
// and the environment may still fill in the bucket.
LoadResult loadConfigFromFile(const std::filesystem::path &file_path, AppConfig base);
LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path, AppConfig base);

// Applies BUILDCACHES3_BUCKET if it is set and non-empty.
void ApplyEnvironment(AppConfig &config);

}  // namespace BuildCacheS3::Config

#endif  // BUILDCACHES3_SRC_CONFIG_CONFIG_LOADER_HPP_
