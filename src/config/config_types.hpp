#ifndef BUILDCACHES3_SRC_CONFIG_CONFIG_TYPES_HPP_
#define BUILDCACHES3_SRC_CONFIG_CONFIG_TYPES_HPP_

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace BuildCacheS3::Config
{

//------------------------------------------------------------------------------//
// Logging Conversion Functions
//------------------------------------------------------------------------------//

// Function to convert string to spdlog::level::level_enum
std::optional<spdlog::level::level_enum> StringToLogLevel(const std::string &level_str);

// Maps the -v flag: 0=error, 1=warn, 2=info, 3=debug, 4 and above=trace
spdlog::level::level_enum VerbosityToLogLevel(int verbosity);

//------------------------------------------------------------------------------//
// Structs for Configuration Types
//------------------------------------------------------------------------------//

struct RemoteSettings {
    std::string bucket;
    std::string prefix = std::string(Constants::DEFAULT_S3_PREFIX);
    std::string region;    ///< Empty means the SDK default
    std::string endpoint;  ///< Empty means AWS; set for S3 compatible servers
    bool path_style = false;

    bool IsValid() const { return !bucket.empty() && !prefix.empty(); }
};

struct ReplicationSettings {
    std::size_t queue_len = Constants::DEFAULT_QUEUE_LEN;  ///< 0 makes enqueue a rendezvous
    std::size_t workers   = Constants::DEFAULT_WORKERS;

    bool IsValid() const { return workers >= 1; }
};

struct AppConfig {
    spdlog::level::level_enum log_level = Constants::DEFAULT_LOG_LEVEL;
    std::filesystem::path local_cache_dir;
    std::filesystem::path metrics_csv;  ///< Empty disables the CSV export
    RemoteSettings remote;
    ReplicationSettings replication;

    bool IsValid() const
    {
        return !local_cache_dir.empty() && remote.IsValid() && replication.IsValid();
    }
};

// $XDG_CACHE_HOME/buildcache-s3, falling back to $HOME/.cache/buildcache-s3.
// Empty if neither variable is set.
std::filesystem::path DefaultLocalCacheDir();

// Defaults for every setting, with the local cache directory resolved.
AppConfig DefaultConfig();

//------------------------------------------------------------------------------//
// Implementation of Logging Conversion Functions
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

inline spdlog::level::level_enum VerbosityToLogLevel(int verbosity)
{
    switch (verbosity) {
        case 0:
            return spdlog::level::err;
        case 1:
            return spdlog::level::warn;
        case 2:
            return spdlog::level::info;
        case 3:
            return spdlog::level::debug;
        default:
            return verbosity < 0 ? spdlog::level::err : spdlog::level::trace;
    }
}

//------------------------------------------------------------------------------//
// Implementation of Default Helpers
//------------------------------------------------------------------------------//

inline std::filesystem::path DefaultLocalCacheDir()
{
    if (const char *xdg = std::getenv("XDG_CACHE_HOME"); xdg != nullptr && *xdg != '\0') {
        return std::filesystem::path(xdg) / Constants::LOCAL_CACHE_DIR_NAME;
    }
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path(home) / ".cache" / Constants::LOCAL_CACHE_DIR_NAME;
    }
    return {};
}

inline AppConfig DefaultConfig()
{
    AppConfig config;
    config.local_cache_dir = DefaultLocalCacheDir();
    return config;
}

}  // namespace BuildCacheS3::Config

#endif  // BUILDCACHES3_SRC_CONFIG_CONFIG_TYPES_HPP_
