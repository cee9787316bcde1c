#ifndef BUILDCACHES3_SRC_APP_CONSTANTS_HPP_
#define BUILDCACHES3_SRC_APP_CONSTANTS_HPP_

#include <spdlog/common.h>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace BuildCacheS3::Constants
{
// Application Info
constexpr std::string_view APP_NAME = "buildcache-s3";
// TODO: Derive from cmake
constexpr std::string_view APP_VERSION_STRING = "buildcache-s3 version 0.1.0";
constexpr std::string_view APP_VERSION_SHORT  = "0.1.0";

// Logging
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL   = spdlog::level::err;
constexpr spdlog::level::level_enum DEFAULT_FLUSH_LEVEL = spdlog::level::warn;
constexpr std::string_view DEFAULT_CONSOLE_LOG_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [ThreadID:%t] [%^%l%$] [%n] %v";

// Environment
constexpr std::string_view BUCKET_ENV_VAR       = "BUILDCACHES3_BUCKET";
constexpr std::string_view LOCAL_CACHE_DIR_NAME = "buildcache-s3";

// Disk tier
constexpr int INDEX_ENTRY_VERSION            = 1;
constexpr std::string_view INDEX_FILE_PREFIX = "a-";
constexpr std::string_view BLOB_FILE_PREFIX  = "o-";

// Remote tier
constexpr std::string_view DEFAULT_S3_PREFIX      = "go-cache";
constexpr std::string_view OUTPUT_ID_METADATA_KEY = "outputid";
constexpr std::string_view PROBE_KEY              = "_probe";

// Replication
constexpr std::size_t DEFAULT_QUEUE_LEN = 0;
constexpr std::size_t DEFAULT_WORKERS   = 1;

// Protocol
constexpr std::size_t DEFAULT_REQUEST_THREADS = 8;

}  // namespace BuildCacheS3::Constants

#endif  // BUILDCACHES3_SRC_APP_CONSTANTS_HPP_
