#include "config_loader.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include "config_types.hpp"

#define TRY_ASSIGN(target, json_obj, key, type)                            \
    try {                                                                  \
        if (json_obj.contains(key)) {                                      \
            target = json_obj.at(key).get<type>();                         \
        }                                                                  \
    } catch (const nlohmann::json::exception &e) {                         \
        spdlog::error("JSON parse error for key '{}': {}", key, e.what()); \
        return std::unexpected(LoadError::JsonParseError);                 \
    }

namespace BuildCacheS3::Config
{

LoadResult loadConfigFromFile(const std::filesystem::path &file_path, AppConfig base)
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
    if (!j.is_object()) {
        spdlog::error("Config file must contain a JSON object.");
        return std::unexpected(LoadError::ValidationError);
    }

    AppConfig config = std::move(base);

    // Parse Top-Level Keys
    if (j.contains("log_level")) {
        std::string log_level_str;
        TRY_ASSIGN(log_level_str, j, "log_level", std::string);
        auto level_opt = StringToLogLevel(log_level_str);
        if (!level_opt) {
            spdlog::error(
                "Invalid 'log_level' value: {}. Using '{}'.", log_level_str,
                spdlog::level::to_string_view(config.log_level)
            );
        } else {
            config.log_level = *level_opt;
        }
    }

    std::string path_str;
    if (j.contains("local_cache_dir")) {
        TRY_ASSIGN(path_str, j, "local_cache_dir", std::string);
        if (path_str.empty()) {
            spdlog::error("'local_cache_dir' must not be empty.");
            return std::unexpected(LoadError::ValidationError);
        }
        config.local_cache_dir = path_str;
    }
    if (j.contains("metrics_csv")) {
        path_str.clear();
        TRY_ASSIGN(path_str, j, "metrics_csv", std::string);
        config.metrics_csv = path_str;
    }

    if (j.contains("remote")) {
        const auto &remote = j.at("remote");
        if (!remote.is_object()) {
            spdlog::error("'remote' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        TRY_ASSIGN(config.remote.bucket, remote, "bucket", std::string);
        TRY_ASSIGN(config.remote.prefix, remote, "prefix", std::string);
        TRY_ASSIGN(config.remote.region, remote, "region", std::string);
        TRY_ASSIGN(config.remote.endpoint, remote, "endpoint", std::string);
        TRY_ASSIGN(config.remote.path_style, remote, "path_style", bool);
        if (config.remote.prefix.empty()) {
            spdlog::error("'remote.prefix' must not be empty.");
            return std::unexpected(LoadError::ValidationError);
        }
    }
    spdlog::info(
        "Remote settings: bucket='{}', prefix='{}', region='{}', endpoint='{}', path_style={}",
        config.remote.bucket, config.remote.prefix, config.remote.region, config.remote.endpoint,
        config.remote.path_style
    );

    if (j.contains("replication")) {
        const auto &rep = j.at("replication");
        if (!rep.is_object()) {
            spdlog::error("'replication' must be an object.");
            return std::unexpected(LoadError::ValidationError);
        }
        std::int64_t queue_len = static_cast<std::int64_t>(config.replication.queue_len);
        std::int64_t workers   = static_cast<std::int64_t>(config.replication.workers);
        TRY_ASSIGN(queue_len, rep, "queue_len", std::int64_t);
        TRY_ASSIGN(workers, rep, "workers", std::int64_t);
        if (queue_len < 0) {
            spdlog::error("Invalid 'queue_len' value: {} (must not be negative)", queue_len);
            return std::unexpected(LoadError::ValidationError);
        }
        if (workers < 1) {
            spdlog::error("Invalid 'workers' value: {} (must be at least 1)", workers);
            return std::unexpected(LoadError::ValidationError);
        }
        config.replication.queue_len = static_cast<std::size_t>(queue_len);
        config.replication.workers   = static_cast<std::size_t>(workers);
    }
    spdlog::info(
        "Replication settings: queue_len={}, workers={}", config.replication.queue_len,
        config.replication.workers
    );

    spdlog::info("Configuration loaded successfully from: {}", file_path.string());
    return config;
}

LoadErrorMsg loadConfigFromFileVerbose(const std::filesystem::path &file_path, AppConfig base)
{
    auto result = loadConfigFromFile(file_path, std::move(base));
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

void ApplyEnvironment(AppConfig &config)
{
    const std::string env_name(Constants::BUCKET_ENV_VAR);
    if (const char *bucket = std::getenv(env_name.c_str()); bucket != nullptr && *bucket != '\0') {
        spdlog::debug("Bucket taken from {}: {}", env_name, bucket);
        config.remote.bucket = bucket;
    }
}

}  // namespace BuildCacheS3::Config
