#include "app_constants.hpp"
#include "cache/tiered_cache.hpp"
#include "config/config_loader.hpp"
#include "config/config_types.hpp"
#include "protocol/cache_process.hpp"
#include "remote/s3_object_store.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>

namespace
{

void PrintExitStats(
    const BuildCacheS3::Cache::TieredCache &cache, std::chrono::steady_clock::time_point start
)
{
    const auto elapsed = std::chrono::round<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start
    );
    std::cerr << "disk stats: \n" << cache.DiskCounters().Summary() << "\n";
    std::cerr << "s3 stats: \n" << cache.RemoteCounters().Summary() << "\n";
    std::cerr << "total time: " << elapsed.count() << "s" << std::endl;
}

void WriteMetricsCsv(
    const BuildCacheS3::Cache::TieredCache &cache, const std::filesystem::path &csv_path
)
{
    std::ofstream csv(csv_path, std::ios::out | std::ios::trunc);
    if (!csv.is_open()) {
        spdlog::error("failed to create metrics file: {}", csv_path.string());
        return;
    }
    if (auto res = cache.RemoteCounters().WriteCsv(csv, true); !res) {
        spdlog::error(
            "failed to write metrics file {}: {}", csv_path.string(), res.error().message()
        );
    }
}

}  // namespace

int main(int argc, char *argv[])
{
    // Command Line argument parsing
    CLI::App app{std::string(BuildCacheS3::Constants::APP_NAME)};

    std::string config_path_str;
    int verbosity = 0;
    std::string bucket;
    std::string s3_prefix;
    std::string region;
    std::string endpoint;
    bool path_style = false;
    std::string local_cache_dir;
    std::size_t queue_len = 0;
    std::size_t workers   = 0;
    std::string metrics_csv;

    app.add_option("-c,--config", config_path_str, "Path to an optional configuration JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("-v,--verbose", verbosity, "Logging verbosity; 0=error ... 4=trace")
        ->check(CLI::Range(0, 4));
    app.add_option(
        "--bucket", bucket,
        "S3 bucket to use (empty means $" + std::string(BuildCacheS3::Constants::BUCKET_ENV_VAR) +
            ")"
    );
    app.add_option("--s3-prefix", s3_prefix, "Key prefix for cache objects in the bucket");
    app.add_option("--region", region, "AWS region (empty means the SDK default)");
    app.add_option("--endpoint", endpoint, "Endpoint URL of an S3 compatible service");
    app.add_flag("--path-style", path_style, "Use path-style bucket addressing");
    app.add_option("--local-cache-dir", local_cache_dir, "Local cache directory");
    app.add_option(
        "--queue-len", queue_len, "Length of the replication queue (0 = hand off to a worker)"
    );
    app.add_option("--workers", workers, "Number of replication workers")
        ->check(CLI::PositiveNumber);
    app.add_option(
        "--metrics-csv", metrics_csv, "Write S3 get/put metrics to a CSV file (empty = disabled)"
    );

    app.set_version_flag("--version", std::string(BuildCacheS3::Constants::APP_VERSION_STRING));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    // Initialize default logger before config is parsed. stdout carries the protocol.
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(
            std::string(BuildCacheS3::Constants::DEFAULT_CONSOLE_LOG_PATTERN)
        );
        auto main_logger = std::make_shared<spdlog::logger>(
            std::string(BuildCacheS3::Constants::APP_NAME), console_sink
        );
        spdlog::set_default_logger(main_logger);
        spdlog::set_level(BuildCacheS3::Constants::DEFAULT_LOG_LEVEL);
        spdlog::flush_on(BuildCacheS3::Constants::DEFAULT_FLUSH_LEVEL);
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    if (app.count("--verbose") > 0) {
        spdlog::set_level(BuildCacheS3::Config::VerbosityToLogLevel(verbosity));
    }

    // Load Configuration: defaults < file < environment < flags
    BuildCacheS3::Config::AppConfig config = BuildCacheS3::Config::DefaultConfig();
    if (!config_path_str.empty()) {
        auto config_result = BuildCacheS3::Config::loadConfigFromFileVerbose(
            std::filesystem::path(config_path_str), config
        );
        if (!config_result) {
            spdlog::critical("Error loading configuration: {}", config_result.error());
            return EXIT_FAILURE;
        }
        config = std::move(config_result.value());
    }
    BuildCacheS3::Config::ApplyEnvironment(config);

    if (app.count("--verbose") > 0) {
        config.log_level = BuildCacheS3::Config::VerbosityToLogLevel(verbosity);
    }
    if (app.count("--bucket") > 0 && !bucket.empty()) {
        config.remote.bucket = bucket;
    }
    if (app.count("--s3-prefix") > 0) {
        config.remote.prefix = s3_prefix;
    }
    if (app.count("--region") > 0) {
        config.remote.region = region;
    }
    if (app.count("--endpoint") > 0) {
        config.remote.endpoint = endpoint;
    }
    if (app.count("--path-style") > 0) {
        config.remote.path_style = path_style;
    }
    if (app.count("--local-cache-dir") > 0) {
        config.local_cache_dir = local_cache_dir;
    }
    if (app.count("--queue-len") > 0) {
        config.replication.queue_len = queue_len;
    }
    if (app.count("--workers") > 0) {
        config.replication.workers = workers;
    }
    if (app.count("--metrics-csv") > 0) {
        config.metrics_csv = metrics_csv;
    }

    spdlog::set_level(config.log_level);
    spdlog::debug("Log level: {}", spdlog::level::to_string_view(config.log_level));

    if (config.remote.bucket.empty()) {
        spdlog::critical(
            "neither --bucket nor {} environment variable set",
            BuildCacheS3::Constants::BUCKET_ENV_VAR
        );
        return EXIT_FAILURE;
    }
    if (!config.IsValid()) {
        spdlog::critical("Configuration is invalid (local_cache_dir, s3 prefix and workers)");
        return EXIT_FAILURE;
    }

    // Setup Core Components
    spdlog::debug("starting cache");
    BuildCacheS3::Remote::AwsSdkSession aws_session(config.log_level);
    std::unique_ptr<BuildCacheS3::Cache::TieredCache> cache;
    try {
        auto store = std::make_shared<BuildCacheS3::Remote::S3ObjectStore>(config.remote);
        cache      = std::make_unique<BuildCacheS3::Cache::TieredCache>(config, store);
    } catch (const std::exception &e) {
        spdlog::critical("Error initializing components: {}", e.what());
        return EXIT_FAILURE;
    }

    std::stop_source stop_source;
    const auto start = std::chrono::steady_clock::now();
    if (auto res = cache->Start(stop_source.get_token()); !res) {
        spdlog::critical("failed to start cache: {}", res.error().message());
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    {
        BuildCacheS3::Protocol::CacheProcess process(*cache);
        if (auto res = process.Run(std::cin, std::cout); !res) {
            spdlog::error("{}", res.error().message());
            exit_code = EXIT_FAILURE;
        }
    }

    if (config.log_level <= spdlog::level::info) {
        PrintExitStats(*cache, start);
    }
    if (!config.metrics_csv.empty()) {
        WriteMetricsCsv(*cache, config.metrics_csv);
    }

    cache.reset();
    spdlog::shutdown();
    return exit_code;
}
