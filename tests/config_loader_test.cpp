#include "config/config_loader.hpp"

#include "temp_directory.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <fstream>
#include <string>

namespace BuildCacheS3::Config
{

class ConfigLoaderTest : public ::testing::Test
{
    protected:
    std::filesystem::path WriteConfig(const std::string& contents)
    {
        const auto path = temp_.Path() / "config.json";
        std::ofstream out(path, std::ios::trunc);
        out << contents;
        return path;
    }

    static AppConfig Base()
    {
        AppConfig base;
        base.local_cache_dir = "/base/cache";
        return base;
    }

    Testing::TempDirectory temp_;
};

TEST_F(ConfigLoaderTest, LoadsEveryKey)
{
    const auto path = WriteConfig(R"({
        "log_level": "debug",
        "local_cache_dir": "/var/cache/build",
        "metrics_csv": "/tmp/metrics.csv",
        "remote": {
            "bucket": "builds",
            "prefix": "team/go",
            "region": "eu-west-1",
            "endpoint": "http://localhost:9000",
            "path_style": true
        },
        "replication": { "queue_len": 16, "workers": 4 }
    })");

    auto config = loadConfigFromFile(path, Base());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, spdlog::level::debug);
    EXPECT_EQ(config->local_cache_dir, "/var/cache/build");
    EXPECT_EQ(config->metrics_csv, "/tmp/metrics.csv");
    EXPECT_EQ(config->remote.bucket, "builds");
    EXPECT_EQ(config->remote.prefix, "team/go");
    EXPECT_EQ(config->remote.region, "eu-west-1");
    EXPECT_EQ(config->remote.endpoint, "http://localhost:9000");
    EXPECT_TRUE(config->remote.path_style);
    EXPECT_EQ(config->replication.queue_len, 16u);
    EXPECT_EQ(config->replication.workers, 4u);
    EXPECT_TRUE(config->IsValid());
}

TEST_F(ConfigLoaderTest, MissingKeysKeepBaseValues)
{
    const auto path = WriteConfig(R"({"remote": {"bucket": "b"}})");
    auto config     = loadConfigFromFile(path, Base());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->local_cache_dir, "/base/cache");
    EXPECT_EQ(config->remote.bucket, "b");
    EXPECT_EQ(config->remote.prefix, "go-cache");
    EXPECT_EQ(config->replication.queue_len, 0u);
    EXPECT_EQ(config->replication.workers, 1u);
    EXPECT_EQ(config->log_level, spdlog::level::err);
}

TEST_F(ConfigLoaderTest, EmptyObjectIsAccepted)
{
    auto config = loadConfigFromFile(WriteConfig("{}"), Base());
    ASSERT_TRUE(config.has_value());
    // The bucket can still come from the environment or a flag.
    EXPECT_FALSE(config->IsValid());
}

TEST_F(ConfigLoaderTest, MissingFile)
{
    auto config = loadConfigFromFile(temp_.Path() / "absent.json", Base());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), LoadError::FileNotFound);
}

TEST_F(ConfigLoaderTest, MalformedJson)
{
    auto config = loadConfigFromFile(WriteConfig("{\"remote\": "), Base());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), LoadError::JsonParseError);
}

TEST_F(ConfigLoaderTest, WrongTypeIsParseError)
{
    const auto path = WriteConfig(R"({"replication": {"workers": "many"}})");
    auto config     = loadConfigFromFile(path, Base());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error(), LoadError::JsonParseError);
}

TEST_F(ConfigLoaderTest, ValidationErrors)
{
    for (const std::string bad :
         {R"([])", R"({"local_cache_dir": ""})", R"({"remote": "bucket"})",
          R"({"remote": {"prefix": ""}})", R"({"replication": {"queue_len": -1}})",
          R"({"replication": {"workers": 0}})"}) {
        auto config = loadConfigFromFile(WriteConfig(bad), Base());
        ASSERT_FALSE(config.has_value()) << bad;
        EXPECT_EQ(config.error(), LoadError::ValidationError) << bad;
    }
}

TEST_F(ConfigLoaderTest, InvalidLogLevelKeepsPrevious)
{
    auto config = loadConfigFromFile(WriteConfig(R"({"log_level": "chatty"})"), Base());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->log_level, spdlog::level::err);
}

TEST_F(ConfigLoaderTest, VerboseVariantDescribesFailure)
{
    auto config = loadConfigFromFileVerbose(temp_.Path() / "absent.json", Base());
    ASSERT_FALSE(config.has_value());
    EXPECT_NE(config.error().find("File not found."), std::string::npos) << config.error();
}

TEST(ApplyEnvironmentTest, BucketFromEnvironment)
{
    AppConfig config;
    config.remote.bucket = "from-file";

    ::setenv("BUILDCACHES3_BUCKET", "from-env", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.remote.bucket, "from-env");

    ::setenv("BUILDCACHES3_BUCKET", "", 1);
    ApplyEnvironment(config);
    EXPECT_EQ(config.remote.bucket, "from-env");

    ::unsetenv("BUILDCACHES3_BUCKET");
    config.remote.bucket = "kept";
    ApplyEnvironment(config);
    EXPECT_EQ(config.remote.bucket, "kept");
}

TEST(ConfigTypesTest, VerbosityMapsToLogLevel)
{
    EXPECT_EQ(VerbosityToLogLevel(-1), spdlog::level::err);
    EXPECT_EQ(VerbosityToLogLevel(0), spdlog::level::err);
    EXPECT_EQ(VerbosityToLogLevel(1), spdlog::level::warn);
    EXPECT_EQ(VerbosityToLogLevel(2), spdlog::level::info);
    EXPECT_EQ(VerbosityToLogLevel(3), spdlog::level::debug);
    EXPECT_EQ(VerbosityToLogLevel(4), spdlog::level::trace);
    EXPECT_EQ(VerbosityToLogLevel(9), spdlog::level::trace);
}

TEST(ConfigTypesTest, StringToLogLevel)
{
    EXPECT_EQ(StringToLogLevel("info"), spdlog::level::info);
    EXPECT_EQ(StringToLogLevel("fatal"), spdlog::level::critical);
    EXPECT_EQ(StringToLogLevel("loud"), std::nullopt);
}

TEST(ConfigTypesTest, DefaultLocalCacheDirPrefersXdg)
{
    const char* old_xdg          = std::getenv("XDG_CACHE_HOME");
    const char* old_home         = std::getenv("HOME");
    const bool had_xdg           = old_xdg != nullptr;
    const bool had_home          = old_home != nullptr;
    const std::string saved_xdg  = had_xdg ? old_xdg : "";
    const std::string saved_home = had_home ? old_home : "";

    ::setenv("XDG_CACHE_HOME", "/xdg", 1);
    ::setenv("HOME", "/home/u", 1);
    EXPECT_EQ(DefaultLocalCacheDir(), std::filesystem::path("/xdg/buildcache-s3"));

    ::unsetenv("XDG_CACHE_HOME");
    EXPECT_EQ(DefaultLocalCacheDir(), std::filesystem::path("/home/u/.cache/buildcache-s3"));

    ::unsetenv("HOME");
    EXPECT_TRUE(DefaultLocalCacheDir().empty());

    if (had_xdg) {
        ::setenv("XDG_CACHE_HOME", saved_xdg.c_str(), 1);
    }
    if (had_home) {
        ::setenv("HOME", saved_home.c_str(), 1);
    }
}

TEST(ConfigTypesTest, ValidityChecks)
{
    AppConfig config;
    config.local_cache_dir = "/c";
    EXPECT_FALSE(config.IsValid());
    config.remote.bucket = "b";
    EXPECT_TRUE(config.IsValid());
    config.replication.workers = 0;
    EXPECT_FALSE(config.IsValid());
}

}  // namespace BuildCacheS3::Config
