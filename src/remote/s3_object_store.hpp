#ifndef BUILDCACHES3_SRC_REMOTE_S3_OBJECT_STORE_HPP_
#define BUILDCACHES3_SRC_REMOTE_S3_OBJECT_STORE_HPP_

#include "config/config_types.hpp"
#include "remote/i_object_store.hpp"

#include <spdlog/common.h>
#include <memory>
#include <string>

namespace Aws::S3
{
class S3Client;
}  // namespace Aws::S3

namespace BuildCacheS3::Remote
{

// Initializes the AWS SDK for the lifetime of the object. Exactly one must be
// alive while any S3ObjectStore exists.
class AwsSdkSession
{
    public:
    explicit AwsSdkSession(spdlog::level::level_enum log_level);
    ~AwsSdkSession();

    AwsSdkSession(const AwsSdkSession&)            = delete;
    AwsSdkSession& operator=(const AwsSdkSession&) = delete;

    private:
    struct Options;
    std::unique_ptr<Options> options_;
};

// IObjectStore backed by the AWS SDK S3 client. Credentials come from the
// SDK's default provider chain (environment, profile, instance metadata).
class S3ObjectStore : public IObjectStore
{
    public:
    explicit S3ObjectStore(const Config::RemoteSettings& settings);
    ~S3ObjectStore() override;

    S3ObjectStore(const S3ObjectStore&)            = delete;
    S3ObjectStore& operator=(const S3ObjectStore&) = delete;

    StorageResult<void> PutObject(
        const std::string& key, std::shared_ptr<std::iostream> body, std::uint64_t content_length,
        const ObjectMetadata& metadata
    ) override;

    StorageResult<std::optional<RemoteObject>> GetObject(const std::string& key) override;

    std::string Describe() const override;

    private:
    std::string bucket_;
    std::unique_ptr<Aws::S3::S3Client> client_;
};

}  // namespace BuildCacheS3::Remote

#endif  // BUILDCACHES3_SRC_REMOTE_S3_OBJECT_STORE_HPP_
