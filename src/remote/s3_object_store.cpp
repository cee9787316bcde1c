#include "remote/s3_object_store.hpp"

#include "remote/not_found_classifier.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace BuildCacheS3::Remote
{

namespace
{

Aws::Utils::Logging::LogLevel ToAwsLogLevel(spdlog::level::level_enum level)
{
    // SDK internals are only interesting when tracing.
    if (level <= spdlog::level::trace) {
        return Aws::Utils::Logging::LogLevel::Debug;
    }
    if (level <= spdlog::level::debug) {
        return Aws::Utils::Logging::LogLevel::Warn;
    }
    return Aws::Utils::Logging::LogLevel::Error;
}

std::string_view AsView(const Aws::String& s) { return {s.c_str(), s.size()}; }

std::error_code MapS3Error(const Aws::S3::S3Error& error)
{
    switch (error.GetErrorType()) {
        case Aws::S3::S3Errors::ACCESS_DENIED:
            return Storage::make_error_code(Storage::StorageErrc::PermissionDenied);
        case Aws::S3::S3Errors::NETWORK_CONNECTION:
        case Aws::S3::S3Errors::SERVICE_UNAVAILABLE:
        case Aws::S3::S3Errors::REQUEST_TIMEOUT:
            return Storage::make_error_code(Storage::StorageErrc::RemoteUnavailable);
        default:
            return Storage::make_error_code(Storage::StorageErrc::RemoteError);
    }
}

}  // namespace

//------------------------------------------------------------------------------//
// AwsSdkSession
//------------------------------------------------------------------------------//

struct AwsSdkSession::Options {
    Aws::SDKOptions sdk_options;
};

AwsSdkSession::AwsSdkSession(spdlog::level::level_enum log_level)
    : options_(std::make_unique<Options>())
{
    options_->sdk_options.loggingOptions.logLevel = ToAwsLogLevel(log_level);
    Aws::InitAPI(options_->sdk_options);
    spdlog::debug("AWS SDK initialized");
}

AwsSdkSession::~AwsSdkSession()
{
    Aws::ShutdownAPI(options_->sdk_options);
}

//------------------------------------------------------------------------------//
// S3ObjectStore
//------------------------------------------------------------------------------//

S3ObjectStore::S3ObjectStore(const Config::RemoteSettings& settings) : bucket_(settings.bucket)
{
    if (bucket_.empty()) {
        throw std::invalid_argument("S3ObjectStore requires a bucket name.");
    }

    Aws::Client::ClientConfiguration config;
    if (!settings.region.empty()) {
        config.region = settings.region.c_str();
    }
    if (!settings.endpoint.empty()) {
        config.endpointOverride = settings.endpoint.c_str();
    }

    client_ = std::make_unique<Aws::S3::S3Client>(
        config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, !settings.path_style
    );

    spdlog::info(
        "S3 client config: bucket={} region={} endpoint={} path_style={}", bucket_,
        config.region.empty() ? "unset" : AsView(config.region),
        config.endpointOverride.empty() ? "unset" : AsView(config.endpointOverride),
        settings.path_style
    );
}

S3ObjectStore::~S3ObjectStore() = default;

StorageResult<void> S3ObjectStore::PutObject(
    const std::string& key, std::shared_ptr<std::iostream> body, std::uint64_t content_length,
    const ObjectMetadata& metadata
)
{
    Aws::S3::Model::PutObjectRequest request;
    request.SetBucket(bucket_.c_str());
    request.SetKey(key.c_str());
    request.SetContentLength(static_cast<long long>(content_length));
    request.SetBody(body);
    for (const auto& [name, value] : metadata) {
        request.AddMetadata(name.c_str(), value.c_str());
    }

    auto outcome = client_->PutObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        spdlog::debug(
            "s3: put {} failed: {} {}", key, AsView(error.GetExceptionName()),
            AsView(error.GetMessage())
        );
        return std::unexpected(MapS3Error(error));
    }
    return {};
}

StorageResult<std::optional<RemoteObject>> S3ObjectStore::GetObject(const std::string& key)
{
    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(bucket_.c_str());
    request.SetKey(key.c_str());

    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) {
        const auto& error = outcome.GetError();
        if (error.GetErrorType() == Aws::S3::S3Errors::NO_SUCH_KEY ||
            IsObjectNotFound(AsView(error.GetExceptionName()), AsView(error.GetMessage()))) {
            return std::nullopt;
        }
        spdlog::error(
            "s3: get {} failed: {} {}", key, AsView(error.GetExceptionName()),
            AsView(error.GetMessage())
        );
        return std::unexpected(MapS3Error(error));
    }

    // The body stream lives inside the result; keep the result alive with it.
    auto result =
        std::make_shared<Aws::S3::Model::GetObjectResult>(outcome.GetResultWithOwnership());

    RemoteObject object;
    object.content_length = static_cast<std::uint64_t>(std::max(0LL, result->GetContentLength()));
    for (const auto& [name, value] : result->GetMetadata()) {
        object.metadata.emplace(std::string(AsView(name)), std::string(AsView(value)));
    }
    object.body = std::shared_ptr<std::istream>(result, &result->GetBody());
    return object;
}

std::string S3ObjectStore::Describe() const { return "s3://" + bucket_; }

}  // namespace BuildCacheS3::Remote
