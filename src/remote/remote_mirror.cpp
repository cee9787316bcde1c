#include "remote/remote_mirror.hpp"

#include "app_constants.hpp"

#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace BuildCacheS3::Remote
{

namespace
{

Metrics::Duration ElapsedSince(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<Metrics::Duration>(std::chrono::steady_clock::now() - start);
}

}  // namespace

RemoteMirror::RemoteMirror(std::shared_ptr<IObjectStore> store, std::string prefix)
    : store_(std::move(store)), prefix_(std::move(prefix))
{
    if (!store_) {
        throw std::invalid_argument("RemoteMirror requires an object store.");
    }
}

std::string RemoteMirror::ObjectKey(const std::string& action_id) const
{
    return prefix_ + "/" + action_id;
}

StorageResult<void> RemoteMirror::Put(
    const std::string& action_id, const std::string& output_id, std::uint64_t size,
    std::shared_ptr<std::iostream> body
)
{
    counters_.IncrementPuts();
    // Some transports need a concrete, measurable payload even when empty.
    if (size == 0 || !body) {
        body = std::make_shared<std::stringstream>();
    }
    spdlog::debug("s3: put actionID={} outputID={} size={}", action_id, output_id, size);

    const ObjectMetadata metadata{
        {std::string(Constants::OUTPUT_ID_METADATA_KEY), output_id}
    };
    const auto key     = ObjectKey(action_id);
    const auto start   = std::chrono::steady_clock::now();
    auto res           = store_->PutObject(key, std::move(body), size, metadata);
    const auto elapsed = ElapsedSince(start);
    if (!res) {
        counters_.IncrementPutErrors();
        return std::unexpected(res.error());
    }
    counters_.AddPutTransfer(size, elapsed);
    return {};
}

StorageResult<std::optional<RemoteEntry>> RemoteMirror::Get(const std::string& action_id)
{
    spdlog::debug("s3: get actionID={}", action_id);
    counters_.IncrementGets();

    const auto key     = ObjectKey(action_id);
    const auto start   = std::chrono::steady_clock::now();
    auto res           = store_->GetObject(key);
    const auto elapsed = ElapsedSince(start);

    if (!res) {
        counters_.IncrementGetErrors();
        spdlog::error("s3: unexpected get failure for {}: {}", key, res.error().message());
        return std::unexpected(res.error());
    }
    if (!res->has_value()) {
        counters_.IncrementMisses();
        return std::nullopt;
    }

    RemoteObject& object = **res;
    auto it              = object.metadata.find(std::string(Constants::OUTPUT_ID_METADATA_KEY));
    if (it == object.metadata.end() || it->second.empty()) {
        counters_.IncrementGetErrors();
        spdlog::error("s3: object {} has no {} metadata", key, Constants::OUTPUT_ID_METADATA_KEY);
        return std::unexpected(Storage::make_error_code(Storage::StorageErrc::MissingOutputId));
    }

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    if (millis > 0) {
        spdlog::debug(
            "s3: bytes per ms: {} bytes / {} ms = {} B/ms", object.content_length, millis,
            object.content_length / static_cast<std::uint64_t>(millis)
        );
    }
    counters_.AddGetTransfer(object.content_length, elapsed);
    counters_.IncrementHits();
    return RemoteEntry{it->second, object.content_length, std::move(object.body)};
}

}  // namespace BuildCacheS3::Remote
